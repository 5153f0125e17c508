#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

void init(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* channel_name(LogChannel channel);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true from a listener keeps the line away from the default sinks.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void write(LogChannel channel, spdlog::level::level_enum level, const std::string& message);
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex name_mutex_;
  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

namespace detail {
void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     spdlog::level::level_enum level,
                     const std::string& message);

template<typename... Args>
void log_or_fallback(Logger* logger,
                     LogChannel channel,
                     spdlog::level::level_enum level,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    switch(channel) {
      case LogChannel::Info: logger->info(fmt, std::forward<Args>(args)...); return;
      case LogChannel::Warn: logger->warn(fmt, std::forward<Args>(args)...); return;
      case LogChannel::Error: logger->error(fmt, std::forward<Args>(args)...); return;
      case LogChannel::Debug: logger->debug(fmt, std::forward<Args>(args)...); return;
      case LogChannel::Print: logger->print(fmt, std::forward<Args>(args)...); return;
      case LogChannel::PrintErr: logger->print_err(fmt, std::forward<Args>(args)...); return;
    }
  }
  emit_to_default(channel, channel_name(channel), level,
                  fmt::format(fmt, std::forward<Args>(args)...));
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::Info, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::Warn, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::Error, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::Debug, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_or_fallback(logger, LogChannel::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
}
