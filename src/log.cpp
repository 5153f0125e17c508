#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

DefaultSinks g_sinks;
std::once_flag g_sinks_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink_logger(const std::string& name,
                                                 spdlog::sink_ptr sink,
                                                 const char* pattern,
                                                 spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void create_sinks() {
  g_sinks.info = make_sink_logger("qrdrop.info",
                                  std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                  kTimestampPattern, spdlog::level::warn);
  g_sinks.error = make_sink_logger("qrdrop.error",
                                   std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                   kTimestampPattern, spdlog::level::err);
  g_sinks.print = make_sink_logger("qrdrop.print",
                                   std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                   "%v", spdlog::level::info);
  g_sinks.print_err = make_sink_logger("qrdrop.print_err",
                                       std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                       "%v", spdlog::level::err);
}

const DefaultSinks& sinks() {
  std::call_once(g_sinks_once, create_sinks);
  return g_sinks;
}

spdlog::logger* sink_for(LogChannel channel) {
  const auto& s = sinks();
  switch(channel) {
    case LogChannel::Print: return s.print.get();
    case LogChannel::PrintErr: return s.print_err.get();
    case LogChannel::Error: return s.error.get();
    default: return s.info.get();
  }
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(LogChannel channel, spdlog::level::level_enum level, const std::string& message) {
  const std::string prefix = name();
  const std::string label = prefix.empty()
    ? std::string(channel_name(channel))
    : prefix + ":" + channel_name(channel);
  if(dispatch(label, level, message)) return;
  detail::emit_to_default(channel, prefix, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log-listener", spdlog::level::err, e.what());
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  if(!channel_label.empty() && channel_label != channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_label, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
