#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "device_class.hpp"
#include "http.hpp"
#include "log.hpp"
#include "upload_ingest.hpp"

class BroadcastHub;
class FileStorage;
class HttpSession;
class PackagingEngine;
class SettingsManager;
class StagingStore;
class TransferRegistry;

// The file drop service: accepts HTTP connections, wires uploads into the
// registry and staging, streams progress and packages downloads.
class TransferServer {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
  };

  TransferServer(std::shared_ptr<SettingsManager> settings, Options options);
  ~TransferServer();

  void start();
  void run();
  void start_background();
  void stop();

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<TransferRegistry> registry() const { return registry_; }
  std::shared_ptr<StagingStore> staging() const { return staging_; }
  std::shared_ptr<BroadcastHub> hub() const { return hub_; }
  std::shared_ptr<PackagingEngine> packaging() const { return packaging_; }

  struct Stats {
    std::size_t registered_transfers = 0;
    std::size_t staged_files = 0;
    std::uint64_t staged_bytes = 0;
    std::size_t active_pumps = 0;
  };

  Stats stats() const;

  uint16_t listen_port() const { return listen_port_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  using tcp = asio::ip::tcp;

  enum class UploadTarget { Staging, Storage, ByDevice };

  void configure();
  void start_accept();
  void schedule_retention_sweep();

  void handle_request(const std::shared_ptr<HttpSession>& session, HttpRequest req);
  void handle_progress(const std::shared_ptr<HttpSession>& session, const HttpRequest& req);
  void handle_upload(const std::shared_ptr<HttpSession>& session, const HttpRequest& req, UploadTarget target);
  void handle_download(const std::shared_ptr<HttpSession>& session);
  void handle_stream(const std::shared_ptr<HttpSession>& session, BroadcastClass cls);

  void deliver_upload(const std::shared_ptr<HttpSession>& session, UploadedFile file, bool to_storage);
  void reject_upload(const std::shared_ptr<HttpSession>& session, const IngestError& error);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  asio::io_context io_;
  std::vector<std::thread> io_threads_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<TransferRegistry> registry_;
  std::shared_ptr<StagingStore> staging_;
  std::shared_ptr<BroadcastHub> hub_;
  std::shared_ptr<PackagingEngine> packaging_;
  std::shared_ptr<FileStorage> storage_;
  std::unique_ptr<asio::thread_pool> workers_;
  // Downloads queue here so one archive is built at a time without parking
  // a worker thread on the packaging lock.
  std::unique_ptr<asio::strand<asio::thread_pool::executor_type>> packaging_strand_;

  IngestOptions ingest_options_;
  std::chrono::milliseconds retention_{-1};
  std::atomic<bool> started_{false};
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
  int io_thread_count_ = 1;
};
