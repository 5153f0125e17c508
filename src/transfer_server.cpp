#include "transfer_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "broadcast_hub.hpp"
#include "file_storage.hpp"
#include "http_session.hpp"
#include "packaging_engine.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "staging_store.hpp"
#include "transfer_registry.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kProgressPrefix = "/progress/";

int require_range(const std::shared_ptr<SettingsManager>& settings,
                  const std::shared_ptr<Logger>& logger,
                  const std::string& key,
                  int min_value,
                  int max_value) {
  int value = settings->get<int>(key);
  if(value < min_value || value > max_value) {
    logger->error("Invalid {} '{}'", key, value);
    throw std::runtime_error("Invalid " + key);
  }
  return value;
}

} // namespace

TransferServer::TransferServer(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("qrdrop")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

TransferServer::~TransferServer() {
  stop();
}

void TransferServer::configure() {
  listen_ip_ = settings_->get<std::string>("listen_ip");
  listen_port_ = static_cast<uint16_t>(require_range(settings_, logger_, "listen_port", 0, 65535));
  io_thread_count_ = require_range(settings_, logger_, "io_threads", 1, 256);

  const int size_limit_mb = require_range(settings_, logger_, "size_limit_mb", 1, 1 << 20);
  ingest_options_.size_limit = static_cast<std::uint64_t>(size_limit_mb) * kMiB;
  if(!parse_missing_transfer_policy(settings_->get<std::string>("missing_transfer_policy"),
                                    ingest_options_.missing_policy)) {
    logger_->error("Invalid missing_transfer_policy '{}'", settings_->get<std::string>("missing_transfer_policy"));
    throw std::runtime_error("Invalid missing_transfer_policy");
  }
  retention_ = std::chrono::milliseconds(settings_->get<int>("transfer_retention_ms"));

  const auto shards = static_cast<std::size_t>(require_range(settings_, logger_, "registry_shards", 1, 4096));
  registry_ = std::make_shared<TransferRegistry>(shards);
  staging_ = std::make_shared<StagingStore>();

  BroadcastHub::Options hub_options;
  hub_options.active_interval = std::chrono::milliseconds(
    require_range(settings_, logger_, "pump_active_interval_ms", 1, 60000));
  hub_options.idle_interval = std::chrono::milliseconds(
    require_range(settings_, logger_, "pump_idle_interval_ms", 1, 60000));
  hub_options.signal_capacity = static_cast<std::size_t>(
    require_range(settings_, logger_, "signal_capacity", 1, 1 << 16));
  hub_ = std::make_shared<BroadcastHub>(io_, hub_options, logger_);

  PackagingOptions packaging_options;
  packaging_options.compression_level = require_range(settings_, logger_, "compression_level", 0, 9);
  const auto eviction = settings_->get<std::string>("staging_eviction");
  if(eviction != "keep" && eviction != "after_download") {
    logger_->error("Invalid staging_eviction '{}'", eviction);
    throw std::runtime_error("Invalid staging_eviction");
  }
  packaging_options.evict_after_download = (eviction == "after_download");
  packaging_ = std::make_shared<PackagingEngine>(staging_, hub_, packaging_options, logger_);

  std::filesystem::path storage_dir = settings_->get<std::string>("storage_dir");
  if(storage_dir.is_relative()) {
    storage_dir = options_.workspace_root / storage_dir;
  }
  storage_ = std::make_shared<FileStorage>(storage_dir, logger_);

  int worker_count = settings_->get<int>("worker_threads");
  if(worker_count <= 0) {
    worker_count = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  }
  workers_ = std::make_unique<asio::thread_pool>(static_cast<std::size_t>(worker_count));
  packaging_strand_ = std::make_unique<asio::strand<asio::thread_pool::executor_type>>(
    asio::make_strand(workers_->get_executor()));

  auto registry = registry_;
  hub_->set_source(BroadcastClass::Mobile, [registry](){
    return make_transfer_list(registry->snapshot(*reported_device(BroadcastClass::Mobile))).dump();
  });
  hub_->set_source(BroadcastClass::Desktop, [registry](){
    return make_transfer_list(registry->snapshot(*reported_device(BroadcastClass::Desktop))).dump();
  });
  std::weak_ptr<PackagingEngine> packaging = packaging_;
  hub_->set_source(BroadcastClass::Packaging, [packaging](){
    auto engine = packaging.lock();
    return engine ? engine->progress_payload() : make_progress_payload(0);
  });
}

void TransferServer::start() {
  if(started_) return;

  std::error_code dir_ec;
  std::filesystem::create_directories(options_.workspace_root, dir_ec);
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  init(settings_->get<bool>("verbose"));
  configure();

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();

  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }
  started_ = true;
  logger_->info("listening on http://{}:{}", listen_ip_, listen_port_);

  start_accept();

  sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
  if(retention_.count() >= 0) {
    schedule_retention_sweep();
  }
}

void TransferServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else {
        auto session = HttpSession::create(std::move(socket),
          [this](const std::shared_ptr<HttpSession>& s, HttpRequest req){
            handle_request(s, std::move(req));
          },
          logger_);
        session->start();
      }
      if(started_) {
        start_accept();
      }
    });
}

void TransferServer::schedule_retention_sweep() {
  if(!sweep_timer_) return;
  using namespace std::chrono_literals;
  const auto interval = std::clamp<std::chrono::milliseconds>(retention_ / 2, 50ms, 1000ms);
  sweep_timer_->expires_after(interval);
  sweep_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    const auto evicted = registry_->evict_completed(retention_);
    if(evicted > 0) {
      logger_->debug("evicted {} finished transfers", evicted);
      hub_->ping(BroadcastClass::Mobile);
      hub_->ping(BroadcastClass::Desktop);
    }
    schedule_retention_sweep();
  });
}

void TransferServer::run() {
  if(!started_) start();
  for(int i = 1; i < io_thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
  io_.run();
}

void TransferServer::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(int i = 0; i < io_thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
}

void TransferServer::stop() {
  if(!started_.exchange(false)) return;

  if(sweep_timer_) {
    std::error_code ec;
    sweep_timer_->cancel(ec);
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  if(hub_) {
    hub_->shutdown();
  }
  if(workers_) {
    workers_->stop();
    workers_->join();
  }

  io_.stop();
  for(auto& t : io_threads_) {
    if(t.joinable()) t.join();
  }
  io_threads_.clear();
  acceptor_.reset();
  io_.restart();
  logger_->info("stopped");
}

LogListenerHandle TransferServer::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void TransferServer::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void TransferServer::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

TransferServer::Stats TransferServer::stats() const {
  Stats s;
  if(registry_) s.registered_transfers = registry_->size();
  if(staging_) {
    auto snapshot = staging_->snapshot();
    s.staged_files = snapshot.files.size();
    s.staged_bytes = snapshot.total_size;
  }
  if(hub_) s.active_pumps = hub_->active_pumps();
  return s;
}

void TransferServer::handle_request(const std::shared_ptr<HttpSession>& session, HttpRequest req) {
  const std::string& path = req.path;
  const bool get = (req.method == "GET");
  const bool post = (req.method == "POST");

  if(path.compare(0, std::strlen(kProgressPrefix), kProgressPrefix) == 0) {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_progress(session, req);
  }
  if(path == "/upload-desktop" || path == "/upload-mobile" || path == "/upload") {
    if(!post) return session->send_text(405, "method not allowed");
    UploadTarget target = UploadTarget::ByDevice;
    if(path == "/upload-desktop") target = UploadTarget::Staging;
    if(path == "/upload-mobile") target = UploadTarget::Storage;
    return handle_upload(session, req, target);
  }
  if(path == "/download-files-mobile" || path == "/download") {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_download(session);
  }
  if(path == "/download-files-progress-mobile") {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_stream(session, BroadcastClass::Mobile);
  }
  if(path == "/download-files-progress-desktop") {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_stream(session, BroadcastClass::Desktop);
  }
  if(path == "/zipping-progress") {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_stream(session, BroadcastClass::Packaging);
  }
  if(path == "/presence") {
    if(!get) return session->send_text(405, "method not allowed");
    return handle_stream(session, BroadcastClass::Presence);
  }
  session->send_text(404, "not found");
}

void TransferServer::handle_progress(const std::shared_ptr<HttpSession>& session, const HttpRequest& req) {
  auto user_agent = req.header("User-Agent");
  if(!user_agent) {
    session->send_text(400, "request does not contain a user agent");
    return;
  }
  const std::string name = url_decode(std::string_view(req.path).substr(std::strlen(kProgressPrefix)));
  if(name.empty()) {
    session->send_text(404, "not found");
    return;
  }
  const DeviceClass device = classify_user_agent(*user_agent);
  auto receiver = registry_->register_transfer(name, device);
  logger_->info("[{}] {} client watching progress", display_name(name), to_string(device));
  hub_->ping(reporting_class(device));
  session->stream_progress(std::move(receiver));
}

void TransferServer::handle_upload(const std::shared_ptr<HttpSession>& session,
                                   const HttpRequest& req,
                                   UploadTarget target) {
  if(req.chunked()) {
    session->send_text(411, "chunked uploads are not supported, send Content-Length", true);
    return;
  }
  std::optional<std::uint64_t> length;
  if(!parse_content_length(req, length) || !length) {
    session->send_text(411, "Content-Length required", true);
    return;
  }
  const std::string boundary = multipart_boundary(req.header("Content-Type").value_or(""));
  if(boundary.empty()) {
    session->send_text(400, "expected a multipart/form-data body", true);
    return;
  }

  bool to_storage = (target == UploadTarget::Storage);
  if(target == UploadTarget::ByDevice) {
    auto user_agent = req.header("User-Agent");
    to_storage = user_agent && classify_user_agent(*user_agent) == DeviceClass::Mobile;
  }
  logger_->info("{} upload requested ({}), parsing multipart", session->remote_address(),
                to_storage ? "storage" : "staging");

  std::shared_ptr<UploadIngest> ingest;
  try {
    ingest = std::make_shared<UploadIngest>(boundary, registry_, hub_, ingest_options_, logger_);
  } catch(const IngestError& e) {
    reject_upload(session, e);
    return;
  }

  session->read_body(*length,
    [this, session, ingest](const char* data, std::size_t size){
      try {
        ingest->feed(data, size);
        return true;
      } catch(const IngestError& e) {
        reject_upload(session, e);
        return false;
      }
    },
    [this, session, ingest, to_storage](bool complete){
      if(!complete) return;
      try {
        deliver_upload(session, ingest->finish(), to_storage);
      } catch(const IngestError& e) {
        reject_upload(session, e);
      }
    });
}

void TransferServer::reject_upload(const std::shared_ptr<HttpSession>& session, const IngestError& error) {
  logger_->warn("{} upload rejected: {} ({}): {}", session->remote_address(),
                to_string(error.kind()), to_string(error.category()), error.what());
  session->send_text(error.http_status(), error.what(), true);
}

void TransferServer::deliver_upload(const std::shared_ptr<HttpSession>& session, UploadedFile file, bool to_storage) {
  if(!to_storage) {
    StagedFile staged;
    staged.name = file.name;
    staged.display_name = file.display_name;
    staged.size = file.size;
    staged.content = std::move(file.bytes);
    staging_->add(std::move(staged));
    logger_->info("[{}] uploaded", file.display_name);
    session->send_text(200, "");
    return;
  }

  auto shared = std::make_shared<UploadedFile>(std::move(file));
  auto storage = storage_;
  auto logger = logger_;
  asio::post(*workers_, [session, shared, storage, logger](){
    try {
      storage->store(shared->name, shared->bytes);
      session->send_text(200, "");
    } catch(const StorageError& e) {
      logger->error("[{}] {}", shared->display_name, e.what());
      session->send_text(500, std::string("error copying bytes: ") + e.what(), true);
    }
  });
}

void TransferServer::handle_download(const std::shared_ptr<HttpSession>& session) {
  logger_->info("{} download requested, zipping up the staged files", session->remote_address());
  auto packaging = packaging_;
  auto logger = logger_;
  asio::post(*packaging_strand_, [session, packaging, logger](){
    try {
      auto result = packaging->package();
      auto files = std::make_shared<std::vector<StagedFilePtr>>(std::move(result.files));
      session->send_body(200, "application/zip", std::move(result.archive),
        [packaging, files, logger](bool delivered){
          if(delivered) {
            packaging->release(*files);
          } else {
            logger->warn("archive was not delivered, staging left untouched");
          }
        });
    } catch(const PackagingError& e) {
      session->send_text(500, std::string("error zipping up your files: ") + e.what(), true);
    }
  });
}

void TransferServer::handle_stream(const std::shared_ptr<HttpSession>& session, BroadcastClass cls) {
  auto receiver = hub_->subscribe(cls);
  logger_->info("{} subscribed to the {} stream", session->remote_address(), to_string(cls));
  session->stream_snapshots(std::move(receiver));
}
