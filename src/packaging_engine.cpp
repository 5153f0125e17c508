#include "packaging_engine.hpp"

#include <algorithm>
#include <new>
#include <utility>

#include "broadcast_hub.hpp"
#include "protocol.hpp"

ProgressTracker::ProgressTracker(ZipWriter& writer, std::uint64_t total_size, Reporter reporter)
  : writer_(writer), total_size_(total_size), reporter_(std::move(reporter)) {
  writer_.set_read_observer([this](std::size_t bytes){ advance(bytes); });
}

ProgressTracker::~ProgressTracker() {
  writer_.set_read_observer(nullptr);
}

void ProgressTracker::advance(std::size_t bytes) {
  written_ += bytes;
  report(progress());
}

void ProgressTracker::complete() {
  report(100);
}

void ProgressTracker::report(int percent) {
  if(auto crossed = buckets_.advance(percent)) {
    if(reporter_) reporter_(*crossed);
  }
}

PackagingEngine::PackagingEngine(std::shared_ptr<StagingStore> staging,
                                 std::shared_ptr<BroadcastHub> hub,
                                 PackagingOptions options,
                                 std::shared_ptr<Logger> logger)
  : staging_(std::move(staging)),
    hub_(std::move(hub)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("packaging")) {}

bool PackagingEngine::needs_large_file(std::uint64_t total_size, std::size_t entries) const {
  return total_size > options_.large_file_bytes || entries > options_.large_file_entries;
}

std::string PackagingEngine::progress_payload() const {
  return make_progress_payload(last_progress());
}

void PackagingEngine::set_progress_listener(ProgressListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void PackagingEngine::report(int percent) {
  last_progress_.store(percent);
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listener_) listener_(percent);
  }
  if(hub_) hub_->ping(BroadcastClass::Packaging);
}

PackageResult PackagingEngine::package() {
  std::unique_lock<std::mutex> running(run_mutex_, std::try_to_lock);
  if(!running.owns_lock()) {
    logger_->info("another archive is being built, waiting");
    running.lock();
  }

  PackageResult result;
  {
    // Only the file list is copied; compression runs without the lock.
    auto snapshot = staging_->snapshot();
    result.files = std::move(snapshot.files);
    result.total_size = snapshot.total_size;
  }
  result.large_file = needs_large_file(result.total_size, result.files.size());
  logger_->info("packaging {} files ({} bytes{})", result.files.size(), result.total_size,
                result.large_file ? ", large-file mode" : "");

  report(0);
  try {
    ZipWriter zip(ZipWriter::Options{options_.compression_level});
    ProgressTracker tracker(zip, result.total_size, [this](int percent){ report(percent); });
    for(const auto& file : result.files) {
      zip.add_entry(file->name, file->content.data(), file->content.size());
    }
    result.archive = zip.finish();
    tracker.complete();
  } catch(const ZipError& e) {
    logger_->error("packaging failed: {}", e.what());
    throw PackagingError(e.what());
  } catch(const std::bad_alloc&) {
    logger_->error("packaging failed: out of memory");
    throw PackagingError("out of memory while building the archive");
  } catch(const std::length_error& e) {
    logger_->error("packaging failed: {}", e.what());
    throw PackagingError(e.what());
  }
  logger_->info("archive ready, {} bytes", result.archive.size());
  return result;
}

std::size_t PackagingEngine::release(const std::vector<StagedFilePtr>& files) {
  if(!options_.evict_after_download) return 0;
  const auto removed = staging_->remove(files);
  logger_->info("evicted {} downloaded files from staging", removed);
  return removed;
}
