#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "staging_store.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

class BroadcastHub;

class PackagingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct PackagingOptions {
  int compression_level = 8;
  std::uint64_t large_file_bytes = 4 * kGiB;
  std::size_t large_file_entries = 65536;
  bool evict_after_download = false;
};

// Follows the entry bytes a ZipWriter compresses and reports every 5%
// boundary of `total_size`, ending with 100. Registers itself as the
// writer's read observer for its lifetime.
class ProgressTracker {
public:
  using Reporter = std::function<void(int percent)>;

  ProgressTracker(ZipWriter& writer, std::uint64_t total_size, Reporter reporter);
  ~ProgressTracker();

  ProgressTracker(const ProgressTracker&) = delete;
  ProgressTracker& operator=(const ProgressTracker&) = delete;

  void advance(std::size_t bytes);

  // Reports 100 if it has not been reported yet.
  void complete();

  int progress() const { return progress_percent(written_, total_size_); }
  std::uint64_t written() const { return written_; }

private:
  void report(int percent);

  ZipWriter& writer_;
  std::uint64_t written_ = 0;
  std::uint64_t total_size_ = 0;
  ProgressBuckets buckets_;
  Reporter reporter_;
};

struct PackageResult {
  std::vector<char> archive;
  std::vector<StagedFilePtr> files;
  std::uint64_t total_size = 0;
  bool large_file = false;
};

// Builds a ZIP of the staged files. `package` is synchronous and CPU bound;
// callers run it on a worker pool. Archives are built one at a time, so the
// Packaging class of the hub (whose source reads `progress_payload`) always
// follows a single run from 0 to 100.
class PackagingEngine {
public:
  using ProgressListener = std::function<void(int percent)>;

  PackagingEngine(std::shared_ptr<StagingStore> staging,
                  std::shared_ptr<BroadcastHub> hub,
                  PackagingOptions options,
                  std::shared_ptr<Logger> logger = nullptr);

  // Throws PackagingError.
  PackageResult package();

  // Drops packaged files from staging when eviction after download is
  // enabled. Returns the number of files removed.
  std::size_t release(const std::vector<StagedFilePtr>& files);

  bool needs_large_file(std::uint64_t total_size, std::size_t entries) const;

  // Sees every value published to the Packaging class, in order.
  void set_progress_listener(ProgressListener listener);

  int last_progress() const { return last_progress_.load(); }
  std::string progress_payload() const;
  const PackagingOptions& options() const { return options_; }

private:
  void report(int percent);

  std::shared_ptr<StagingStore> staging_;
  std::shared_ptr<BroadcastHub> hub_;
  PackagingOptions options_;
  std::shared_ptr<Logger> logger_;
  std::atomic<int> last_progress_{0};
  std::mutex run_mutex_;
  std::mutex listener_mutex_;
  ProgressListener listener_;
};
