#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_class.hpp"
#include "watch_channel.hpp"

struct TransferSnapshot {
  std::string name;
  std::uint64_t size = 0;
  int progress = 0;
  DeviceClass device = DeviceClass::Desktop;
};

// Progress of in-flight transfers keyed by name. Keys are spread over
// independently locked shards so unrelated transfers never contend on one
// lock; no operation holds more than one shard lock at a time.
class TransferRegistry {
public:
  using Clock = std::chrono::steady_clock;

  explicit TransferRegistry(std::size_t shard_count = 16);

  // Inserts a fresh record at progress 0, replacing (and closing the stream
  // of) any earlier record with the same key. The receiver observes the
  // per-transfer progress in 5% steps.
  WatchReceiver<int> register_transfer(const std::string& key, DeviceClass device);

  // Stores min(100, floor(bytes_written * 100 / total_size)) and notifies the
  // record's subscriber. Returns the stored percent, or nothing if the key is
  // not registered.
  std::optional<int> update(const std::string& key,
                            std::uint64_t bytes_written,
                            std::uint64_t total_size);

  std::optional<TransferSnapshot> lookup(const std::string& key) const;

  // Records originating from `device`, ordered by name.
  std::vector<TransferSnapshot> snapshot(DeviceClass device) const;
  std::vector<TransferSnapshot> snapshot_all() const;

  bool evict(const std::string& key);

  // Drops records that reached 100 at least `retention` before `now`.
  std::size_t evict_completed(std::chrono::milliseconds retention, Clock::time_point now = Clock::now());

  std::size_t size() const;
  std::size_t shard_count() const { return shards_.size(); }

private:
  struct Record {
    DeviceClass device = DeviceClass::Desktop;
    std::uint64_t total_size = 0;
    int progress = 0;
    WatchSender<int> notifier;
    std::optional<Clock::time_point> completed_at;
  };

  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Record> records;
  };

  Shard& shard_for(const std::string& key) const;
  static TransferSnapshot to_snapshot(const std::string& key, const Record& record);

  std::vector<std::unique_ptr<Shard>> shards_;
};
