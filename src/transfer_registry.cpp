#include "transfer_registry.hpp"

#include <algorithm>
#include <functional>

#include "utils.hpp"

TransferRegistry::TransferRegistry(std::size_t shard_count) {
  shard_count = std::max<std::size_t>(1, shard_count);
  shards_.reserve(shard_count);
  for(std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

TransferRegistry::Shard& TransferRegistry::shard_for(const std::string& key) const {
  return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

TransferSnapshot TransferRegistry::to_snapshot(const std::string& key, const Record& record) {
  return TransferSnapshot{key, record.total_size, record.progress, record.device};
}

WatchReceiver<int> TransferRegistry::register_transfer(const std::string& key, DeviceClass device) {
  auto [sender, receiver] = make_watch<int>(0);
  Record record;
  record.device = device;
  record.notifier = std::move(sender);

  // The replaced record is destroyed outside the shard lock so its stream
  // closes without holding the lock.
  Record previous;
  {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.records.find(key);
    if(it != shard.records.end()) {
      previous = std::move(it->second);
      it->second = std::move(record);
    } else {
      shard.records.emplace(key, std::move(record));
    }
  }
  return std::move(receiver);
}

std::optional<int> TransferRegistry::update(const std::string& key,
                                            std::uint64_t bytes_written,
                                            std::uint64_t total_size) {
  const int percent = progress_percent(bytes_written, total_size);
  auto& shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.records.find(key);
  if(it == shard.records.end()) return std::nullopt;

  auto& record = it->second;
  record.total_size = total_size;
  record.progress = std::max(record.progress, percent);
  if(record.progress >= 100 && !record.completed_at) {
    record.completed_at = Clock::now();
  }
  // Sent under the shard lock so concurrent updates of one key reach the
  // subscriber in order. A dropped receiver is fine: the record stays.
  record.notifier.send(record.progress - record.progress % ProgressBuckets::kStep);
  return record.progress;
}

std::optional<TransferSnapshot> TransferRegistry::lookup(const std::string& key) const {
  auto& shard = shard_for(key);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.records.find(key);
  if(it == shard.records.end()) return std::nullopt;
  return to_snapshot(it->first, it->second);
}

std::vector<TransferSnapshot> TransferRegistry::snapshot(DeviceClass device) const {
  std::vector<TransferSnapshot> out;
  for(const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for(const auto& [key, record] : shard->records) {
      if(record.device == device) out.push_back(to_snapshot(key, record));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const TransferSnapshot& a, const TransferSnapshot& b){ return a.name < b.name; });
  return out;
}

std::vector<TransferSnapshot> TransferRegistry::snapshot_all() const {
  std::vector<TransferSnapshot> out;
  for(const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for(const auto& [key, record] : shard->records) {
      out.push_back(to_snapshot(key, record));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const TransferSnapshot& a, const TransferSnapshot& b){ return a.name < b.name; });
  return out;
}

bool TransferRegistry::evict(const std::string& key) {
  Record removed;
  {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.records.find(key);
    if(it == shard.records.end()) return false;
    removed = std::move(it->second);
    shard.records.erase(it);
  }
  return true;
}

std::size_t TransferRegistry::evict_completed(std::chrono::milliseconds retention, Clock::time_point now) {
  std::size_t evicted = 0;
  for(auto& shard : shards_) {
    std::vector<Record> removed;
    {
      std::lock_guard<std::mutex> lock(shard->mutex);
      for(auto it = shard->records.begin(); it != shard->records.end();) {
        const auto& completed_at = it->second.completed_at;
        if(completed_at && now - *completed_at >= retention) {
          removed.push_back(std::move(it->second));
          it = shard->records.erase(it);
        } else {
          ++it;
        }
      }
    }
    evicted += removed.size();
  }
  return evicted;
}

std::size_t TransferRegistry::size() const {
  std::size_t total = 0;
  for(const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    total += shard->records.size();
  }
  return total;
}
