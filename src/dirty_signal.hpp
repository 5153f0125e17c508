#pragma once

#include <atomic>
#include <cstddef>

// Bounded, best-effort wake-up channel. Senders never block: once `capacity`
// pings are pending, further pings are dropped, which coalesces bursts into a
// single wake-up of the poller.
class DirtySignal {
public:
  explicit DirtySignal(std::size_t capacity = 8);

  // Returns false if the signal is full or closed.
  bool try_send();

  // Takes every pending ping and returns how many there were.
  std::size_t drain();

  std::size_t pending() const;
  std::size_t capacity() const { return capacity_; }

  void close();
  bool closed() const;

private:
  const std::size_t capacity_;
  std::atomic<std::size_t> pending_{0};
  std::atomic<bool> closed_{false};
};
