#include "dirty_signal.hpp"

#include <algorithm>

DirtySignal::DirtySignal(std::size_t capacity)
  : capacity_(std::max<std::size_t>(1, capacity)) {}

bool DirtySignal::try_send() {
  if(closed_.load(std::memory_order_acquire)) return false;
  std::size_t current = pending_.load(std::memory_order_relaxed);
  while(current < capacity_) {
    if(pending_.compare_exchange_weak(current, current + 1,
                                      std::memory_order_acq_rel,
                                      std::memory_order_relaxed)) {
      return true;
    }
  }
  return false;
}

std::size_t DirtySignal::drain() {
  return pending_.exchange(0, std::memory_order_acq_rel);
}

std::size_t DirtySignal::pending() const {
  return pending_.load(std::memory_order_acquire);
}

void DirtySignal::close() {
  closed_.store(true, std::memory_order_release);
}

bool DirtySignal::closed() const {
  return closed_.load(std::memory_order_acquire);
}
