#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

// Single-producer, single-consumer latest-value channel. A send overwrites the
// value the receiver has not consumed yet, so a slow reader skips intermediate
// values and only ever observes the newest one.
template<typename T>
class WatchSender;

template<typename T>
class WatchReceiver;

namespace detail {

template<typename T>
struct WatchState {
  explicit WatchState(T initial) : value(std::move(initial)) {}

  std::mutex mutex;
  std::condition_variable cv;
  T value;
  std::uint64_t version = 1;
  bool sender_alive = true;
  bool receiver_alive = true;
  std::function<void()> listener;
};

} // namespace detail

template<typename T>
class WatchSender {
public:
  WatchSender() = default;
  explicit WatchSender(std::shared_ptr<detail::WatchState<T>> state) : state_(std::move(state)) {}
  WatchSender(WatchSender&&) noexcept = default;
  WatchSender& operator=(WatchSender&& other) noexcept {
    if(this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  WatchSender(const WatchSender&) = delete;
  WatchSender& operator=(const WatchSender&) = delete;
  ~WatchSender() { close(); }

  // Returns false when the receiver is gone; the value is dropped.
  bool send(T value) {
    if(!state_) return false;
    std::function<void()> listener;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if(!state_->receiver_alive) return false;
      state_->value = std::move(value);
      ++state_->version;
      listener = state_->listener;
    }
    state_->cv.notify_all();
    if(listener) listener();
    return true;
  }

  bool receiver_closed() const {
    if(!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->receiver_alive;
  }

  explicit operator bool() const { return static_cast<bool>(state_); }

  void close() {
    if(!state_) return;
    std::function<void()> listener;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->sender_alive = false;
      listener = state_->listener;
    }
    state_->cv.notify_all();
    if(listener) listener();
    state_.reset();
  }

private:
  std::shared_ptr<detail::WatchState<T>> state_;
};

template<typename T>
class WatchReceiver {
public:
  WatchReceiver() = default;
  explicit WatchReceiver(std::shared_ptr<detail::WatchState<T>> state) : state_(std::move(state)) {}
  WatchReceiver(WatchReceiver&&) noexcept = default;
  WatchReceiver& operator=(WatchReceiver&& other) noexcept {
    if(this != &other) {
      release();
      state_ = std::move(other.state_);
      seen_ = other.seen_;
    }
    return *this;
  }
  WatchReceiver(const WatchReceiver&) = delete;
  WatchReceiver& operator=(const WatchReceiver&) = delete;
  ~WatchReceiver() { release(); }

  // Takes the current value if it changed since the last take. The initial
  // value counts as unseen.
  std::optional<T> try_recv() {
    if(!state_) return std::nullopt;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return take_locked();
  }

  // Blocks until a new value arrives, the sender closes, or the timeout hits.
  template<typename Rep, typename Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    if(!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [&]{
      return state_->version != seen_ || !state_->sender_alive;
    });
    return take_locked();
  }

  // True once the sender is gone and the last value was consumed.
  bool closed() const {
    if(!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->sender_alive && state_->version == seen_;
  }

  // Invoked on the sending thread after every send and on close; must not block.
  void set_listener(std::function<void()> listener) {
    if(!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->listener = std::move(listener);
  }

  void release() {
    if(!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_alive = false;
      state_->listener = nullptr;
    }
    state_.reset();
  }

private:
  std::optional<T> take_locked() {
    if(state_->version == seen_) return std::nullopt;
    seen_ = state_->version;
    return state_->value;
  }

  std::shared_ptr<detail::WatchState<T>> state_;
  std::uint64_t seen_ = 0;
};

template<typename T>
std::pair<WatchSender<T>, WatchReceiver<T>> make_watch(T initial) {
  auto state = std::make_shared<detail::WatchState<T>>(std::move(initial));
  return {WatchSender<T>(state), WatchReceiver<T>(state)};
}
