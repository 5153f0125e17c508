#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "device_class.hpp"
#include "dirty_signal.hpp"
#include "log.hpp"
#include "watch_channel.hpp"

// Live progress broadcasting, one channel per BroadcastClass. Each channel
// holds at most one subscriber (its slot), an optional dirty signal and at
// most one pump polling that signal on the io_context:
//
//   Idle   -- no subscriber, no pump, no signal
//   Active -- one pump; every tick it drains the signal and, if anything was
//             pending, republishes the class snapshot through the slot
//
// A second subscriber on an Active channel receives the slot in place: the
// old one is sent CONNECTION_REPLACED and the running pump keeps going,
// resolving the slot again on its next tick. A pump retires once its
// subscriber has gone away.
class BroadcastHub : public std::enable_shared_from_this<BroadcastHub> {
public:
  using SnapshotSource = std::function<std::string()>;

  struct Options {
    std::chrono::milliseconds active_interval{100};
    std::chrono::milliseconds idle_interval{150};
    std::size_t signal_capacity = 8;
  };

  BroadcastHub(asio::io_context& io, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~BroadcastHub();

  BroadcastHub(const BroadcastHub&) = delete;
  BroadcastHub& operator=(const BroadcastHub&) = delete;

  // Payload builder invoked by the pump of `cls`; install before subscribing.
  void set_source(BroadcastClass cls, SnapshotSource source);

  WatchReceiver<std::string> subscribe(BroadcastClass cls);

  // Non-blocking wake-up for the pump of `cls`. Returns false when the class
  // is Idle, the signal is full, or its installation is momentarily locked.
  bool ping(BroadcastClass cls);

  bool has_subscriber(BroadcastClass cls) const;
  bool pump_active(BroadcastClass cls) const;
  std::size_t running_pumps(BroadcastClass cls) const;
  std::size_t pumps_spawned(BroadcastClass cls) const;
  std::size_t active_pumps() const;

  // Closes every slot so streaming subscribers end, and stops all pumps.
  void shutdown();

private:
  struct Channel {
    mutable std::mutex slot_mutex;
    WatchSender<std::string> subscriber;
    bool pump_active = false;
    std::shared_ptr<asio::steady_timer> timer;
    std::size_t pumps_spawned = 0;
    std::atomic<std::size_t> running_pumps{0};

    std::mutex signal_mutex;
    std::shared_ptr<DirtySignal> signal;

    SnapshotSource source;
  };

  Channel& channel(BroadcastClass cls) { return channels_[index_of(cls)]; }
  const Channel& channel(BroadcastClass cls) const { return channels_[index_of(cls)]; }

  void spawn_pump(BroadcastClass cls);
  void tick(BroadcastClass cls,
            const std::shared_ptr<DirtySignal>& signal,
            const std::shared_ptr<asio::steady_timer>& timer);
  void retire_pump(BroadcastClass cls, const std::shared_ptr<DirtySignal>& signal);
  void schedule(BroadcastClass cls,
                std::shared_ptr<DirtySignal> signal,
                std::shared_ptr<asio::steady_timer> timer,
                std::chrono::milliseconds delay);

  std::string initial_payload(BroadcastClass cls) const;
  std::string presence_payload() const;
  static bool is_aggregate(BroadcastClass cls);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::array<Channel, kBroadcastClassCount> channels_;
  std::atomic<bool> stopping_{false};
};
