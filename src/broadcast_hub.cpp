#include "broadcast_hub.hpp"

#include <utility>

#include "protocol.hpp"

BroadcastHub::BroadcastHub(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("broadcast")) {
  if(options_.active_interval.count() <= 0) options_.active_interval = std::chrono::milliseconds(100);
  if(options_.idle_interval.count() <= 0) options_.idle_interval = std::chrono::milliseconds(150);
}

BroadcastHub::~BroadcastHub() {
  for(auto& ch : channels_) {
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    if(ch.timer) {
      std::error_code ec;
      ch.timer->cancel(ec);
    }
  }
}

bool BroadcastHub::is_aggregate(BroadcastClass cls) {
  return cls == BroadcastClass::Mobile || cls == BroadcastClass::Desktop;
}

void BroadcastHub::set_source(BroadcastClass cls, SnapshotSource source) {
  channel(cls).source = std::move(source);
}

std::string BroadcastHub::initial_payload(BroadcastClass cls) const {
  switch(cls) {
    case BroadcastClass::Packaging: return make_progress_payload(0);
    case BroadcastClass::Presence: return make_presence(false, false).dump();
    default: return kEmptyTransferList;
  }
}

std::string BroadcastHub::presence_payload() const {
  return make_presence(has_subscriber(BroadcastClass::Mobile),
                       has_subscriber(BroadcastClass::Desktop)).dump();
}

WatchReceiver<std::string> BroadcastHub::subscribe(BroadcastClass cls) {
  auto [sender, receiver] = make_watch<std::string>(initial_payload(cls));
  auto& ch = channel(cls);

  WatchSender<std::string> displaced; // closed once the slot lock is released
  bool spawn = false;
  {
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    if(stopping_.load()) {
      return std::move(receiver);
    }
    if(ch.subscriber) {
      if(!ch.subscriber.send(kConnectionReplaced)) {
        logger_->debug("[{}] displaced subscriber had already disconnected", to_string(cls));
      }
      displaced = std::move(ch.subscriber);
    }
    ch.subscriber = std::move(sender);
    if(!ch.pump_active) {
      ch.pump_active = true;
      ++ch.pumps_spawned;
      spawn = true;
    }
  }
  displaced.close();

  if(spawn) {
    logger_->info("[{}] first subscriber, starting pump", to_string(cls));
    spawn_pump(cls);
  } else {
    logger_->info("[{}] subscriber replaced", to_string(cls));
    if(cls != BroadcastClass::Packaging) ping(cls);
  }
  if(is_aggregate(cls)) ping(BroadcastClass::Presence);
  return std::move(receiver);
}

bool BroadcastHub::ping(BroadcastClass cls) {
  auto& ch = channel(cls);
  std::unique_lock<std::mutex> lock(ch.signal_mutex, std::try_to_lock);
  if(!lock.owns_lock() || !ch.signal) return false;
  return ch.signal->try_send();
}

bool BroadcastHub::has_subscriber(BroadcastClass cls) const {
  const auto& ch = channel(cls);
  std::lock_guard<std::mutex> lock(ch.slot_mutex);
  return ch.subscriber && !ch.subscriber.receiver_closed();
}

bool BroadcastHub::pump_active(BroadcastClass cls) const {
  const auto& ch = channel(cls);
  std::lock_guard<std::mutex> lock(ch.slot_mutex);
  return ch.pump_active;
}

std::size_t BroadcastHub::running_pumps(BroadcastClass cls) const {
  return channel(cls).running_pumps.load();
}

std::size_t BroadcastHub::pumps_spawned(BroadcastClass cls) const {
  const auto& ch = channel(cls);
  std::lock_guard<std::mutex> lock(ch.slot_mutex);
  return ch.pumps_spawned;
}

std::size_t BroadcastHub::active_pumps() const {
  std::size_t total = 0;
  for(auto cls : kAllBroadcastClasses) {
    total += running_pumps(cls);
  }
  return total;
}

void BroadcastHub::spawn_pump(BroadcastClass cls) {
  auto& ch = channel(cls);
  auto signal = std::make_shared<DirtySignal>(options_.signal_capacity);
  if(cls != BroadcastClass::Packaging) {
    // the new subscriber gets the current state on the first tick
    signal->try_send();
  }
  {
    std::lock_guard<std::mutex> lock(ch.signal_mutex);
    ch.signal = signal;
  }
  auto timer = std::make_shared<asio::steady_timer>(io_);
  {
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    ch.timer = timer;
  }
  ch.running_pumps.fetch_add(1);
  std::weak_ptr<BroadcastHub> weak = shared_from_this();
  asio::post(io_, [weak, cls, signal, timer](){
    if(auto self = weak.lock()) {
      self->tick(cls, signal, timer);
    }
  });
}

void BroadcastHub::schedule(BroadcastClass cls,
                            std::shared_ptr<DirtySignal> signal,
                            std::shared_ptr<asio::steady_timer> timer,
                            std::chrono::milliseconds delay) {
  std::weak_ptr<BroadcastHub> weak = shared_from_this();
  timer->expires_after(delay);
  timer->async_wait([weak, cls, signal, timer](const std::error_code& ec){
    auto self = weak.lock();
    if(!self) return;
    if(ec) {
      self->retire_pump(cls, signal);
      return;
    }
    self->tick(cls, signal, timer);
  });
}

void BroadcastHub::tick(BroadcastClass cls,
                        const std::shared_ptr<DirtySignal>& signal,
                        const std::shared_ptr<asio::steady_timer>& timer) {
  auto& ch = channel(cls);
  const std::size_t drained = signal->drain();

  if(drained > 0) {
    std::string payload;
    if(ch.source) {
      payload = ch.source();
    } else if(cls == BroadcastClass::Presence) {
      payload = presence_payload();
    } else {
      payload = initial_payload(cls);
    }
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    if(!ch.subscriber.send(std::move(payload))) {
      logger_->debug("[{}] no live receiver for snapshot", to_string(cls));
    }
  }

  bool alive = false;
  {
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    alive = !stopping_.load() && ch.subscriber && !ch.subscriber.receiver_closed();
  }
  if(!alive) {
    retire_pump(cls, signal);
    return;
  }
  schedule(cls, signal, timer, drained > 0 ? options_.active_interval : options_.idle_interval);
}

void BroadcastHub::retire_pump(BroadcastClass cls, const std::shared_ptr<DirtySignal>& signal) {
  auto& ch = channel(cls);
  WatchSender<std::string> gone;
  {
    std::lock_guard<std::mutex> lock(ch.slot_mutex);
    // A subscriber that arrived after the liveness check keeps this pump.
    if(!stopping_.load() && ch.subscriber && !ch.subscriber.receiver_closed()) {
      auto timer = ch.timer;
      if(timer) {
        schedule(cls, signal, timer, options_.idle_interval);
        return;
      }
    }
    gone = std::move(ch.subscriber);
    ch.pump_active = false;
    ch.timer.reset();
  }
  gone.close();
  {
    std::lock_guard<std::mutex> lock(ch.signal_mutex);
    if(ch.signal == signal) ch.signal.reset();
  }
  signal->close();
  ch.running_pumps.fetch_sub(1);
  logger_->info("[{}] subscriber gone, pump stopped", to_string(cls));
  if(is_aggregate(cls)) ping(BroadcastClass::Presence);
}

void BroadcastHub::shutdown() {
  if(stopping_.exchange(true)) return;
  for(auto cls : kAllBroadcastClasses) {
    auto& ch = channel(cls);
    WatchSender<std::string> closing;
    std::shared_ptr<asio::steady_timer> timer;
    {
      std::lock_guard<std::mutex> lock(ch.slot_mutex);
      closing = std::move(ch.subscriber);
      timer = ch.timer;
    }
    closing.close();
    if(timer) {
      std::error_code ec;
      timer->cancel(ec);
    }
  }
}
