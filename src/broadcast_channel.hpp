#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

// Fan-out of values to subscribers keyed by an id (the hub uses connection
// ids). Values are delivered in publish order. Callbacks run with the channel
// lock held, so they must not subscribe or unsubscribe; once unsubscribe()
// returns, that callback is never invoked again.
template<typename T>
class BroadcastChannel {
public:
  using Callback = std::function<void(const T&)>;

  void subscribe(uint64_t id, Callback callback) {
    std::lock_guard lg(m_);
    subscribers_[id] = std::move(callback);
  }

  bool unsubscribe(uint64_t id) {
    std::lock_guard lg(m_);
    return subscribers_.erase(id) > 0;
  }

  bool is_subscribed(uint64_t id) const {
    std::lock_guard lg(m_);
    return subscribers_.count(id) > 0;
  }

  void publish(const T& value) {
    std::lock_guard lg(m_);
    for(auto& kv : subscribers_) {
      kv.second(value);
    }
  }

  std::size_t subscriber_count() const {
    std::lock_guard lg(m_);
    return subscribers_.size();
  }

  void clear() {
    std::lock_guard lg(m_);
    subscribers_.clear();
  }

private:
  mutable std::mutex m_;
  std::map<uint64_t, Callback> subscribers_;
};
