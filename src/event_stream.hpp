#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"

using SubscriptionHandle = std::size_t;

// Multi-subscriber notification channel. Handlers run on the emitting
// thread, outside the subscriber lock, so a handler may unsubscribe itself.
template<typename Event>
class EventStream {
public:
  using Handler = std::function<void(const Event&)>;

  explicit EventStream(std::string name = {}, std::shared_ptr<Logger> logger = nullptr)
    : name_(std::move(name)), logger_(std::move(logger)) {}

  SubscriptionHandle subscribe(Handler handler) {
    if(!handler) return 0;
    std::lock_guard lg(m_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
  }

  void unsubscribe(SubscriptionHandle handle) {
    std::lock_guard lg(m_);
    handlers_.erase(handle);
  }

  void clear() {
    std::lock_guard lg(m_);
    handlers_.clear();
  }

  void emit(const Event& event) const {
    std::vector<Handler> snapshot;
    {
      std::lock_guard lg(m_);
      snapshot.reserve(handlers_.size());
      for(const auto& entry : handlers_) snapshot.push_back(entry.second);
    }
    for(const auto& handler : snapshot) {
      try {
        handler(event);
      } catch(const std::exception& e) {
        log_error(logger_.get(), "{} subscriber threw: {}", name_, e.what());
      }
    }
  }

private:
  std::string name_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<SubscriptionHandle, Handler> handlers_;
  SubscriptionHandle next_id_ = 1;
};
