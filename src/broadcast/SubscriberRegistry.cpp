#include "broadcast/SubscriberRegistry.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace pulse::broadcast {

void SubscriberRegistry::add(SubscriberPtr subscriber) {
    if (!subscriber) {
        return;
    }
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(std::move(subscriber));
        count = subscribers_.size();
    }
    metrics::Registry::instance().setGauge("broadcast.subscribers", static_cast<double>(count));
    LOG_INFO("subscriber connected client_count=" << count);
}

bool SubscriberRegistry::remove(std::uint64_t id) {
    bool removed = false;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto before = subscribers_.size();
        subscribers_.erase(std::remove_if(subscribers_.begin(),
                                          subscribers_.end(),
                                          [id](const SubscriberPtr& subscriber) {
                                              return subscriber->id() == id;
                                          }),
                           subscribers_.end());
        removed = subscribers_.size() != before;
        count = subscribers_.size();
    }
    if (removed) {
        metrics::Registry::instance().setGauge("broadcast.subscribers", static_cast<double>(count));
        LOG_INFO("subscriber disconnected client_count=" << count);
    }
    return removed;
}

std::size_t SubscriberRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

std::vector<SubscriberPtr> SubscriberRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_;
}

std::uint64_t SubscriberRegistry::nextId() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1U, std::memory_order_relaxed) + 1U;
}

}  // namespace pulse::broadcast
