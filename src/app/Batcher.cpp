#include "app/Batcher.hpp"

#include <stdexcept>
#include <utility>

namespace pulse::app {

Batcher::Batcher(std::size_t batchSize) : batchSize_(batchSize) {
    if (batchSize_ == 0U) {
        throw std::invalid_argument("batch size must be >= 1");
    }
    pending_.reserve(batchSize_);
}

std::optional<domain::Batch> Batcher::push(const domain::Candle& candle) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(candle);
    if (pending_.size() < batchSize_) {
        return std::nullopt;
    }
    return takeLocked_();
}

std::optional<domain::Batch> Batcher::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    return takeLocked_();
}

std::size_t Batcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::uint32_t Batcher::lastSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

domain::Batch Batcher::takeLocked_() {
    domain::Batch batch;
    batch.sequence = ++sequence_;
    batch.candles = std::move(pending_);
    pending_ = {};
    pending_.reserve(batchSize_);
    return batch;
}

}  // namespace pulse::app
