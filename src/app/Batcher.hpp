#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "domain/Models.hpp"

namespace pulse::app {

// Groups candles into fixed-size batches. Sequence numbers start at 1 and are
// owned by this instance; independent streams use independent batchers.
class Batcher {
public:
    static constexpr std::size_t kDefaultBatchSize = 3;

    // Throws std::invalid_argument for a zero batch size.
    explicit Batcher(std::size_t batchSize = kDefaultBatchSize);

    // Returns the drained batch once the list reaches the batch size.
    std::optional<domain::Batch> push(const domain::Candle& candle);

    // Drains whatever is pending into a sequenced batch (end of a finite source).
    std::optional<domain::Batch> drain();

    std::size_t pending() const;
    std::uint32_t lastSequence() const;
    std::size_t batchSize() const noexcept { return batchSize_; }

private:
    domain::Batch takeLocked_();

    const std::size_t batchSize_;
    mutable std::mutex mutex_;
    std::vector<domain::Candle> pending_;
    std::uint32_t sequence_{0};
};

}  // namespace pulse::app
