#include <cstdint>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "app/Batcher.hpp"

using pulse::app::Batcher;
using pulse::domain::Candle;

namespace {

Candle candleAt(std::int64_t ts) {
    return Candle{ts, 1.0, 1.0, 1.0, 1.0, 1.0};
}

}  // namespace

int main() {
    {
        Batcher batcher;
        if (batcher.push(candleAt(1)) || batcher.push(candleAt(2))) {
            std::cerr << "Batch emitted before reaching the batch size\n";
            return 1;
        }
        const auto batch = batcher.push(candleAt(3));
        if (!batch || batch->sequence != 1U || batch->candles.size() != 3U || batch->candles[2].timestampMs != 3) {
            std::cerr << "Expected the first full batch with sequence 1\n";
            return 1;
        }
        if (batcher.pending() != 0U) {
            std::cerr << "Batcher should be empty after emitting\n";
            return 1;
        }

        batcher.push(candleAt(4));
        const auto remainder = batcher.drain();
        if (!remainder || remainder->sequence != 2U || remainder->candles.size() != 1U) {
            std::cerr << "Drain should return the partial remainder with the next sequence\n";
            return 1;
        }
        if (batcher.drain()) {
            std::cerr << "Drain on an empty batcher must return nothing\n";
            return 1;
        }
        if (batcher.lastSequence() != 2U) {
            std::cerr << "Unexpected last sequence " << batcher.lastSequence() << "\n";
            return 1;
        }
    }

    {
        Batcher single(1);
        const auto batch = single.push(candleAt(10));
        if (!batch || batch->sequence != 1U) {
            std::cerr << "Batch size 1 must emit on every push\n";
            return 1;
        }
    }

    try {
        Batcher invalid(0);
        std::cerr << "Batch size 0 must be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    // Concurrent producers never see a sequence number twice.
    {
        Batcher batcher(2);
        std::mutex mutex;
        std::set<std::uint32_t> sequences;
        std::size_t candlesSeen = 0;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < 500; ++i) {
                    if (auto batch = batcher.push(candleAt(t * 1000 + i))) {
                        std::lock_guard<std::mutex> lock(mutex);
                        sequences.insert(batch->sequence);
                        candlesSeen += batch->candles.size();
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        if (sequences.size() != 1000U || *sequences.begin() != 1U || *sequences.rbegin() != 1000U
            || candlesSeen != 2000U) {
            std::cerr << "Expected 1000 unique sequences, got " << sequences.size() << "\n";
            return 1;
        }
    }

    return 0;
}
