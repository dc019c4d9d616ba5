#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include <boost/asio/thread_pool.hpp>

#include "app/Batcher.hpp"
#include "broadcast/BroadcastDistributor.hpp"
#include "feed/TickSource.hpp"
#include "storage/SegmentLogWriter.hpp"

namespace pulse::app {

// Drives the tick loop: source -> batcher -> {broadcast, persistence}.
// Broadcast and persistence run on their own single-thread executors so
// neither blocks the loop nor each other, and each keeps batch order.
class Pipeline {
public:
    struct Options {
        std::uint32_t intervalMs{65};
    };

    Pipeline(feed::TickSource& source,
             Batcher& batcher,
             broadcast::BroadcastDistributor& distributor,
             storage::SegmentLogWriter& writer,
             Options options);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Blocks until the source is exhausted or stop() is called.
    void run();

    // Safe from any thread.
    void stop();

    // Waits for dispatched work, then forces a final flush. Idempotent.
    void shutdown();

    std::uint64_t ticks() const noexcept { return ticks_.load(); }
    std::uint64_t batchesDispatched() const noexcept { return batches_.load(); }

private:
    void dispatch_(domain::Batch batch);
    void waitFor_(std::chrono::milliseconds delay);

    feed::TickSource& source_;
    Batcher& batcher_;
    broadcast::BroadcastDistributor& distributor_;
    storage::SegmentLogWriter& writer_;
    Options options_;

    boost::asio::thread_pool broadcastPool_{1};
    boost::asio::thread_pool persistencePool_{1};

    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> shutDown_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> batches_{0};
};

}  // namespace pulse::app
