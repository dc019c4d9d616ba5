#include "broadcast/BroadcastDistributor.hpp"

#include <chrono>
#include <memory>
#include <utility>

#include "codec/BatchCodec.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace pulse::broadcast {
namespace {

double systemNowMs() {
    return static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

}  // namespace

BroadcastDistributor::BroadcastDistributor(SubscriberRegistry& registry, NowFn now)
    : registry_(registry), now_(now ? std::move(now) : NowFn{systemNowMs}) {}

std::size_t BroadcastDistributor::publish(const domain::Batch& batch, std::uint32_t intervalMs) {
    const auto subscribers = registry_.snapshot();
    if (subscribers.empty() || batch.candles.empty()) {
        return 0;
    }

    domain::PartialBatchMetadata metadata;
    metadata.sequence = batch.sequence;
    metadata.intervalMs = intervalMs;
    metadata.sentAtMs = now_();

    const Frame frame = std::make_shared<const codec::Buffer>(codec::encodeBatch(metadata, batch.candles));

    std::size_t sent = 0;
    std::size_t skipped = 0;
    for (const auto& subscriber : subscribers) {
        if (!subscriber->ready()) {
            ++skipped;
            continue;
        }
        subscriber->send(frame);
        ++sent;
    }

    auto& registry = metrics::Registry::instance();
    registry.incrementCounter("broadcast.batches_total");
    registry.incrementCounter("broadcast.frames_sent", sent);
    registry.incrementCounter("broadcast.frames_skipped", skipped);

    LOG_DEBUG("broadcast sequence=" << batch.sequence << " bytes=" << frame->size() << " sent=" << sent
                                    << " skipped=" << skipped);
    return sent;
}

}  // namespace pulse::broadcast
