#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "broadcast/SubscriberRegistry.hpp"
#include "domain/Models.hpp"

namespace pulse::broadcast {

// Encodes each batch once and fans the same frame out to every ready
// subscriber. Subscribers that are not ready miss the frame.
class BroadcastDistributor {
public:
    using NowFn = std::function<double()>;

    explicit BroadcastDistributor(SubscriberRegistry& registry, NowFn now = {});

    // Returns the number of subscribers the frame was handed to. Propagates
    // CodecError from the encoder.
    std::size_t publish(const domain::Batch& batch, std::uint32_t intervalMs);

private:
    SubscriberRegistry& registry_;
    NowFn now_;
};

}  // namespace pulse::broadcast
