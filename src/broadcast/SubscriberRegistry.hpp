#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace pulse::broadcast {

using Frame = std::shared_ptr<const std::vector<std::uint8_t>>;

// A live consumer of encoded batches.
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual std::uint64_t id() const noexcept = 0;

    // Open and able to take a frame right now (no write in flight).
    virtual bool ready() const noexcept = 0;

    // Starts delivery of the frame and returns immediately.
    virtual void send(const Frame& frame) = 0;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

class SubscriberRegistry {
public:
    SubscriberRegistry() = default;
    SubscriberRegistry(const SubscriberRegistry&) = delete;
    SubscriberRegistry& operator=(const SubscriberRegistry&) = delete;

    void add(SubscriberPtr subscriber);
    bool remove(std::uint64_t id);

    std::size_t size() const;
    std::vector<SubscriberPtr> snapshot() const;

    static std::uint64_t nextId() noexcept;

private:
    mutable std::mutex mutex_;
    std::vector<SubscriberPtr> subscribers_;
};

}  // namespace pulse::broadcast
