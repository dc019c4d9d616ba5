#include "app/Pipeline.hpp"

#include <memory>
#include <utility>

#include <boost/asio/post.hpp>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace pulse::app {

Pipeline::Pipeline(feed::TickSource& source,
                   Batcher& batcher,
                   broadcast::BroadcastDistributor& distributor,
                   storage::SegmentLogWriter& writer,
                   Options options)
    : source_(source), batcher_(batcher), distributor_(distributor), writer_(writer), options_(options) {}

Pipeline::~Pipeline() {
    stop();
    broadcastPool_.join();
    persistencePool_.join();
}

void Pipeline::run() {
    LOG_INFO("pipeline started source=" << source_.name() << " batch_size=" << batcher_.batchSize()
                                        << " interval_ms=" << options_.intervalMs);

    while (!stopRequested_.load()) {
        auto candle = source_.next();
        if (!candle) {
            LOG_INFO("tick source exhausted source=" << source_.name() << " ticks=" << ticks_.load());
            break;
        }
        ticks_.fetch_add(1);
        metrics::Registry::instance().incrementCounter("pipeline.ticks_total");

        if (auto batch = batcher_.push(*candle)) {
            dispatch_(std::move(*batch));
        }

        waitFor_(source_.pacing());
    }

    if (auto remainder = batcher_.drain()) {
        dispatch_(std::move(*remainder));
    }

    LOG_INFO("pipeline loop finished ticks=" << ticks_.load() << " batches=" << batches_.load());
}

void Pipeline::dispatch_(domain::Batch batch) {
    batches_.fetch_add(1);
    auto shared = std::make_shared<const domain::Batch>(std::move(batch));
    const auto intervalMs = options_.intervalMs;

    boost::asio::post(broadcastPool_, [this, shared, intervalMs]() {
        try {
            distributor_.publish(*shared, intervalMs);
        } catch (const CodecError& ex) {
            LOG_ERR("broadcast failed sequence=" << shared->sequence << " error=" << ex.what());
        }
    });

    boost::asio::post(persistencePool_, [this, shared]() {
        try {
            writer_.ingest(shared->candles);
        } catch (const PersistenceError& ex) {
            LOG_ERR("ingest failed sequence=" << shared->sequence << " error=" << ex.what());
        }
    });
}

void Pipeline::waitFor_(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, delay, [this]() { return stopRequested_.load(); });
}

void Pipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_.store(true);
    }
    waitCv_.notify_all();
}

void Pipeline::shutdown() {
    if (shutDown_.exchange(true)) {
        return;
    }
    stop();
    broadcastPool_.join();
    persistencePool_.join();

    try {
        writer_.flush(true);
    } catch (const PersistenceError& ex) {
        LOG_ERR("final flush failed error=" << ex.what());
    }
    LOG_INFO("pipeline shut down sequence=" << writer_.sequence());
}

}  // namespace pulse::app
