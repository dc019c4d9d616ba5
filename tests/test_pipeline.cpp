#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <mutex>
#include <thread>
#include <vector>

#include "app/Batcher.hpp"
#include "app/Pipeline.hpp"
#include "broadcast/BroadcastDistributor.hpp"
#include "broadcast/SubscriberRegistry.hpp"
#include "codec/BatchCodec.hpp"
#include "feed/ReplayTickSource.hpp"
#include "feed/SyntheticTickSource.hpp"
#include "storage/SegmentLogWriter.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class RecordingSubscriber : public pulse::broadcast::Subscriber {
public:
    std::uint64_t id() const noexcept override { return 1; }
    bool ready() const noexcept override { return true; }
    void send(const pulse::broadcast::Frame& frame) override {
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(frame);
    }

    std::mutex mutex;
    std::vector<pulse::broadcast::Frame> frames;
};

fs::path freshRoot(const std::string& name) {
    const auto root = fs::temp_directory_path() / "pulse-tests" / "pipeline" / name;
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

}  // namespace

int main() {
    // Finite replay: full batches plus the drained remainder reach both sinks.
    {
        const auto root = freshRoot("replay");
        const auto csv = root / "ticks.csv";
        {
            std::ofstream out(csv);
            for (int i = 0; i < 7; ++i) {
                out << 1000 + i * 65 << ",100,101,99,100.5," << 1000 + i << "\n";
            }
        }

        pulse::feed::ReplayTickSource::Options sourceOptions;
        sourceOptions.path = csv.string();
        sourceOptions.intervalMs = 1;
        pulse::feed::ReplayTickSource source(sourceOptions);

        pulse::storage::SegmentLogWriter::Options writerOptions;
        writerOptions.streamId = "m1";
        writerOptions.intervalMs = 65;
        writerOptions.localRoot = root / "store";
        pulse::storage::SegmentLogWriter writer(writerOptions);

        pulse::broadcast::SubscriberRegistry registry;
        auto subscriber = std::make_shared<RecordingSubscriber>();
        registry.add(subscriber);
        pulse::broadcast::BroadcastDistributor distributor(registry);
        pulse::app::Batcher batcher(3);

        pulse::app::Pipeline pipeline(source, batcher, distributor, writer, pulse::app::Pipeline::Options{65});
        pipeline.run();
        pipeline.shutdown();

        if (pipeline.ticks() != 7U || pipeline.batchesDispatched() != 3U) {
            std::cerr << "Expected 7 ticks in 3 batches, got " << pipeline.ticks() << " / "
                      << pipeline.batchesDispatched() << "\n";
            return 1;
        }
        if (subscriber->frames.size() != 3U) {
            std::cerr << "Subscriber should receive three frames, got " << subscriber->frames.size() << "\n";
            return 1;
        }
        for (std::size_t i = 0; i < subscriber->frames.size(); ++i) {
            const auto decoded = pulse::codec::decodeBatch(*subscriber->frames[i]);
            if (decoded.metadata.sequence != i + 1U || decoded.metadata.intervalMs != 65U) {
                std::cerr << "Frames should arrive in sequence order\n";
                return 1;
            }
        }
        const auto lastFrame = pulse::codec::decodeBatch(*subscriber->frames.back());
        if (lastFrame.candles.size() != 1U || lastFrame.candles[0].timestampMs != 1000 + 6 * 65) {
            std::cerr << "Remainder batch should carry the last candle\n";
            return 1;
        }

        std::size_t lines = 0;
        for (const auto& entry : fs::recursive_directory_iterator(root / "store" / "m1")) {
            if (entry.path().extension() == ".log" && entry.path().filename() != "latest.log") {
                std::ifstream in(entry.path());
                std::string line;
                while (std::getline(in, line)) {
                    ++lines;
                }
            }
        }
        if (lines != 7U || writer.sequence() < 1U || writer.pendingCandles() != 0U) {
            std::cerr << "All seven candles should be persisted after shutdown, got " << lines << "\n";
            return 1;
        }

        pipeline.shutdown();
    }

    // stop() interrupts a long pacing wait.
    {
        pulse::feed::SyntheticTickSource::Options sourceOptions;
        sourceOptions.intervalMs = 60'000;
        sourceOptions.seed = 5;
        pulse::feed::SyntheticTickSource source(sourceOptions);

        pulse::storage::SegmentLogWriter::Options writerOptions;
        writerOptions.streamId = "m2";
        writerOptions.mode = pulse::common::PersistenceMode::Disabled;
        pulse::storage::SegmentLogWriter writer(writerOptions);

        pulse::broadcast::SubscriberRegistry registry;
        pulse::broadcast::BroadcastDistributor distributor(registry);
        pulse::app::Batcher batcher(3);
        pulse::app::Pipeline pipeline(source, batcher, distributor, writer, pulse::app::Pipeline::Options{60'000});

        std::atomic<bool> finished{false};
        const auto started = std::chrono::steady_clock::now();
        std::thread loop([&]() {
            pipeline.run();
            finished.store(true);
        });

        std::this_thread::sleep_for(50ms);
        pipeline.stop();
        loop.join();
        pipeline.shutdown();

        if (!finished.load() || std::chrono::steady_clock::now() - started > 5s) {
            std::cerr << "stop() should wake the pacing wait\n";
            return 1;
        }
        if (pipeline.ticks() != 1U || pipeline.batchesDispatched() != 1U) {
            std::cerr << "Expected one tick drained as a single batch\n";
            return 1;
        }
    }

    return 0;
}
