#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <thread>
#include <utility>

#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/Batcher.hpp"
#include "app/Pipeline.hpp"
#include "broadcast/BroadcastDistributor.hpp"
#include "broadcast/SubscriberRegistry.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "feed/TickSource.hpp"
#include "storage/SegmentLogWriter.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = pulse::common::Config::fromArgs(argc, argv);
        pulse::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Stream: " << config.streamId);
        LOG_INFO("  Port: " << config.port);
        LOG_INFO("  Log level: " << pulse::log::levelToString(config.logLevel));
        LOG_INFO("  Worker threads: " << config.threads);
        LOG_INFO("  Tick source: " << pulse::common::toString(config.tickSource)
                                   << (config.replayPath.empty() ? "" : " path=") << config.replayPath);
        LOG_INFO("  Interval: " << config.intervalMs << " ms, batch size " << config.batchSize);
        LOG_INFO("  Persistence: " << pulse::common::toString(config.persistenceMode)
                                   << " root=" << config.localRoot);
        LOG_INFO("  Flush: target_bytes=" << config.segmentTargetBytes << " interval_ms=" << config.flushIntervalMs
                                          << " max_pending=" << config.maxPendingCandles);

        pulse::feed::TickSourceOptions sourceOptions;
        sourceOptions.mode = config.tickSource;
        sourceOptions.intervalMs = config.intervalMs;
        sourceOptions.seed = config.seed;
        sourceOptions.replayPath = config.replayPath;
        auto source = pulse::feed::makeTickSource(sourceOptions);

        pulse::storage::SegmentLogWriter::Options writerOptions;
        writerOptions.streamId = config.streamId;
        writerOptions.intervalMs = config.intervalMs;
        writerOptions.mode = config.persistenceMode;
        writerOptions.localRoot = config.localRoot;
        writerOptions.segmentTargetBytes = config.segmentTargetBytes;
        writerOptions.flushIntervalMs = config.flushIntervalMs;
        writerOptions.maxPendingCandles = config.maxPendingCandles;
        pulse::storage::SegmentLogWriter writer(writerOptions);
        writer.hydrateFromDisk();

        pulse::broadcast::SubscriberRegistry subscribers;
        pulse::broadcast::BroadcastDistributor distributor(subscribers);
        pulse::app::Batcher batcher(config.batchSize);

        pulse::api::Router router(writer);
        pulse::api::HttpServer server(pulse::api::Endpoint{"0.0.0.0", config.port}, config.threads, router, subscribers);

        pulse::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();

        pulse::app::Pipeline pipeline(*source, batcher, distributor, writer, pulse::app::Pipeline::Options{config.intervalMs});

        std::atomic<bool> loopFinished{false};
        std::exception_ptr loopError;
        std::thread loop([&]() {
            try {
                pipeline.run();
            } catch (const std::exception&) {
                loopError = std::current_exception();
            }
            loopFinished.store(true);
        });

        LOG_INFO("Producer running. Waiting for subscribers...");

        bool reportedFinished = false;
        while (gSignalStatus == 0) {
            if (loopFinished.load() && !reportedFinished) {
                reportedFinished = true;
                LOG_INFO("Tick loop finished; state stays queryable until a signal arrives");
                if (loopError) {
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (gSignalStatus != 0) {
            LOG_INFO("Signal " << gSignalStatus << " received, stopping services...");
        }
        LOG_INFO("Starting graceful shutdown");

        pipeline.stop();
        loop.join();
        pipeline.shutdown();
        server.stop();

        if (loopError) {
            std::rethrow_exception(loopError);
        }

        LOG_INFO("Shutdown complete sequence=" << writer.sequence());
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal producer error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
