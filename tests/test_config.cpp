#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"

namespace fs = std::filesystem;
using pulse::common::Config;

namespace {

const std::vector<std::string> kEnvNames{
    "STREAM_ID", "INTERVAL_MS", "PORT", "LOG_LEVEL", "TICK_SOURCE", "REPLAY_PATH", "SEED", "BATCH_SIZE",
    "PERSISTENCE_MODE", "LOCAL_PERSIST_ROOT", "FLUSH_INTERVAL_MS", "SEGMENT_TARGET_BYTES", "MAX_PENDING_CANDLES",
};

struct EnvGuard {
    EnvGuard() {
        for (const auto& name : kEnvNames) {
            if (const char* current = std::getenv(name.c_str())) {
                saved.emplace_back(name, current);
            }
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (const auto& name : kEnvNames) {
            ::unsetenv(name.c_str());
        }
        for (const auto& [name, value] : saved) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
    }

    std::vector<std::pair<std::string, std::string>> saved;
};

Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const pulse::ConfigError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard envGuard;
    const auto root = fs::temp_directory_path() / "pulse-tests" / "config" / "store";
    fs::remove_all(root.parent_path());

    if (!rejects({"producer"})) {
        std::cerr << "A missing stream id must be rejected\n";
        return 1;
    }

    {
        const auto config = runConfig({"producer", "--stream-id", "m1", "--local-root", root.string()});
        if (config.streamId != "m1" || config.intervalMs != 65U || config.port != 8787U || config.threads != 1U
            || config.batchSize != 3U || config.flushIntervalMs != 1000U || config.segmentTargetBytes != 65536U
            || config.maxPendingCandles != 100000U || !config.httpCorsEnable || config.httpCorsOrigin != "*"
            || config.seed || config.logLevel != pulse::log::Level::Info) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
        if (config.tickSource != pulse::common::TickSourceMode::Synthetic
            || config.persistenceMode != pulse::common::PersistenceMode::Local) {
            std::cerr << "Expected synthetic source with local persistence by default\n";
            return 1;
        }
        if (!fs::is_directory(root)) {
            std::cerr << "Local persistence should create the storage root\n";
            return 1;
        }
    }

    // Environment first, command line wins.
    {
        ::setenv("STREAM_ID", "from-env", 1);
        ::setenv("INTERVAL_MS", "100", 1);
        ::setenv("PERSISTENCE_MODE", "disabled", 1);
        ::setenv("SEED", "77", 1);
        const auto fromEnv = runConfig({"producer"});
        if (fromEnv.streamId != "from-env" || fromEnv.intervalMs != 100U
            || fromEnv.persistenceMode != pulse::common::PersistenceMode::Disabled || !fromEnv.seed
            || *fromEnv.seed != 77U) {
            std::cerr << "Environment values were not applied\n";
            return 1;
        }

        const auto overridden = runConfig({"producer", "--stream-id=flag", "--interval-ms", "250", "--batch-size=5",
                                           "--log-level", "DEBUG", "--http.cors.enable", "false"});
        if (overridden.streamId != "flag" || overridden.intervalMs != 250U || overridden.batchSize != 5U
            || overridden.logLevel != pulse::log::Level::Debug || overridden.httpCorsEnable) {
            std::cerr << "Command line should override the environment\n";
            return 1;
        }
        ::unsetenv("STREAM_ID");
        ::unsetenv("INTERVAL_MS");
        ::unsetenv("PERSISTENCE_MODE");
        ::unsetenv("SEED");
    }

    {
        const auto replay = runConfig({"producer", "--stream-id", "m1", "--persistence", "disabled", "--tick-source",
                                       "csv", "--replay-path", "/tmp/ticks.csv"});
        if (replay.tickSource != pulse::common::TickSourceMode::Replay || replay.replayPath != "/tmp/ticks.csv") {
            std::cerr << "csv should select the replay source\n";
            return 1;
        }
    }

    const std::vector<std::vector<std::string>> invalid{
        {"producer", "--stream-id", "m1", "--tick-source", "replay", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--port", "70000", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--batch-size", "0", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--batch-size", "70000", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--persistence", "s3"},
        {"producer", "--stream-id", "a/b", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--tick-source", "zigzag", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--log-level", "loud", "--persistence", "disabled"},
        {"producer", "--stream-id", "m1", "--seed", "-4", "--persistence", "disabled"},
    };
    for (const auto& args : invalid) {
        if (!rejects(args)) {
            std::cerr << "Expected ConfigError for";
            for (const auto& arg : args) {
                std::cerr << ' ' << arg;
            }
            std::cerr << "\n";
            return 1;
        }
    }

    return 0;
}
