#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "TestSupport.hpp"

namespace {

// Restores the touched environment variables on destruction.
class EnvGuard {
public:
    ~EnvGuard() {
        for (const auto& [name, original] : saved_) {
            if (original) {
                ::setenv(name.c_str(), original->c_str(), 1);
            } else {
                ::unsetenv(name.c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) {
        remember(name);
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    void clear(const std::string& name) {
        remember(name);
        ::unsetenv(name.c_str());
    }

private:
    void remember(const std::string& name) {
        if (saved_.count(name) > 0) {
            return;
        }
        const char* current = std::getenv(name.c_str());
        saved_[name] = current ? std::optional<std::string>(current) : std::nullopt;
    }

    std::map<std::string, std::optional<std::string>> saved_;
};

::ldg::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::ldg::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args, const std::string& expectedFragment) {
    try {
        runConfig(args);
    } catch (const std::runtime_error& ex) {
        if (std::string(ex.what()).find(expectedFragment) == std::string::npos) {
            std::cerr << "Error '" << ex.what() << "' does not mention " << expectedFragment << "\n";
            return false;
        }
        return true;
    }
    std::cerr << "Expected configuration to be rejected: " << expectedFragment << "\n";
    return false;
}

}  // namespace

int main() {
    EnvGuard env;
    for (const char* name : {"SCAN_URL", "BATCH_SIZE", "WINDOW_STEP_MS", "OVERLAP_MS", "MAX_RETRIES",
                             "WRITER_THREADS", "MAX_PENDING_WRITES", "RESUME_PENDING_WRITES", "EMPTY_TIERS",
                             "TARGET_MIGRATION", "SHARD_INDEX", "SHARD_TOTAL", "LIVE_MODE", "DEDUP_RESET",
                             "LOG_LEVEL", "POLL_INTERVAL_MS"}) {
        env.clear(name);
    }

    ldg::testing::TempDir root("config");
    const auto dataDir = (root / "env-data").string();
    const auto cursorDir = (root / "env-cursors").string();
    env.set("DATA_DIR", dataDir);
    env.set("CURSOR_DIR", cursorDir);

    {
        const auto config = runConfig({"ledger_ingest"});
        if (config.pageSize != 1000 || config.overlapMs != 1000 || config.writerThreads != 4 ||
            config.highWatermarkJobs != 50 || config.lowWatermarkJobs != 25 || config.live || config.audit) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
        if (config.targetMigration || config.shardTotal != 1 ||
            config.dedupReset.mode != ldg::common::DedupResetPolicy::Mode::Advance) {
            std::cerr << "Unexpected defaults for migration, sharding or dedup\n";
            return 1;
        }
        if (!std::filesystem::is_directory(dataDir) || !std::filesystem::is_directory(cursorDir)) {
            std::cerr << "Data and cursor directories should be created\n";
            return 1;
        }
    }

    // Environment overrides defaults.
    {
        env.set("BATCH_SIZE", " 250 ");
        env.set("TARGET_MIGRATION", "3");
        env.set("LIVE_MODE", "yes");
        env.set("DEDUP_RESET", "count:5000");
        env.set("EMPTY_TIERS", "0:1, 10:50, 20:1000");
        const auto config = runConfig({"ledger_ingest"});
        if (config.pageSize != 250 || config.targetMigration.value_or(-1) != 3 || !config.live) {
            std::cerr << "Environment values not applied\n";
            return 1;
        }
        if (config.dedupReset.mode != ldg::common::DedupResetPolicy::Mode::Count || config.dedupReset.count != 5000) {
            std::cerr << "DEDUP_RESET not parsed\n";
            return 1;
        }
        if (config.emptyTiers.size() != 3 || config.emptyTiers[1].threshold != 10 ||
            config.emptyTiers[2].stepMs != 1000) {
            std::cerr << "EMPTY_TIERS not parsed\n";
            return 1;
        }
    }

    // Flags override the environment.
    {
        const auto config = runConfig({"ledger_ingest", "--page-size", "100", "--migration=7", "--live=false",
                                       "--shard-index", "1", "--shard-total", "4", "--log-level", "debug",
                                       "--log-file", "/tmp/ledger-ingest-test/debug.log",
                                       "--high-watermark", "10", "--high-watermark-bytes=2048",
                                       "--low-watermark", "5", "--low-watermark-bytes", "1024"});
        if (config.pageSize != 100 || config.targetMigration.value_or(-1) != 7 || config.live) {
            std::cerr << "Flags did not override the environment\n";
            return 1;
        }
        if (config.shardIndex != 1 || config.shardTotal != 4 || config.logLevel != config::LogLevel::Debug ||
            config.logFile != "/tmp/ledger-ingest-test/debug.log") {
            std::cerr << "Shard or log flags not applied\n";
            return 1;
        }
        if (config.highWatermarkJobs != 10 || config.highWatermarkBytes != 2048 || config.lowWatermarkJobs != 5 ||
            config.lowWatermarkBytes != 1024) {
            std::cerr << "Watermark flags not applied\n";
            return 1;
        }
    }

    {
        const auto config = runConfig({"ledger_ingest", "--live-only"});
        if (!config.liveOnly || !config.live) {
            std::cerr << "--live-only must imply live mode\n";
            return 1;
        }
    }

    env.clear("BATCH_SIZE");
    env.clear("EMPTY_TIERS");
    env.clear("DEDUP_RESET");
    if (!rejects({"ledger_ingest", "--page-size", "1001"}, "Page size") ||
        !rejects({"ledger_ingest", "--page-size", "abc"}, "--page-size") ||
        !rejects({"ledger_ingest", "--page-size", "--live"}, "Missing value") ||
        !rejects({"ledger_ingest", "--high-watermark", "5", "--low-watermark", "6"}, "watermark") ||
        !rejects({"ledger_ingest", "--shard-index", "4", "--shard-total", "4"}, "Shard index") ||
        !rejects({"ledger_ingest", "--empty-tiers", "5:1,10:2"}, "threshold 0") ||
        !rejects({"ledger_ingest", "--empty-tiers", "0:1,0:2"}, "strictly increasing") ||
        !rejects({"ledger_ingest", "--dedup-reset", "sometimes"}, "advance or count") ||
        !rejects({"ledger_ingest", "--log-level", "loud"}, "--log-level") ||
        !rejects({"ledger_ingest", "--audit=maybe"}, "--audit")) {
        return 1;
    }

    return 0;
}
