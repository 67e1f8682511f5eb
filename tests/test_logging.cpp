#include <filesystem>
#include <iostream>

#include "config/Config.h"
#include "logging/Log.h"
#include "TestSupport.hpp"

namespace {

constexpr auto kCat = logging::LogCategory::APP;

bool parsesLevels() {
    if (config::parseLogLevel("WARNING") != config::LogLevel::Warn ||
        config::parseLogLevel("Trace") != config::LogLevel::Trace || config::parseLogLevel("verbose")) {
        std::cerr << "Level names must parse case-insensitively and reject unknown names\n";
        return false;
    }
    if (!config::isEnabled(config::LogLevel::Error, config::LogLevel::Info) ||
        config::isEnabled(config::LogLevel::Debug, config::LogLevel::Info)) {
        std::cerr << "Severity threshold comparison is inverted\n";
        return false;
    }
    return true;
}

bool debugFileRotates() {
    ldg::testing::TempDir dir("logging");
    logging::LogOptions options;
    options.level = config::LogLevel::Debug;
    options.debugFile = dir / "debug.log";
    options.debugFileMaxBytes = 512;
    logging::Log::configure(options);

    const auto before = logging::Log::stats().rotations;
    for (int i = 0; i < 60; ++i) {
        LOG_DEBUG(kCat, "debug line %d with some padding to fill the file", i);
    }
    logging::Log::flush();

    const bool rotated = std::filesystem::exists(dir / "debug.log.1");
    const auto after = logging::Log::stats().rotations;

    logging::LogOptions restore;
    restore.debugFile.clear();
    logging::Log::configure(restore);

    if (!std::filesystem::exists(dir / "debug.log") || !rotated || after <= before) {
        std::cerr << "Expected the debug file to rotate, rotations " << before << " -> " << after << "\n";
        return false;
    }
    if (std::filesystem::file_size(dir / "debug.log") > 512) {
        std::cerr << "Active debug file exceeds its size limit\n";
        return false;
    }
    return true;
}

bool throttledLinesAreCounted() {
    logging::Log::set_log_level(config::LogLevel::Info);
    const auto before = logging::Log::stats().suppressed;
    for (int i = 0; i < 3; ++i) {
        LOG_INFO_EVERY("test-throttle", 60000, kCat, "throttled line %d", i);
    }
    logging::Log::flush();
    const auto after = logging::Log::stats().suppressed;
    if (after - before != 2) {
        std::cerr << "Expected 2 throttled lines, got " << (after - before) << "\n";
        return false;
    }
    return true;
}

bool belowThresholdIsSkipped() {
    logging::Log::set_log_level(config::LogLevel::Warn);
    logging::Log::flush();
    const auto before = logging::Log::stats().written;
    LOG_INFO(kCat, "not written");
    LOG_DEBUG(kCat, "not written either");
    logging::Log::flush();
    const auto after = logging::Log::stats().written;
    logging::Log::set_log_level(config::LogLevel::Info);
    if (after != before) {
        std::cerr << "Lines below the level must not reach a sink\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!parsesLevels() || !debugFileRotates() || !throttledLinesAreCounted() || !belowThresholdIsSkipped()) {
        return 1;
    }
    return 0;
}
