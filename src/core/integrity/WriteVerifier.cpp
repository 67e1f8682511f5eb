#include "core/integrity/WriteVerifier.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "core/Cancellation.h"
#include "core/integrity/IntegrityCursor.h"
#include "logging/Log.h"

namespace core::integrity {
namespace {

constexpr auto kLogCategory = logging::LogCategory::INTEGRITY;
constexpr const char* kFileSuffix = ".pb.gz";

bool hasPrefixAndSuffix(const std::string& name, const char* prefix) {
    const std::string p{prefix};
    const std::string s{kFileSuffix};
    return name.size() > p.size() + s.size() && name.compare(0, p.size(), p) == 0 &&
           name.compare(name.size() - s.size(), s.size(), s) == 0;
}

}  // namespace

WriteVerifier::WriteVerifier(std::filesystem::path dataRoot, core::CancellationToken* cancel)
    : dataRoot_(std::move(dataRoot)), cancel_(cancel) {}

FileCounts WriteVerifier::countFiles() const {
    FileCounts counts;
    std::error_code ec;
    if (!std::filesystem::exists(dataRoot_, ec)) {
        return counts;
    }

    std::filesystem::recursive_directory_iterator it(
        dataRoot_, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        if (it->is_regular_file(ec)) {
            const std::string name = it->path().filename().string();
            if (hasPrefixAndSuffix(name, "updates-")) {
                ++counts.updates;
            } else if (hasPrefixAndSuffix(name, "events-")) {
                ++counts.events;
            }
        }
        it.increment(ec);
    }
    if (ec) {
        LOG_WARN(kLogCategory, "File scan under %s stopped early: %s", dataRoot_.string().c_str(),
                 ec.message().c_str());
    }
    return counts;
}

bool WriteVerifier::waitForWrites(std::size_t expectedNewFiles, std::chrono::milliseconds timeout,
                                  std::optional<FileCounts> baseline) const {
    const std::size_t start = (baseline ? *baseline : countFiles()).total();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const std::size_t current = countFiles().total();
        if (current >= start + expectedNewFiles) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN(kLogCategory, "Timed out waiting for %zu new files (saw %zu)", expectedNewFiles,
                     current - std::min(current, start));
            return false;
        }
        if (cancel_ != nullptr) {
            if (!cancel_->sleepFor(kPollInterval)) {
                return false;
            }
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }
    }
}

VerifyResult WriteVerifier::verifyAndConfirm(IntegrityCursor& cursor, std::uint64_t pendingUpdates,
                                             std::uint64_t pendingEvents, domain::TimestampMs beforeTimestamp,
                                             const FlushFn& flushFn, const WaitFn& waitFn,
                                             std::optional<FileCounts> baseline) const {
    VerifyResult result;
    const FileCounts before = baseline ? *baseline : countFiles();

    bool acknowledged = false;
    try {
        if (flushFn) {
            flushFn();
        }
        acknowledged = waitFn ? waitFn() : true;
    } catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "Write flush failed for %s: %s", cursor.state().id.c_str(), ex.what());
        return result;
    }

    const FileCounts after = countFiles();
    result.newFiles = after.total() - std::min(after.total(), before.total());

    const bool nothingPending = pendingUpdates == 0 && pendingEvents == 0;
    if (!acknowledged || (result.newFiles == 0 && !nothingPending)) {
        LOG_WARN(kLogCategory,
                 "Write verification failed for %s: ack=%s, %zu new files, pending %llu updates %llu events",
                 cursor.state().id.c_str(), acknowledged ? "yes" : "no", result.newFiles,
                 static_cast<unsigned long long>(pendingUpdates), static_cast<unsigned long long>(pendingEvents));
        return result;
    }

    cursor.confirmWrite(pendingUpdates, pendingEvents, beforeTimestamp);
    result.success = true;
    result.confirmedUpdates = pendingUpdates;
    result.confirmedEvents = pendingEvents;
    LOG_DEBUG(kLogCategory, "Confirmed %llu updates, %llu events for %s (%zu new files)",
              static_cast<unsigned long long>(pendingUpdates), static_cast<unsigned long long>(pendingEvents),
              cursor.state().id.c_str(), result.newFiles);
    return result;
}

}  // namespace core::integrity
