#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/integrity/IntegrityCursor.h"
#include "core/integrity/WriteVerifier.h"
#include "TestSupport.hpp"

using core::integrity::IntegrityCursor;
using core::integrity::WriteVerifier;
using ldg::testing::TempDir;

namespace {

domain::StreamKey streamKey() {
    domain::StreamKey key;
    key.migrationId = 1;
    key.synchronizerId = "global-domain::1220aa";
    return key;
}

void touch(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << "x";
}

bool countsOnlyFinishedPartitionFiles() {
    TempDir data("verify-count");
    touch(data / "migration=1/year=2024/month=6/day=3/updates-1.pb.gz");
    touch(data / "migration=1/year=2024/month=6/day=3/events-1.pb.gz");
    touch(data / "migration=1/year=2024/month=6/day=3/events-2.pb.gz");
    touch(data / "migration=1/year=2024/month=6/day=3/updates-3.pb.gz.tmp");
    touch(data / "migration=1/notes.txt");

    WriteVerifier verifier(data.path());
    const auto counts = verifier.countFiles();
    if (counts.updates != 1 || counts.events != 2) {
        std::cerr << "Expected 1 update file and 2 event files, got " << counts.updates << " and " << counts.events
                  << "\n";
        return false;
    }
    return true;
}

bool unacknowledgedWriteLeavesCursor() {
    TempDir data("verify-nack");
    TempDir cursors("verify-nack-cursor");
    IntegrityCursor cursor(cursors.path(), streamKey());
    cursor.recordPending(10, 20);

    WriteVerifier verifier(data.path());
    const auto result = verifier.verifyAndConfirm(
        cursor, 10, 20, 5000, [] {}, [] { return false; });
    if (result.success || cursor.state().confirmedUpdates != 0 || !cursor.hasPending() ||
        cursor.getResumePosition()) {
        std::cerr << "A failed acknowledgement must not touch the confirmed state\n";
        return false;
    }
    return true;
}

bool acknowledgedWithoutFilesLeavesCursor() {
    TempDir data("verify-nofiles");
    TempDir cursors("verify-nofiles-cursor");
    IntegrityCursor cursor(cursors.path(), streamKey());
    cursor.recordPending(3, 0);

    WriteVerifier verifier(data.path());
    const auto result = verifier.verifyAndConfirm(
        cursor, 3, 0, 5000, [] {}, [] { return true; });
    if (result.success || cursor.getResumePosition()) {
        std::cerr << "Confirmation requires new files when something was pending\n";
        return false;
    }
    return true;
}

bool confirmsWhenFilesAppear() {
    TempDir data("verify-ok");
    TempDir cursors("verify-ok-cursor");
    IntegrityCursor cursor(cursors.path(), streamKey());
    cursor.recordPending(4, 8);

    WriteVerifier verifier(data.path());
    const auto baseline = verifier.countFiles();
    const auto result = verifier.verifyAndConfirm(
        cursor, 4, 8, 7000,
        [&] {
            touch(data / "migration=1/year=2024/month=1/day=1/updates-a.pb.gz");
            touch(data / "migration=1/year=2024/month=1/day=1/events-a.pb.gz");
        },
        [] { return true; }, baseline);
    if (!result.success || result.newFiles != 2 || result.confirmedUpdates != 4) {
        std::cerr << "Expected a confirmed write with two new files\n";
        return false;
    }
    const auto onDisk = IntegrityCursor::readFile(cursor.path());
    if (!onDisk || onDisk->confirmedUpdates != 4 || onDisk->confirmedEvents != 8 ||
        onDisk->lastConfirmedBefore.value_or(0) != 7000 || cursor.hasPending()) {
        std::cerr << "Confirmed counts were not persisted\n";
        return false;
    }
    return true;
}

bool nothingPendingStillAdvances() {
    TempDir data("verify-empty");
    TempDir cursors("verify-empty-cursor");
    IntegrityCursor cursor(cursors.path(), streamKey());

    WriteVerifier verifier(data.path());
    const auto result = verifier.verifyAndConfirm(cursor, 0, 0, 1234, {}, {});
    if (!result.success || cursor.getResumePosition().value_or(0) != 1234) {
        std::cerr << "An empty checkpoint should advance the marker\n";
        return false;
    }
    return true;
}

bool flushFailureIsReported() {
    TempDir data("verify-throw");
    TempDir cursors("verify-throw-cursor");
    IntegrityCursor cursor(cursors.path(), streamKey());
    cursor.recordPending(1, 0);

    WriteVerifier verifier(data.path());
    const auto result = verifier.verifyAndConfirm(
        cursor, 1, 0, 99, [] { throw std::runtime_error("disk full"); }, [] { return true; });
    if (result.success || cursor.getResumePosition()) {
        std::cerr << "A throwing flush must fail verification\n";
        return false;
    }
    return true;
}

bool waitTimesOut() {
    TempDir data("verify-timeout");
    WriteVerifier verifier(data.path());
    const auto started = std::chrono::steady_clock::now();
    if (verifier.waitForWrites(1, std::chrono::milliseconds(250))) {
        std::cerr << "No files were written, wait must fail\n";
        return false;
    }
    if (std::chrono::steady_clock::now() - started < std::chrono::milliseconds(250)) {
        std::cerr << "Wait returned before its timeout\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!countsOnlyFinishedPartitionFiles() || !unacknowledgedWriteLeavesCursor() ||
        !acknowledgedWithoutFilesLeavesCursor() || !confirmsWhenFilesAppear() || !nothingPendingStillAdvances() ||
        !flushFailureIsReported() || !waitTimesOut()) {
        return 1;
    }
    return 0;
}
