#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

#include "app/IngestSession.hpp"
#include "common/Config.hpp"
#include "domain/ILedgerSource.hpp"

namespace core {
class CancellationToken;
}

namespace infra::storage {
class DurableWriter;
}

namespace app {

struct BackfillReport {
    std::size_t migrations{0};
    std::size_t sessions{0};
    std::size_t completed{0};
    std::size_t alreadyComplete{0};
    std::size_t failed{0};
    std::uint64_t confirmedUpdates{0};
    std::uint64_t confirmedEvents{0};
    bool cancelled{false};

    bool allComplete() const noexcept { return !cancelled && failed == 0 && completed + alreadyComplete == sessions; }
};

// Drives one IngestSession per synchronizer range of every known migration (or of the
// configured one), limited to this process's shard.
class BackfillOrchestrator {
public:
    static constexpr int kMaxRescanRounds = 3;

    BackfillOrchestrator(const ldg::common::Config& config, domain::ILedgerSource& source,
                         infra::storage::DurableWriter& writer, core::CancellationToken& cancel);

    BackfillReport run();

    const std::vector<SessionResult>& sessions() const noexcept { return results_; }

private:
    void runMigration_(domain::MigrationId migrationId, BackfillReport& report);
    void runStream_(domain::MigrationId migrationId, const domain::SynchronizerRange& range, BackfillReport& report);

    const ldg::common::Config& config_;
    domain::ILedgerSource& source_;
    infra::storage::DurableWriter& writer_;
    core::CancellationToken& cancel_;
    std::set<domain::MigrationId> processed_;
    std::vector<SessionResult> results_;
};

}  // namespace app
