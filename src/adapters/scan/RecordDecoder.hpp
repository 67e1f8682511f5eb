#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include "domain/LedgerRecords.hpp"

namespace adapters::scan {

struct DecodedPage {
    std::vector<domain::LedgerUpdate> updates;
    std::size_t rejected{0};
    std::optional<domain::TimestampMs> oldest;
    std::optional<domain::TimestampMs> newest;
};

// Converts raw Scan API items into domain::LedgerUpdate. This is the only place that
// looks at the loosely typed payload.
class RecordDecoder {
public:
    // Migration and synchronizer of the request; used when an item does not carry its own.
    RecordDecoder(std::optional<domain::MigrationId> migrationId = std::nullopt, std::string synchronizerId = {});

    // std::nullopt when the item is neither a transaction nor a reassignment.
    std::optional<domain::LedgerUpdate> decode(const boost::json::value& item) const;

    DecodedPage decodePage(const boost::json::array& items) const;

private:
    std::optional<domain::MigrationId> migrationId_;
    std::string synchronizerId_;
};

}  // namespace adapters::scan
