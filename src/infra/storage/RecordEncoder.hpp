#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "domain/LedgerRecords.hpp"
#include "ledger.pb.h"

namespace infra::storage {

enum class RecordType { Updates, Events };

// "updates" / "events"; also the file name prefix.
const char* to_string(RecordType type) noexcept;

struct EncodedBatch {
    std::string bytes;  // gzip stream
    std::size_t rawBytes{0};
    std::size_t recordCount{0};
};

// Protobuf batch serialization wrapped in gzip framing.
class RecordEncoder {
public:
    explicit RecordEncoder(int gzipLevel = 1);

    EncodedBatch encodeUpdates(const std::vector<domain::LedgerUpdate>& updates) const;
    EncodedBatch encodeEvents(const std::vector<domain::LedgerEvent>& events) const;

    // Throw std::runtime_error on corrupt input.
    static ledger::UpdateBatch decodeUpdates(std::string_view compressed);
    static ledger::EventBatch decodeEvents(std::string_view compressed);

    static std::string gzip(std::string_view data, int level);
    static std::string gunzip(std::string_view data);

    int level() const noexcept { return level_; }

private:
    int level_;
};

}  // namespace infra::storage
