#pragma once

#include "domain/Types.h"

namespace app {

class ShardPlanner {
public:
    // Slice `index` of `total` equal slices of [minTime, maxTime), counted from the newest end.
    // Slices are half-open, so each millisecond belongs to exactly one shard.
    // Throws std::invalid_argument for an empty range or an index outside [0, total).
    static domain::TimeRange shardRange(domain::TimestampMs minTime, domain::TimestampMs maxTime, int index,
                                        int total);
};

}  // namespace app
