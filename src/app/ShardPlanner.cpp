#include "app/ShardPlanner.hpp"

#include <stdexcept>
#include <string>

namespace app {

domain::TimeRange ShardPlanner::shardRange(domain::TimestampMs minTime, domain::TimestampMs maxTime, int index,
                                           int total) {
    if (maxTime <= minTime) {
        throw std::invalid_argument("Shard planning needs a non-empty range, got min=" + std::to_string(minTime) +
                                    " max=" + std::to_string(maxTime));
    }
    if (total < 1 || index < 0 || index >= total) {
        throw std::invalid_argument("Shard index " + std::to_string(index) + " is outside 0.." +
                                    std::to_string(total - 1));
    }

    const domain::TimestampMs range = maxTime - minTime;
    const domain::TimestampMs shardMax = maxTime - (static_cast<domain::TimestampMs>(index) * range) / total;
    const domain::TimestampMs shardMin = maxTime - (static_cast<domain::TimestampMs>(index + 1) * range) / total;

    // Half-open slices: an older shard ends exactly where the newer one starts.
    domain::TimeRange slice;
    slice.start = shardMin;
    slice.end = shardMax;
    return slice;
}

}  // namespace app
