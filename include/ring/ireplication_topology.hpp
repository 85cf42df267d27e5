#pragma once

#include "core/error.hpp"
#include "ring/replica_set.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace logfanout {

/**
 * @brief Read-side view of the ingester ring (membership lives elsewhere)
 *
 * Implementations fail with ErrorCategory::TOPOLOGY_ERROR. The engine never
 * retries a topology failure.
 */
class IReplicationTopology {
public:
    virtual ~IReplicationTopology() = default;

    /// Replica set for a read, with the ring's quorum requirements applied
    [[nodiscard]] virtual Result<ReplicaSet> replicas_for_read() = 0;

    /// Every healthy replica, no quorum slack
    [[nodiscard]] virtual Result<ReplicaSet> all_healthy_replicas_for_read() = 0;

    /**
     * @brief One replica set per partition of the tenant's shuffle shard
     * @param lookback Partitions owned by the tenant within this window are included
     */
    [[nodiscard]] virtual Result<std::vector<ReplicaSet>> sharded_partition_replica_sets(
        const std::string& tenant_id, int shard_count,
        std::chrono::milliseconds lookback,
        std::chrono::system_clock::time_point now) = 0;
};

} // namespace logfanout
