#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace logfanout {

// ============================================================================
// Configuration Types
// ============================================================================

struct QuerierConfig {
    bool query_partition_ingesters = false;     // Tenant-sharded partition fan-out
    std::chrono::milliseconds query_ingesters_within{std::chrono::hours(3)};
};

struct TenantShardOverride {
    std::string tenant;
    int shard_size = 0;
};

struct LimitsConfig {
    int ingestion_partitions_tenant_shard_size = 1;
    std::vector<TenantShardOverride> overrides;
};

struct LoggingConfig {
    std::string level = "info";
};

struct FanoutConfig {
    QuerierConfig querier;
    LimitsConfig limits;
    LoggingConfig logging;
};

// Shard count of a tenant's shuffle shard
using ShardCountLookup = std::function<int(const std::string& tenant_id)>;

} // namespace logfanout
