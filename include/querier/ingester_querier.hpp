#pragma once

#include "client/ireplica_client.hpp"
#include "client/ireplica_client_pool.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "querier/matchers.hpp"
#include "querier/query_iterators.hpp"
#include "querier/query_session.hpp"
#include "querier/scatter_gather.hpp"
#include "ring/ireplication_topology.hpp"

#include <chrono>
#include <format>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace logfanout {

struct SelectLogParams {
    QueryRequest request;
};

struct SelectSampleParams {
    SampleQueryRequest request;
};

using TailClients = std::unordered_map<std::string, std::shared_ptr<ITailStream>>;

/**
 * @brief Queries the ingesters holding not-yet-flushed log data
 *
 * Every operation picks a topology (whole read ring, the tenant's partition
 * shard, or the replicas already used earlier in the session), fans out via
 * ScatterGather and merges the per-replica answers.
 *
 * Thread-safe: holds only immutable configuration and shared collaborators.
 */
class IngesterQuerier {
public:
    IngesterQuerier(QuerierConfig config,
                    std::shared_ptr<IReplicationTopology> topology,
                    std::shared_ptr<IReplicaClientPool> pool,
                    ShardCountLookup shard_count_for_tenant);

    /// One lazy iterator per answering ingester, unmerged
    [[nodiscard]] Result<std::vector<std::unique_ptr<EntryIterator>>> select_logs(
        const QuerySession& session, const SelectLogParams& params) const;

    [[nodiscard]] Result<std::vector<std::unique_ptr<SampleIterator>>> select_samples(
        const QuerySession& session, const SelectSampleParams& params) const;

    /// Label names/values, one list per ingester; deduplication is the caller's job
    [[nodiscard]] Result<std::vector<std::vector<std::string>>> label(
        const QuerySession& session, const LabelRequest& req) const;

    [[nodiscard]] Result<TailClients> tail(
        const QuerySession& session, const TailRequest& req) const;

    /**
     * @brief Open tail streams to ACTIVE ingesters not yet connected
     * @param connected_addrs Ingesters the tailer already streams from
     * @return New streams keyed by address; empty when nothing is missing
     */
    [[nodiscard]] Result<TailClients> tail_disconnected_ingesters(
        const QuerySession& session, const TailRequest& req,
        const std::vector<std::string>& connected_addrs) const;

    [[nodiscard]] Result<std::vector<std::vector<SeriesIdentifier>>> series(
        const QuerySession& session, const SeriesRequest& req) const;

    /// Active tailers per ACTIVE ingester; any failure fails the call
    [[nodiscard]] Result<std::vector<uint32_t>> tailers_count(const QuerySession& session) const;

    /**
     * @brief Chunk IDs matching the selector
     *
     * In a partitioned session this asks exactly the ingesters that answered
     * the previous step. IDs are concatenated without deduplication.
     */
    [[nodiscard]] Result<std::vector<std::string>> get_chunk_ids(
        const QuerySession& session, Timestamp from, Timestamp through,
        const std::vector<LabelMatcher>& matchers) const;

    /// Summed index stats; zero stats when the ingesters predate the RPC
    [[nodiscard]] Result<IndexStats> stats(
        const QuerySession& session, Timestamp from, Timestamp through,
        const std::vector<LabelMatcher>& matchers) const;

    /// Top-limit volumes; empty response when the ingesters predate the RPC
    [[nodiscard]] Result<VolumeResponse> volume(
        const QuerySession& session, Timestamp from, Timestamp through, int32_t limit,
        const std::vector<std::string>& target_labels, const std::string& aggregate_by,
        const std::vector<LabelMatcher>& matchers) const;

    [[nodiscard]] Result<LabelToValuesResponse> detected_labels(
        const QuerySession& session, const DetectedLabelsRequest& req) const;

    /**
     * @brief Run call against the ingesters selected for this session
     *
     * Partitioned mode: marks the session partitioned and fans out over the
     * tenant's partition sets. Otherwise: the read replica set, default quorum.
     */
    template<typename T>
    [[nodiscard]] Result<TaggedResponses<T>> for_all_ingesters(
        const QuerySession& session, ReplicaCall<T> call) const;

    [[nodiscard]] const QuerierConfig& config() const { return config_; }

private:
    // Tenant's partition sets; IDENTITY_RESOLUTION_ERROR, CONFIG_ERROR or TOPOLOGY_ERROR on failure
    [[nodiscard]] Result<std::vector<ReplicaSet>> resolve_partition_sets(
        const QuerySession& session) const;

    QuerierConfig config_;
    std::shared_ptr<IReplicationTopology> topology_;
    ScatterGather scatter_gather_;
    ShardCountLookup shard_count_for_tenant_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T>
Result<TaggedResponses<T>> IngesterQuerier::for_all_ingesters(
    const QuerySession& session, ReplicaCall<T> call) const {

    using Out = Result<TaggedResponses<T>>;

    if (config_.query_partition_ingesters) {
        session.partition_context()->set_is_partitioned(true);
        auto sets = resolve_partition_sets(session);
        if (sets.is_error()) {
            return Out::error_from(sets);
        }
        return scatter_gather_.execute_on_partitions<T>(
            session, std::move(sets.value()), std::move(call));
    }

    auto set = topology_->replicas_for_read();
    if (set.is_error()) {
        utils::log::warn(std::format("Cannot resolve ingesters for read: {}", set.error_message()));
        return Out::error_from(set);
    }
    return scatter_gather_.execute_on_set<T>(
        session, set.value(), QuorumPolicy{}, std::move(call));
}

} // namespace logfanout
