#include "querier/ingester_querier.hpp"
#include "querier/response_mergers.hpp"

#include <format>
#include <unordered_set>

namespace logfanout {

IngesterQuerier::IngesterQuerier(QuerierConfig config,
                                 std::shared_ptr<IReplicationTopology> topology,
                                 std::shared_ptr<IReplicaClientPool> pool,
                                 ShardCountLookup shard_count_for_tenant)
    : config_(std::move(config)),
      topology_(std::move(topology)),
      scatter_gather_(std::move(pool)),
      shard_count_for_tenant_(std::move(shard_count_for_tenant)) {}

// ============================================================================
// Topology selection
// ============================================================================

Result<std::vector<ReplicaSet>> IngesterQuerier::resolve_partition_sets(
    const QuerySession& session) const {

    using Out = Result<std::vector<ReplicaSet>>;

    auto tenant = session.tenant();
    if (tenant.is_error()) {
        return Out::error_from(tenant);
    }

    if (!shard_count_for_tenant_) {
        return Out::error(ErrorCategory::CONFIG_ERROR, "no tenant shard count lookup configured");
    }
    const int shard_count = shard_count_for_tenant_(tenant.value());
    if (shard_count <= 0) {
        return Out::error(ErrorCategory::CONFIG_ERROR, std::format(
            "invalid partition shard count {} for tenant {}", shard_count, tenant.value()));
    }

    auto sets = topology_->sharded_partition_replica_sets(
        tenant.value(), shard_count, config_.query_ingesters_within,
        std::chrono::system_clock::now());
    if (sets.is_error()) {
        utils::log::warn(std::format("Cannot resolve partitions for tenant {}: {}",
            tenant.value(), sets.error_message()));
    }
    return sets;
}

// ============================================================================
// Streaming queries
// ============================================================================

Result<std::vector<std::unique_ptr<EntryIterator>>> IngesterQuerier::select_logs(
    const QuerySession& session, const SelectLogParams& params) const {

    using Stream = std::shared_ptr<IQueryStream>;
    using Out = Result<std::vector<std::unique_ptr<EntryIterator>>>;

    ReplicaCall<Stream> call = [req = params.request, stats = session.stats](
                                   const CallContext& ctx, IReplicaClient& client) {
        if (stats) stats->add_ingester_reached(1);
        return client.query(ctx, req);
    };

    auto resps = for_all_ingesters<Stream>(session, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<std::unique_ptr<EntryIterator>> iterators;
    iterators.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        iterators.push_back(std::make_unique<QueryClientIterator>(
            std::move(resp.response), params.request.direction));
    }
    return Out::ok(std::move(iterators));
}

Result<std::vector<std::unique_ptr<SampleIterator>>> IngesterQuerier::select_samples(
    const QuerySession& session, const SelectSampleParams& params) const {

    using Stream = std::shared_ptr<ISampleStream>;
    using Out = Result<std::vector<std::unique_ptr<SampleIterator>>>;

    ReplicaCall<Stream> call = [req = params.request, stats = session.stats](
                                   const CallContext& ctx, IReplicaClient& client) {
        if (stats) stats->add_ingester_reached(1);
        return client.query_sample(ctx, req);
    };

    auto resps = for_all_ingesters<Stream>(session, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<std::unique_ptr<SampleIterator>> iterators;
    iterators.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        iterators.push_back(std::make_unique<SampleQueryClientIterator>(std::move(resp.response)));
    }
    return Out::ok(std::move(iterators));
}

// ============================================================================
// Labels, tail, series
// ============================================================================

Result<std::vector<std::vector<std::string>>> IngesterQuerier::label(
    const QuerySession& session, const LabelRequest& req) const {

    using Out = Result<std::vector<std::vector<std::string>>>;

    ReplicaCall<LabelResponse> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.label(ctx, req);
    };

    auto resps = for_all_ingesters<LabelResponse>(session, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<std::vector<std::string>> results;
    results.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        results.push_back(std::move(resp.response.values));
    }
    return Out::ok(std::move(results));
}

Result<TailClients> IngesterQuerier::tail(
    const QuerySession& session, const TailRequest& req) const {

    using Stream = std::shared_ptr<ITailStream>;

    ReplicaCall<Stream> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.tail(ctx, req);
    };

    auto resps = for_all_ingesters<Stream>(session, std::move(call));
    if (resps.is_error()) {
        return Result<TailClients>::error_from(resps);
    }

    TailClients clients;
    for (auto& resp : resps.value()) {
        clients[resp.addr] = std::move(resp.response);
    }
    return Result<TailClients>::ok(std::move(clients));
}

Result<TailClients> IngesterQuerier::tail_disconnected_ingesters(
    const QuerySession& session, const TailRequest& req,
    const std::vector<std::string>& connected_addrs) const {

    using Stream = std::shared_ptr<ITailStream>;

    const std::unordered_set<std::string> connected(connected_addrs.begin(), connected_addrs.end());

    auto set = topology_->replicas_for_read();
    if (set.is_error()) {
        return Result<TailClients>::error_from(set);
    }

    // Missing ingesters, skipping those leaving or joining the ring
    ReplicaSet reconnect;
    for (const auto& instance : set.value().instances) {
        if (connected.contains(instance.addr)) continue;
        if (instance.state != InstanceState::ACTIVE) {
            utils::log::debug(std::format("Not tailing ingester {} in state {}",
                instance.addr, instance_state_to_string(instance.state)));
            continue;
        }
        reconnect.instances.push_back(instance);
    }

    if (reconnect.empty()) {
        return Result<TailClients>::ok({});
    }

    utils::log::info(std::format("Reconnecting tail to {} ingesters", reconnect.instances.size()));

    ReplicaCall<Stream> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.tail(ctx, req);
    };

    auto resps = scatter_gather_.execute_on_set<Stream>(
        session, reconnect, QuorumPolicy{}, std::move(call));
    if (resps.is_error()) {
        return Result<TailClients>::error_from(resps);
    }

    TailClients clients;
    for (auto& resp : resps.value()) {
        clients[resp.addr] = std::move(resp.response);
    }
    return Result<TailClients>::ok(std::move(clients));
}

Result<std::vector<std::vector<SeriesIdentifier>>> IngesterQuerier::series(
    const QuerySession& session, const SeriesRequest& req) const {

    using Out = Result<std::vector<std::vector<SeriesIdentifier>>>;

    ReplicaCall<SeriesResponse> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.series(ctx, req);
    };

    auto resps = for_all_ingesters<SeriesResponse>(session, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<std::vector<SeriesIdentifier>> acc;
    acc.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        acc.push_back(std::move(resp.response.series));
    }
    return Out::ok(std::move(acc));
}

Result<std::vector<uint32_t>> IngesterQuerier::tailers_count(const QuerySession& session) const {
    using Out = Result<std::vector<uint32_t>>;

    auto healthy = topology_->all_healthy_replicas_for_read();
    if (healthy.is_error()) {
        return Out::error_from(healthy);
    }

    // Counts must be exact: only ACTIVE ingesters, and every one must answer
    ReplicaSet active;
    for (const auto& instance : healthy.value().instances) {
        if (instance.state == InstanceState::ACTIVE) {
            active.instances.push_back(instance);
        }
    }
    if (active.empty()) {
        return Out::error(ErrorCategory::NO_HEALTHY_REPLICAS, "no active ingester found");
    }

    ReplicaCall<uint32_t> call = [](const CallContext& ctx, IReplicaClient& client) {
        return client.tailers_count(ctx);
    };

    auto resps = scatter_gather_.execute_on_set<uint32_t>(
        session, active, QuorumPolicy{}, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<uint32_t> counts;
    counts.reserve(resps.value().size());
    for (const auto& resp : resps.value()) {
        counts.push_back(resp.response);
    }
    return Out::ok(std::move(counts));
}

// ============================================================================
// Index lookups
// ============================================================================

Result<std::vector<std::string>> IngesterQuerier::get_chunk_ids(
    const QuerySession& session, Timestamp from, Timestamp through,
    const std::vector<LabelMatcher>& matchers) const {

    using Out = Result<std::vector<std::string>>;

    const ChunkIdsRequest req{matchers_to_string(matchers), from, through};
    ReplicaCall<ChunkIdsResponse> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.get_chunk_ids(ctx, req);
    };

    // Same ingesters as the previous step of a partitioned query
    auto resps = session.partition_context()->is_partitioned()
        ? scatter_gather_.replay_on_used_replicas<ChunkIdsResponse>(session, std::move(call))
        : for_all_ingesters<ChunkIdsResponse>(session, std::move(call));
    if (resps.is_error()) {
        return Out::error_from(resps);
    }

    std::vector<std::string> chunk_ids;
    for (auto& resp : resps.value()) {
        auto& ids = resp.response.chunk_ids;
        chunk_ids.insert(chunk_ids.end(),
            std::make_move_iterator(ids.begin()), std::make_move_iterator(ids.end()));
    }
    return Out::ok(std::move(chunk_ids));
}

Result<IndexStats> IngesterQuerier::stats(
    const QuerySession& session, Timestamp from, Timestamp through,
    const std::vector<LabelMatcher>& matchers) const {

    const IndexStatsRequest req{from, through, matchers_to_string(matchers)};
    ReplicaCall<IndexStats> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.get_stats(ctx, req);
    };

    auto resps = for_all_ingesters<IndexStats>(session, std::move(call));
    if (resps.is_error()) {
        if (is_unimplemented_call_error(resps.error_category())) {
            // Older ingesters
            utils::log::debug(std::format("Index stats not implemented by ingesters: {}",
                resps.error_message()));
            return Result<IndexStats>::ok(IndexStats{});
        }
        return Result<IndexStats>::error_from(resps);
    }

    std::vector<IndexStats> casted;
    casted.reserve(resps.value().size());
    for (const auto& resp : resps.value()) {
        casted.push_back(resp.response);
    }
    return Result<IndexStats>::ok(merge_stats(casted));
}

Result<VolumeResponse> IngesterQuerier::volume(
    const QuerySession& session, Timestamp from, Timestamp through, int32_t limit,
    const std::vector<std::string>& target_labels, const std::string& aggregate_by,
    const std::vector<LabelMatcher>& matchers) const {

    VolumeRequest req;
    req.from = from;
    req.through = through;
    req.matchers = matchers_to_string(matchers);
    req.limit = limit;
    req.target_labels = target_labels;
    req.aggregate_by = aggregate_by;

    ReplicaCall<VolumeResponse> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.get_volume(ctx, req);
    };

    auto resps = for_all_ingesters<VolumeResponse>(session, std::move(call));
    if (resps.is_error()) {
        if (is_unimplemented_call_error(resps.error_category())) {
            // Older ingesters
            utils::log::debug(std::format("Volume not implemented by ingesters: {}",
                resps.error_message()));
            return Result<VolumeResponse>::ok(VolumeResponse{});
        }
        return Result<VolumeResponse>::error_from(resps);
    }

    std::vector<VolumeResponse> casted;
    casted.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        casted.push_back(std::move(resp.response));
    }
    return Result<VolumeResponse>::ok(merge_volumes(casted, limit));
}

Result<LabelToValuesResponse> IngesterQuerier::detected_labels(
    const QuerySession& session, const DetectedLabelsRequest& req) const {

    using Resp = std::shared_ptr<LabelToValuesResponse>;

    ReplicaCall<Resp> call = [req](const CallContext& ctx, IReplicaClient& client) {
        return client.get_detected_labels(ctx, req);
    };

    auto resps = for_all_ingesters<Resp>(session, std::move(call));
    if (resps.is_error()) {
        utils::log::error(std::format("Error getting detected labels: {}", resps.error_message()));
        return Result<LabelToValuesResponse>::error_from(resps);
    }

    std::vector<Resp> casted;
    casted.reserve(resps.value().size());
    for (auto& resp : resps.value()) {
        casted.push_back(std::move(resp.response));
    }
    return Result<LabelToValuesResponse>::ok(merge_detected_labels(casted));
}

} // namespace logfanout
