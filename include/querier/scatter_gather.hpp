#pragma once

#include "client/ireplica_client.hpp"
#include "client/ireplica_client_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "querier/concurrency.hpp"
#include "querier/partition_context.hpp"
#include "querier/query_session.hpp"
#include "querier/quorum_tracker.hpp"
#include "ring/replica_set.hpp"

#include <condition_variable>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace logfanout {

// One successful replica answer, tagged with where it came from
template<typename T>
struct TaggedResponse {
    std::string addr;
    T response;
};

template<typename T>
using TaggedResponses = std::vector<TaggedResponse<T>>;

// The RPC to run against a single replica
template<typename T>
using ReplicaCall = std::function<Result<T>(const CallContext&, IReplicaClient&)>;

namespace detail {

template<typename T>
struct FanOutState {
    FanOutState(const ReplicaSet& set, QuorumPolicy policy)
        : instances(set.instances),
          tracker(set, policy),
          stops(set.instances.size()),
          results(set.instances.size()) {}

    std::mutex mutex;
    std::condition_variable_any cv;
    std::vector<ReplicaDescriptor> instances;
    QuorumTracker tracker;
    std::vector<std::stop_source> stops;        // One per instance
    std::vector<std::optional<T>> results;      // Accepted answers, by instance index
    std::optional<Error> last_error;
    bool finished = false;                      // Outcome decided; later answers are stragglers

    std::shared_ptr<IReplicaClientPool> pool;
    ReplicaCall<T> call;
    std::shared_ptr<PartitionContext> partition;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

// Caller holds state->mutex. Drops every accepted answer that is not part of
// the returned quorum (all of them unless kept_quorum) and cancels every call
// outside it. Contributing calls keep their context: streams they opened stay live.
template<typename T>
void finish_locked(FanOutState<T>& state, bool kept_quorum) {
    state.finished = true;
    for (size_t i = 0; i < state.results.size(); ++i) {
        if (!state.results[i]) continue;
        if (kept_quorum && state.tracker.contributes(i)) continue;
        state.partition->remove_client(state.instances[i].addr);
        state.results[i].reset();
    }
    for (size_t i = 0; i < state.stops.size(); ++i) {
        if (kept_quorum && state.tracker.contributes(i)) continue;
        state.stops[i].request_stop();
    }
    state.cv.notify_all();
}

template<typename T>
void launch_call(const std::shared_ptr<FanOutState<T>>& state, size_t idx);

template<typename T>
void complete_call(const std::shared_ptr<FanOutState<T>>& state, size_t idx,
                   std::shared_ptr<IReplicaClient> client, Result<T> response) {
    const auto& addr = state->instances[idx].addr;

    std::lock_guard lock(state->mutex);
    if (state->finished) {
        // Straggler: never part of the answer
        if (response.is_ok()) {
            state->partition->remove_client(addr);
        }
        return;
    }

    if (response.is_ok()) {
        state->tracker.record_success(idx);
        state->results[idx] = std::move(response.value());
        state->partition->add_client(std::move(client), addr);
        if (state->tracker.succeeded()) {
            finish_locked(*state, true);
        }
        return;
    }

    state->last_error = response.to_error().wrap(std::format("ingester {}", addr));
    const auto escalate = state->tracker.record_failure(idx);
    if (state->tracker.failed()) {
        finish_locked(*state, false);
        return;
    }
    for (size_t next : escalate) {
        launch_call(state, next);
    }
}

template<typename T>
void launch_call(const std::shared_ptr<FanOutState<T>>& state, size_t idx) {
    std::thread([state, idx] {
        const auto& addr = state->instances[idx].addr;
        auto client = state->pool->client_for(addr);
        if (client.is_error()) {
            complete_call(state, idx, nullptr, Result<T>::error_from(client));
            return;
        }

        const CallContext ctx{state->stops[idx].get_token(), state->deadline};
        auto response = state->call(ctx, *client.value());
        complete_call(state, idx, client.value(), std::move(response));
    }).detach();
}

} // namespace detail

/**
 * @brief Issues one RPC per replica concurrently and gathers a quorum
 *
 * Every replica call runs as its own task. Reaching quorum cancels the calls
 * that have not contributed and returns immediately; answers arriving later
 * are discarded. Accepted answers are recorded in the session's partition
 * context, and any answer left out of the final result is removed from it
 * again, so the context ends up holding exactly the replicas that were used.
 *
 * Errors: when the quorum becomes unreachable, the last replica error is
 * returned with its category kept and "ingester <addr>" context prepended.
 * Session deadline / cancellation yields DEADLINE_EXCEEDED / CANCELLED.
 * Partial results are never returned alongside an error.
 */
class ScatterGather {
public:
    explicit ScatterGather(std::shared_ptr<IReplicaClientPool> pool)
        : pool_(std::move(pool)) {}

    /**
     * @brief Direct fan-out over one replica set
     * @return Answers of the replicas forming the quorum, in instance order
     */
    template<typename T>
    [[nodiscard]] Result<TaggedResponses<T>> execute_on_set(
        const QuerySession& session, const ReplicaSet& set,
        QuorumPolicy policy, ReplicaCall<T> call) const;

    /**
     * @brief Direct fan-out over every partition set, concurrently
     *
     * Each set is one partition, so requests are minimized. Any partition
     * failing fails the whole call.
     */
    template<typename T>
    [[nodiscard]] Result<TaggedResponses<T>> execute_on_partitions(
        const QuerySession& session, std::vector<ReplicaSet> sets,
        ReplicaCall<T> call) const;

    /**
     * @brief Re-run against exactly the replicas recorded in the session
     *
     * No quorum: every recorded replica is asked and any failure fails the call.
     */
    template<typename T>
    [[nodiscard]] Result<TaggedResponses<T>> replay_on_used_replicas(
        const QuerySession& session, ReplicaCall<T> call) const;

private:
    std::shared_ptr<IReplicaClientPool> pool_;
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename T>
Result<TaggedResponses<T>> ScatterGather::execute_on_set(
    const QuerySession& session, const ReplicaSet& set,
    QuorumPolicy policy, ReplicaCall<T> call) const {

    using Out = Result<TaggedResponses<T>>;
    if (set.empty()) return Out::ok({});

    auto state = std::make_shared<detail::FanOutState<T>>(set, policy);
    state->pool = pool_;
    state->call = std::move(call);
    state->partition = session.partition_context();
    state->deadline = session.deadline;

    std::unique_lock lock(state->mutex);
    for (size_t idx : state->tracker.initial_requests()) {
        detail::launch_call(state, idx);
    }

    const bool decided = detail::wait_until_done(state->cv, lock, session,
        [&] { return state->finished; });

    if (!decided) {
        detail::finish_locked(*state, false);
        const auto err = detail::interrupted_error(session);
        utils::log::warn(std::format("Fan-out over {} ingesters abandoned: {}",
            set.instances.size(), err.message));
        return Out::error(err);
    }

    if (state->tracker.failed()) {
        const auto err = state->last_error.value_or(
            Error{ErrorCategory::INTERNAL_ERROR, "quorum failed without a replica error"});
        utils::log::warn(std::format("Fan-out over {} ingesters failed [{}]: {}",
            set.instances.size(), error_category_to_string(err.category), err.message));
        return Out::error(err);
    }

    TaggedResponses<T> responses;
    responses.reserve(state->tracker.issued_count());
    for (size_t i = 0; i < state->results.size(); ++i) {
        if (!state->results[i]) continue;
        responses.push_back(TaggedResponse<T>{state->instances[i].addr, std::move(*state->results[i])});
        state->results[i].reset();
    }

    utils::log::debug(std::format("Fan-out reached quorum with {} of {} ingesters",
        responses.size(), set.instances.size()));
    return Out::ok(std::move(responses));
}

template<typename T>
Result<TaggedResponses<T>> ScatterGather::execute_on_partitions(
    const QuerySession& session, std::vector<ReplicaSet> sets,
    ReplicaCall<T> call) const {

    const QuorumPolicy policy{.minimize_requests = true};
    const ScatterGather self = *this;

    JobFunction<ReplicaSet, TaggedResponse<T>> per_partition =
        [self, policy, call](const QuerySession& job_session, const ReplicaSet& set) {
            return self.execute_on_set<T>(job_session, set, policy, call);
        };

    return for_each_job_merge_results<ReplicaSet, TaggedResponse<T>>(
        session, std::move(sets), std::move(per_partition));
}

template<typename T>
Result<TaggedResponses<T>> ScatterGather::replay_on_used_replicas(
    const QuerySession& session, ReplicaCall<T> call) const {

    auto used = session.partition_context()->used_replicas();

    JobFunction<UsedReplica, TaggedResponse<T>> per_replica =
        [call](const QuerySession& job_session, const UsedReplica& replica)
            -> Result<TaggedResponses<T>> {
            auto response = call(job_session.call_context(), *replica.client);
            if (response.is_error()) {
                return Result<TaggedResponses<T>>::error(
                    response.to_error().wrap(std::format("ingester {}", replica.addr)));
            }
            TaggedResponses<T> out;
            out.push_back(TaggedResponse<T>{replica.addr, std::move(response.value())});
            return Result<TaggedResponses<T>>::ok(std::move(out));
        };

    return for_each_job_merge_results<UsedReplica, TaggedResponse<T>>(
        session, std::move(used), std::move(per_replica));
}

} // namespace logfanout
