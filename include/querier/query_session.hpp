#pragma once

#include "client/ireplica_client.hpp"
#include "core/error.hpp"
#include "querier/partition_context.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace logfanout {

// Per-query counters reported back to the coordinator
struct QueryStats {
    std::atomic<uint64_t> ingesters_reached{0};

    void add_ingester_reached(uint64_t n) {
        ingesters_reached.fetch_add(n, std::memory_order_relaxed);
    }
};

/**
 * @brief Request-scoped state threaded through every fan-out call
 *
 * Owned by the coordinator for one logical query and passed by reference.
 * Copies share the partition context and stats (shared_ptr), so a copy with a
 * narrower stop token still records into the same session.
 */
struct QuerySession {
    std::optional<std::string> tenant_id;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stop_token;
    std::shared_ptr<PartitionContext> partition;
    std::shared_ptr<QueryStats> stats;

    /// Fresh session with its own partition context and stats
    [[nodiscard]] static QuerySession create(std::optional<std::string> tenant = std::nullopt) {
        QuerySession session;
        session.tenant_id = std::move(tenant);
        session.partition = std::make_shared<PartitionContext>();
        session.stats = std::make_shared<QueryStats>();
        return session;
    }

    /// The session's context, or a throwaway empty one when none is attached
    [[nodiscard]] std::shared_ptr<PartitionContext> partition_context() const {
        return partition ? partition : std::make_shared<PartitionContext>();
    }

    [[nodiscard]] Result<std::string> tenant() const {
        if (!tenant_id || tenant_id->empty()) {
            return Result<std::string>::error(ErrorCategory::IDENTITY_RESOLUTION_ERROR,
                "no org id in query session");
        }
        return Result<std::string>::ok(*tenant_id);
    }

    void add_ingester_reached(uint64_t n) const {
        if (stats) stats->add_ingester_reached(n);
    }

    [[nodiscard]] CallContext call_context() const {
        return CallContext{stop_token, deadline};
    }

    void set_timeout(std::chrono::milliseconds timeout) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }
};

} // namespace logfanout
