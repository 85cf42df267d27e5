#pragma once

#include "client/ireplica_client.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace logfanout {

// An ingester that answered a partitioned fan-out in this session
struct UsedReplica {
    std::shared_ptr<IReplicaClient> client;
    std::string addr;
};

/**
 * @brief Tracks which ingesters served the current partitioned query
 *
 * One per logical request. While partitioned, the executor records every
 * replica whose answer was kept, so a follow-up step (chunk ID lookup after a
 * sharded select) can be routed to exactly the same partitions.
 *
 * add_client / remove_client are no-ops unless partitioned. The mutex is
 * only held for map/flag access, never across a remote call.
 */
class PartitionContext {
public:
    PartitionContext() = default;

    PartitionContext(const PartitionContext&) = delete;
    PartitionContext& operator=(const PartitionContext&) = delete;

    void set_is_partitioned(bool partitioned);
    [[nodiscard]] bool is_partitioned() const;

    void add_client(std::shared_ptr<IReplicaClient> client, const std::string& addr);
    void remove_client(const std::string& addr);

    /// Copy of the recorded replicas, taken under the lock
    [[nodiscard]] std::vector<UsedReplica> used_replicas() const;
    [[nodiscard]] std::vector<std::string> used_addresses() const;
    [[nodiscard]] size_t used_count() const;

private:
    mutable std::mutex mutex_;
    bool is_partitioned_ = false;
    std::unordered_map<std::string, UsedReplica> used_;
};

} // namespace logfanout
