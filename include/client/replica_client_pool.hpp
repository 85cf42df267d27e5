#pragma once

#include "client/ireplica_client_pool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace logfanout {

/**
 * @brief Lazily populated client pool keyed by ingester address
 *
 * Clients are created through the factory on first use and cached; a failed
 * creation is not cached, so the next lookup retries the factory.
 *
 * Thread-safe: shared_mutex with double-checked insert.
 */
class ReplicaClientPool : public IReplicaClientPool {
public:
    using ClientFactory = std::function<Result<std::shared_ptr<IReplicaClient>>(
        const std::string& addr)>;

    explicit ReplicaClientPool(ClientFactory factory);

    [[nodiscard]] Result<std::shared_ptr<IReplicaClient>> client_for(
        const std::string& addr) override;

    /// Drop a cached client (e.g. the ring reports the instance LEFT)
    bool remove(const std::string& addr);

    struct Stats {
        size_t total_clients;
        uint64_t total_creates;
        uint64_t failed_creates;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    ClientFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<IReplicaClient>> clients_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> total_creates_{0};
    std::atomic<uint64_t> failed_creates_{0};
};

} // namespace logfanout
