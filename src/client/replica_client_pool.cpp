#include "client/replica_client_pool.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace logfanout {

ReplicaClientPool::ReplicaClientPool(ClientFactory factory)
    : factory_(std::move(factory)) {}

Result<std::shared_ptr<IReplicaClient>> ReplicaClientPool::client_for(const std::string& addr) {
    using R = Result<std::shared_ptr<IReplicaClient>>;

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        auto it = clients_.find(addr);
        if (it != clients_.end()) {
            return R::ok(it->second);
        }
        if (!factory_) {
            return R::error(ErrorCategory::UNAVAILABLE,
                std::format("no client factory configured for {}", addr));
        }
    }

    // Slow path: unique lock with double-checked lookup
    std::unique_lock lock(mutex_);
    auto it = clients_.find(addr);
    if (it != clients_.end()) {
        return R::ok(it->second);
    }

    auto created = factory_(addr);
    if (created.is_error() || !created.value()) {
        failed_creates_.fetch_add(1, std::memory_order_relaxed);
        const std::string reason = created.is_error()
            ? created.error_message() : std::string("factory returned no client");
        utils::log::warn(std::format("Failed to create client for ingester {}: {}", addr, reason));
        return R::error(ErrorCategory::UNAVAILABLE,
            std::format("client for {} unavailable: {}", addr, reason));
    }

    total_creates_.fetch_add(1, std::memory_order_relaxed);
    clients_.emplace(addr, created.value());
    return R::ok(created.value());
}

bool ReplicaClientPool::remove(const std::string& addr) {
    std::unique_lock lock(mutex_);
    return clients_.erase(addr) > 0;
}

ReplicaClientPool::Stats ReplicaClientPool::get_stats() const {
    std::shared_lock lock(mutex_);
    return Stats{
        .total_clients = clients_.size(),
        .total_creates = total_creates_.load(std::memory_order_relaxed),
        .failed_creates = failed_creates_.load(std::memory_order_relaxed),
    };
}

} // namespace logfanout
