#include "querier/partition_context.hpp"

#include <algorithm>

namespace logfanout {

void PartitionContext::set_is_partitioned(bool partitioned) {
    std::lock_guard lock(mutex_);
    is_partitioned_ = partitioned;
}

bool PartitionContext::is_partitioned() const {
    std::lock_guard lock(mutex_);
    return is_partitioned_;
}

void PartitionContext::add_client(std::shared_ptr<IReplicaClient> client, const std::string& addr) {
    std::lock_guard lock(mutex_);
    if (!is_partitioned_) return;
    used_[addr] = UsedReplica{std::move(client), addr};
}

void PartitionContext::remove_client(const std::string& addr) {
    std::lock_guard lock(mutex_);
    if (!is_partitioned_) return;
    used_.erase(addr);
}

std::vector<UsedReplica> PartitionContext::used_replicas() const {
    std::lock_guard lock(mutex_);
    std::vector<UsedReplica> result;
    result.reserve(used_.size());
    for (const auto& [_, replica] : used_) {
        result.push_back(replica);
    }
    return result;
}

std::vector<std::string> PartitionContext::used_addresses() const {
    std::vector<std::string> addrs;
    {
        std::lock_guard lock(mutex_);
        addrs.reserve(used_.size());
        for (const auto& [addr, _] : used_) {
            addrs.push_back(addr);
        }
    }
    std::sort(addrs.begin(), addrs.end());
    return addrs;
}

size_t PartitionContext::used_count() const {
    std::lock_guard lock(mutex_);
    return used_.size();
}

} // namespace logfanout
