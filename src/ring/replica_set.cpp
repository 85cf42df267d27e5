#include "ring/replica_set.hpp"

#include <unordered_set>

namespace logfanout {

ReplicaSet ReplicaSet::majority(std::vector<ReplicaDescriptor> instances) {
    ReplicaSet set;
    const auto n = static_cast<int>(instances.size());
    set.instances = std::move(instances);
    set.max_errors = n > 0 ? n - (n / 2 + 1) : 0;
    return set;
}

size_t ReplicaSet::zone_count() const {
    std::unordered_set<std::string_view> zones;
    for (const auto& instance : instances) {
        zones.insert(instance.zone);
    }
    return zones.size();
}

bool ReplicaSet::zone_aware() const {
    return max_unavailable_zones > 0 && zone_count() > 1;
}

} // namespace logfanout
