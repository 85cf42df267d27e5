#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace logfanout {

// Ring health state of a replica, as reported by the membership layer
enum class InstanceState : uint8_t {
    ACTIVE,
    LEAVING,
    PENDING,
    JOINING,
    LEFT
};

[[nodiscard]] inline const char* instance_state_to_string(InstanceState s) {
    switch (s) {
        case InstanceState::ACTIVE:  return "ACTIVE";
        case InstanceState::LEAVING: return "LEAVING";
        case InstanceState::PENDING: return "PENDING";
        case InstanceState::JOINING: return "JOINING";
        case InstanceState::LEFT:    return "LEFT";
        default:                     return "UNKNOWN";
    }
}

struct ReplicaDescriptor {
    std::string addr;
    std::string zone;           // Empty when the ring is not zone-aware
    InstanceState state = InstanceState::ACTIVE;
};

/**
 * @brief One consistency group of replicas
 *
 * Zone-unaware: success needs instances.size() - max_errors successes.
 * Zone-aware (max_unavailable_zones > 0 and more than one zone): success needs
 * every instance of zone_count() - max_unavailable_zones zones.
 */
struct ReplicaSet {
    std::vector<ReplicaDescriptor> instances;
    int max_errors = 0;
    int max_unavailable_zones = 0;

    /// Library-default quorum: a strict majority must answer
    [[nodiscard]] static ReplicaSet majority(std::vector<ReplicaDescriptor> instances);

    [[nodiscard]] size_t zone_count() const;
    [[nodiscard]] bool zone_aware() const;
    [[nodiscard]] bool empty() const { return instances.empty(); }
};

} // namespace logfanout
