#pragma once

#include "ring/replica_set.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace logfanout {

struct QuorumPolicy {
    // Issue only the smallest sufficient subset first, escalate on failure.
    // Used for partition sets, where any healthy replica is authoritative.
    bool minimize_requests = false;
};

/**
 * @brief Success/failure bookkeeping for one scatter-gather over a ReplicaSet
 *
 * Pure state machine, not thread-safe: the executor serializes calls under
 * its own lock. Instances are referred to by their index in the set.
 *
 * Lifecycle: initial_requests() once, then record_success / record_failure
 * per completed call until done(). record_failure returns the indices to
 * issue next when minimize_requests escalation applies.
 */
class QuorumTracker {
public:
    QuorumTracker(const ReplicaSet& set, QuorumPolicy policy);

    [[nodiscard]] std::vector<size_t> initial_requests();

    void record_success(size_t idx);
    [[nodiscard]] std::vector<size_t> record_failure(size_t idx);

    [[nodiscard]] bool succeeded() const;
    [[nodiscard]] bool failed() const;
    [[nodiscard]] bool done() const { return succeeded() || failed(); }

    /// Whether a recorded success from idx belongs to the final quorum
    [[nodiscard]] bool contributes(size_t idx) const;

    [[nodiscard]] size_t required() const { return required_; }
    [[nodiscard]] size_t issued_count() const;
    [[nodiscard]] bool zone_aware() const { return zone_aware_; }

private:
    struct Zone {
        std::string name;
        std::vector<size_t> members;
        size_t successes = 0;
        bool failed = false;
        bool issued = false;
    };

    [[nodiscard]] std::vector<size_t> issue_next_zone();
    [[nodiscard]] std::vector<size_t> issue_next_instance();

    size_t instance_count_;
    bool zone_aware_;
    bool minimize_;
    size_t max_failures_;
    size_t required_;           // instances (zone-unaware) or zones (zone-aware)

    std::vector<bool> issued_;
    std::vector<bool> succeeded_;
    std::vector<size_t> zone_of_;
    std::vector<Zone> zones_;

    size_t successes_ = 0;
    size_t failures_ = 0;
    size_t zones_succeeded_ = 0;
    size_t zones_failed_ = 0;
    bool started_ = false;
};

} // namespace logfanout
