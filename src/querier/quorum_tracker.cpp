#include "querier/quorum_tracker.hpp"

#include <algorithm>
#include <unordered_map>

namespace logfanout {

QuorumTracker::QuorumTracker(const ReplicaSet& set, QuorumPolicy policy)
    : instance_count_(set.instances.size()),
      zone_aware_(set.zone_aware()),
      minimize_(policy.minimize_requests),
      max_failures_(0),
      required_(0),
      issued_(set.instances.size(), false),
      succeeded_(set.instances.size(), false),
      zone_of_(set.instances.size(), 0) {

    if (instance_count_ == 0) return;

    if (!zone_aware_) {
        // At least one answer is always required from a non-empty set
        const auto allowed = static_cast<size_t>(std::max(set.max_errors, 0));
        max_failures_ = std::min(allowed, instance_count_ - 1);
        required_ = instance_count_ - max_failures_;
        return;
    }

    std::unordered_map<std::string, size_t> zone_index;
    for (size_t i = 0; i < instance_count_; ++i) {
        const auto& zone = set.instances[i].zone;
        auto [it, inserted] = zone_index.try_emplace(zone, zones_.size());
        if (inserted) {
            zones_.push_back(Zone{.name = zone});
        }
        zones_[it->second].members.push_back(i);
        zone_of_[i] = it->second;
    }

    const auto allowed = static_cast<size_t>(std::max(set.max_unavailable_zones, 0));
    max_failures_ = std::min(allowed, zones_.size() - 1);
    required_ = zones_.size() - max_failures_;
}

std::vector<size_t> QuorumTracker::initial_requests() {
    std::vector<size_t> to_issue;
    if (started_ || instance_count_ == 0) return to_issue;
    started_ = true;

    if (!zone_aware_) {
        const size_t count = minimize_ ? required_ : instance_count_;
        to_issue.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            issued_[i] = true;
            to_issue.push_back(i);
        }
        return to_issue;
    }

    const size_t zone_count = minimize_ ? required_ : zones_.size();
    for (size_t z = 0; z < zone_count; ++z) {
        zones_[z].issued = true;
        for (size_t idx : zones_[z].members) {
            issued_[idx] = true;
            to_issue.push_back(idx);
        }
    }
    return to_issue;
}

void QuorumTracker::record_success(size_t idx) {
    if (done() || idx >= instance_count_ || succeeded_[idx]) return;

    succeeded_[idx] = true;
    ++successes_;

    if (zone_aware_) {
        auto& zone = zones_[zone_of_[idx]];
        ++zone.successes;
        if (!zone.failed && zone.successes == zone.members.size()) {
            ++zones_succeeded_;
        }
    }
}

std::vector<size_t> QuorumTracker::record_failure(size_t idx) {
    if (done() || idx >= instance_count_) return {};

    ++failures_;

    if (!zone_aware_) {
        if (failed() || !minimize_) return {};
        return issue_next_instance();
    }

    auto& zone = zones_[zone_of_[idx]];
    if (zone.failed) return {};  // Zone already written off and replaced
    zone.failed = true;
    ++zones_failed_;

    if (failed() || !minimize_) return {};
    return issue_next_zone();
}

bool QuorumTracker::succeeded() const {
    if (instance_count_ == 0) return true;
    if (zone_aware_) return zones_succeeded_ >= required_;
    return successes_ >= required_;
}

bool QuorumTracker::failed() const {
    if (instance_count_ == 0) return false;
    if (zone_aware_) return zones_failed_ > max_failures_;
    return failures_ > max_failures_;
}

bool QuorumTracker::contributes(size_t idx) const {
    if (idx >= instance_count_ || !succeeded_[idx]) return false;
    if (!zone_aware_) return true;

    const auto& zone = zones_[zone_of_[idx]];
    return !zone.failed && zone.successes == zone.members.size();
}

size_t QuorumTracker::issued_count() const {
    return static_cast<size_t>(std::count(issued_.begin(), issued_.end(), true));
}

std::vector<size_t> QuorumTracker::issue_next_instance() {
    for (size_t i = 0; i < instance_count_; ++i) {
        if (!issued_[i]) {
            issued_[i] = true;
            return {i};
        }
    }
    return {};
}

std::vector<size_t> QuorumTracker::issue_next_zone() {
    for (auto& zone : zones_) {
        if (zone.issued) continue;
        zone.issued = true;
        for (size_t idx : zone.members) {
            issued_[idx] = true;
        }
        return zone.members;
    }
    return {};
}

} // namespace logfanout
