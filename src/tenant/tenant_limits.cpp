#include "tenant/tenant_limits.hpp"

#include <mutex>

namespace logfanout {

namespace {

std::shared_ptr<const std::unordered_map<std::string, int>> build_overrides(const LimitsConfig& config) {
    auto map = std::make_shared<std::unordered_map<std::string, int>>();
    for (const auto& o : config.overrides) {
        (*map)[o.tenant] = o.shard_size;
    }
    return map;
}

} // anonymous namespace

TenantLimits::TenantLimits(const LimitsConfig& config)
    : default_shard_size_(config.ingestion_partitions_tenant_shard_size),
      overrides_(build_overrides(config)) {}

int TenantLimits::shard_count_for(const std::string& tenant_id) const {
    std::shared_ptr<const OverrideMap> snapshot;
    int fallback = 0;
    {
        std::shared_lock lock(mutex_);
        snapshot = overrides_;
        fallback = default_shard_size_;
    }
    const auto it = snapshot->find(tenant_id);
    return it != snapshot->end() ? it->second : fallback;
}

void TenantLimits::set_override(const std::string& tenant_id, int shard_size) {
    std::unique_lock lock(mutex_);
    auto next = std::make_shared<OverrideMap>(*overrides_);
    (*next)[tenant_id] = shard_size;
    overrides_ = std::move(next);
}

bool TenantLimits::remove_override(const std::string& tenant_id) {
    std::unique_lock lock(mutex_);
    if (overrides_->find(tenant_id) == overrides_->end()) return false;
    auto next = std::make_shared<OverrideMap>(*overrides_);
    next->erase(tenant_id);
    overrides_ = std::move(next);
    return true;
}

void TenantLimits::reload(const LimitsConfig& config) {
    auto next = build_overrides(config);
    std::unique_lock lock(mutex_);
    default_shard_size_ = config.ingestion_partitions_tenant_shard_size;
    overrides_ = std::move(next);
}

size_t TenantLimits::override_count() const {
    std::shared_lock lock(mutex_);
    return overrides_->size();
}

int TenantLimits::default_shard_size() const {
    std::shared_lock lock(mutex_);
    return default_shard_size_;
}

ShardCountLookup TenantLimits::make_lookup(std::shared_ptr<const TenantLimits> limits) {
    return [limits = std::move(limits)](const std::string& tenant_id) {
        return limits->shard_count_for(tenant_id);
    };
}

} // namespace logfanout
