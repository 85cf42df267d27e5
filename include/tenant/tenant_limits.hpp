#pragma once

#include "config/config_types.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace logfanout {

/**
 * @brief Per-tenant partition shard sizes
 *
 * Read on every partitioned query, written on config reload. Readers take a
 * shared_ptr snapshot of the override map; writers swap the whole map.
 */
class TenantLimits {
public:
    explicit TenantLimits(const LimitsConfig& config);

    /// Override if present, the configured default otherwise
    [[nodiscard]] int shard_count_for(const std::string& tenant_id) const;

    void set_override(const std::string& tenant_id, int shard_size);
    bool remove_override(const std::string& tenant_id);
    void reload(const LimitsConfig& config);

    [[nodiscard]] size_t override_count() const;
    [[nodiscard]] int default_shard_size() const;

    /// Lookup bound to a shared instance, for IngesterQuerier
    [[nodiscard]] static ShardCountLookup make_lookup(std::shared_ptr<const TenantLimits> limits);

private:
    using OverrideMap = std::unordered_map<std::string, int>;

    int default_shard_size_;
    std::shared_ptr<const OverrideMap> overrides_;
    mutable std::shared_mutex mutex_;
};

} // namespace logfanout
