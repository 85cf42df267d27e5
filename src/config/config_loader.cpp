#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

using namespace std::string_literals;

namespace logfanout {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

// ${NAME} becomes the value of NAME, or nothing when it is unset
std::string substitute_env(std::string_view text) {
    std::string out;
    size_t pos = 0;
    for (size_t open = text.find("${"); open != std::string_view::npos;
         open = text.find("${", pos)) {
        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(text.substr(pos, open - pos));
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    out.append(text.substr(pos));
    return out;
}

void substitute_env_at(toml::node* node) {
    if (auto* str = node ? node->as_string() : nullptr) {
        str->get() = substitute_env(str->get());
    }
}

// Only the free-form string keys take ${ENV} references:
// logging.level and limits.overrides[].tenant
void substitute_env_in_strings(toml::table& root) {
    substitute_env_at(root.at_path("logging.level").node());
    if (auto* overrides = root.at_path("limits.overrides").as_array()) {
        for (auto& entry : *overrides) {
            if (auto* tbl = entry.as_table()) substitute_env_at(tbl->get("tenant"));
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    substitute_env_in_strings(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    substitute_env_in_strings(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

QuerierConfig ConfigLoader::extract_querier(const toml::table& root) {
    QuerierConfig cfg;
    const auto* querier = root["querier"].as_table();
    if (!querier) return cfg;
    const auto& q = *querier;

    cfg.query_partition_ingesters = q["query_partition_ingesters"].value_or(false);
    cfg.query_ingesters_within = std::chrono::milliseconds(
        q["query_ingesters_within_ms"].value_or(int64_t{10800000}));
    return cfg;
}

LimitsConfig ConfigLoader::extract_limits(const toml::table& root) {
    LimitsConfig cfg;
    const auto* limits = root["limits"].as_table();
    if (!limits) return cfg;
    const auto& l = *limits;

    cfg.ingestion_partitions_tenant_shard_size =
        static_cast<int>(l["ingestion_partitions_tenant_shard_size"].value_or(int64_t{1}));

    if (const auto* overrides = l["overrides"].as_array()) {
        cfg.overrides.reserve(overrides->size());
        for (const auto& elem : *overrides) {
            const auto* o = elem.as_table();
            if (!o) continue;
            TenantShardOverride entry;
            entry.tenant = (*o)["tenant"].value_or(""s);
            entry.shard_size = static_cast<int>(
                (*o)["ingestion_partitions_tenant_shard_size"].value_or(int64_t{0}));
            cfg.overrides.emplace_back(std::move(entry));
        }
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

FanoutConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    FanoutConfig config;
    config.querier = extract_querier(root);
    config.limits = extract_limits(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(FanoutConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const FanoutConfig& config) {
    std::vector<std::string> errors;

    if (config.querier.query_partition_ingesters) {
        if (config.querier.query_ingesters_within.count() <= 0) {
            errors.push_back(std::format(
                "querier.query_ingesters_within_ms must be > 0 when query_partition_ingesters is enabled, got {}",
                config.querier.query_ingesters_within.count()));
        }
        if (config.limits.ingestion_partitions_tenant_shard_size <= 0) {
            errors.push_back(std::format(
                "limits.ingestion_partitions_tenant_shard_size must be > 0, got {}",
                config.limits.ingestion_partitions_tenant_shard_size));
        }
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.limits.overrides.size(); ++i) {
        const auto& o = config.limits.overrides[i];
        if (o.tenant.empty()) {
            errors.push_back(std::format("limits.overrides[{}].tenant must not be empty", i));
        } else if (!seen.insert(o.tenant).second) {
            errors.push_back(std::format("limits.overrides[{}].tenant '{}' is duplicated", i, o.tenant));
        }
        if (o.shard_size <= 0) {
            errors.push_back(std::format(
                "limits.overrides[{}].ingestion_partitions_tenant_shard_size must be > 0, got {}",
                i, o.shard_size));
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace logfanout
