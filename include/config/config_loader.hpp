#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace logfanout {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads the fan-out engine configuration
 *
 * Recognized sections:
 *   [querier]   query_partition_ingesters, query_ingesters_within_ms
 *   [limits]    ingestion_partitions_tenant_shard_size
 *   [[limits.overrides]] tenant, ingestion_partitions_tenant_shard_size
 *   [logging]   level
 *
 * ${VAR} in string values is replaced by the environment variable (empty if unset).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        FanoutConfig config;

        static LoadResult ok(FanoutConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All validation failures, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const FanoutConfig& config);

    /// Set the process-wide log threshold from [logging] level
    static void apply_logging(const LoggingConfig& logging);

private:
    static QuerierConfig extract_querier(const toml::table& root);
    static LimitsConfig extract_limits(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static FanoutConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(FanoutConfig config);
};

} // namespace logfanout
