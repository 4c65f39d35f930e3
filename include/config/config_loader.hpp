#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace paydb {

/**
 * @brief Loads AppConfig from TOML
 *
 * - ${VAR} in any string value is replaced from the environment (unset -> empty)
 * - top-level `include = "x.toml"` or `include = ["a.toml", "b.toml"]` is
 *   deep-merged underneath the including file (including file wins)
 * - every validation problem is reported in one error message
 *
 * Never throws; failures come back through LoadResult.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
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
     * @brief Load config from a TOML file (includes resolved relative to it)
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text (include directives are not followed)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation problems for an already-extracted config
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    [[nodiscard]] static std::optional<ReplicaSelectionMode> parse_replica_selection(const std::string& mode);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseDefaults extract_database_defaults(const toml::table& root);
    static ReplicaSelectionConfig extract_replica_selection(const toml::table& root);
    static std::map<std::string, DatabaseEndpointConfig> extract_databases(const toml::table& root);
    static StripeConfig extract_stripe(const toml::table& root);
    static DsjConfig extract_dsj(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace paydb
