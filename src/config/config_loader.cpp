#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace paydb {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Replace ${VAR_NAME} with the environment value (unset -> empty)
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            expand_env_vars_in(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            expand_env_vars_in(child);
        }
    }
}

/**
 * @brief Deep-merge overlay into base; overlay wins for scalars and arrays
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_node = base.get(key.str());
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}", kMaxIncludeDepth));
    }

    std::vector<std::string> paths;
    if (const auto* single = root["include"].as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* list = root["include"].as_array()) {
        for (const auto& item : *list) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const std::string abs_path = fs::canonical(base_dir / rel_path).string();
        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path(), visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    result.erase("include");
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_in(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

size_t toml_size(const toml::table& tbl, std::string_view key, int64_t fallback) {
    const int64_t v = tbl[key].value_or(fallback);
    if (v < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", key, v));
    }
    return static_cast<size_t>(v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<ReplicaSelectionMode> ConfigLoader::parse_replica_selection(const std::string& mode) {
    static const std::unordered_map<std::string, ReplicaSelectionMode> lookup = {
        {"random", ReplicaSelectionMode::RANDOM},
        {"pinned", ReplicaSelectionMode::PINNED},
    };

    const auto it = lookup.find(utils::to_lower(mode));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    cfg.level = root["logging"]["level"].value_or("info"s);
    return cfg;
}

DatabaseDefaults ConfigLoader::extract_database_defaults(const toml::table& root) {
    DatabaseDefaults cfg;
    const auto* defaults = root["database_defaults"].as_table();
    if (!defaults) return cfg;
    const auto& d = *defaults;

    cfg.master_min_connections = toml_size(d, "master_min_connections", 1);
    cfg.master_max_connections = toml_size(d, "master_max_connections", 10);
    cfg.replica_min_connections = toml_size(d, "replica_min_connections", 1);
    cfg.replica_max_connections = toml_size(d, "replica_max_connections", 10);
    cfg.connection_timeout = std::chrono::milliseconds(d["connection_timeout_ms"].value_or(int64_t{5000}));
    cfg.statement_timeout = std::chrono::milliseconds(d["statement_timeout_ms"].value_or(int64_t{30000}));
    cfg.idle_timeout = std::chrono::seconds(d["idle_timeout_seconds"].value_or(int64_t{300}));
    cfg.max_lifetime = std::chrono::seconds(d["max_lifetime_seconds"].value_or(int64_t{3600}));
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    return cfg;
}

ReplicaSelectionConfig ConfigLoader::extract_replica_selection(const toml::table& root) {
    ReplicaSelectionConfig cfg;
    const auto* defaults = root["database_defaults"].as_table();
    if (!defaults) return cfg;
    const auto& d = *defaults;

    cfg.available_maindb_replicas = toml_string_array(d, "available_maindb_replicas");

    const std::string mode = d["replica_selection"].value_or("random"s);
    const auto parsed = parse_replica_selection(mode);
    if (!parsed) {
        throw std::runtime_error(std::format(
            "database_defaults.replica_selection must be 'random' or 'pinned', got '{}'", mode));
    }
    cfg.mode = *parsed;
    cfg.pinned_index = toml_size(d, "pinned_replica_index", 0);
    return cfg;
}

std::map<std::string, DatabaseEndpointConfig> ConfigLoader::extract_databases(const toml::table& root) {
    std::map<std::string, DatabaseEndpointConfig> result;
    const auto* dbs = root["databases"].as_table();
    if (!dbs) return result;

    for (auto&& [key, node] : *dbs) {
        const auto* tbl = node.as_table();
        if (!tbl) continue;

        DatabaseEndpointConfig db;
        db.name = std::string(key.str());
        db.master_url = (*tbl)["master_url"].value_or(""s);
        db.replica_url = (*tbl)["replica_url"].value_or(""s);
        result.emplace(db.name, std::move(db));
    }
    return result;
}

StripeConfig ConfigLoader::extract_stripe(const toml::table& root) {
    StripeConfig cfg;
    const auto* stripe = root["stripe"].as_table();
    if (!stripe) return cfg;
    const auto& s = *stripe;

    cfg.max_workers = toml_size(s, "max_workers", 5);

    if (const auto* clients = s["clients"].as_array()) {
        for (const auto& elem : *clients) {
            const auto* tbl = elem.as_table();
            if (!tbl) continue;
            StripeClientSettings client;
            client.country = (*tbl)["country"].value_or(""s);
            client.api_key = (*tbl)["api_key"].value_or(""s);
            cfg.clients.push_back(std::move(client));
        }
    }
    return cfg;
}

DsjConfig ConfigLoader::extract_dsj(const toml::table& root) {
    DsjConfig cfg;
    const auto* dsj = root["dsj"].as_table();
    if (!dsj) return cfg;
    const auto& d = *dsj;

    cfg.base_url = d["base_url"].value_or(""s);
    cfg.email = d["email"].value_or(""s);
    cfg.password = d["password"].value_or(""s);
    cfg.jwt_token_ttl = std::chrono::seconds(d["jwt_token_ttl_seconds"].value_or(int64_t{1800}));
    cfg.timeout = std::chrono::milliseconds(d["timeout_ms"].value_or(int64_t{10000}));
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.database_defaults = extract_database_defaults(root);
    config.replica_selection = extract_replica_selection(root);
    config.databases = extract_databases(root);
    config.stripe = extract_stripe(root);
    config.dsj = extract_dsj(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
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

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& d = config.database_defaults;
    if (d.master_max_connections == 0) {
        errors.push_back("database_defaults.master_max_connections must be > 0");
    }
    if (d.replica_max_connections == 0) {
        errors.push_back("database_defaults.replica_max_connections must be > 0");
    }
    if (d.master_min_connections > d.master_max_connections) {
        errors.push_back(std::format(
            "database_defaults.master_min_connections ({}) > master_max_connections ({})",
            d.master_min_connections, d.master_max_connections));
    }
    if (d.replica_min_connections > d.replica_max_connections) {
        errors.push_back(std::format(
            "database_defaults.replica_min_connections ({}) > replica_max_connections ({})",
            d.replica_min_connections, d.replica_max_connections));
    }

    for (const auto name : db_names::kAll) {
        const auto it = config.databases.find(std::string(name));
        if (it == config.databases.end()) {
            errors.push_back(std::format("databases.{} is missing", name));
        } else if (it->second.master_url.empty()) {
            errors.push_back(std::format("databases.{}.master_url must not be empty", name));
        }
    }

    const auto& rs = config.replica_selection;
    if (rs.mode == ReplicaSelectionMode::PINNED && !rs.available_maindb_replicas.empty()
        && rs.pinned_index >= rs.available_maindb_replicas.size()) {
        errors.push_back(std::format(
            "database_defaults.pinned_replica_index ({}) out of range ({} replicas)",
            rs.pinned_index, rs.available_maindb_replicas.size()));
    }

    if (config.stripe.max_workers == 0) {
        errors.push_back("stripe.max_workers must be > 0");
    }
    if (config.stripe.clients.empty()) {
        errors.push_back("stripe.clients must list at least one client");
    }
    for (size_t i = 0; i < config.stripe.clients.size(); ++i) {
        const auto& client = config.stripe.clients[i];
        if (client.api_key.empty()) {
            errors.push_back(std::format("stripe.clients[{}].api_key must not be empty", i));
        }
        if (client.country.empty()) {
            errors.push_back(std::format("stripe.clients[{}].country must not be empty", i));
        }
    }

    return errors;
}

} // namespace paydb
