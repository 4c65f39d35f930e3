#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace paydb;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "paydb_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

const std::string kDatabases = R"(
[databases.payout_maindb]
master_url = "host=payout-main"
replica_url = "host=payout-main-replica"

[databases.payout_bankdb]
master_url = "host=payout-bank"

[databases.payin_maindb]
master_url = "host=payin-main"
replica_url = "host=payin-main-replica"

[databases.payin_paymentdb]
master_url = "host=payin-payment"
replica_url = "host=payin-payment-replica"

[databases.ledger_maindb]
master_url = "host=ledger-main"

[databases.ledger_paymentdb]
master_url = "host=ledger-payment"
)";

const std::string kStripe = R"(
[stripe]
max_workers = 3

[[stripe.clients]]
country = "US"
api_key = "sk_test_us"
)";

std::string valid_config(const std::string& extra = "") {
    return extra + kDatabases + kStripe;
}

} // namespace

TEST_CASE("Config: complete file loads every section", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[database_defaults]
master_min_connections = 2
master_max_connections = 8
replica_min_connections = 1
replica_max_connections = 4
connection_timeout_ms = 1500
statement_timeout_ms = 20000
idle_timeout_seconds = 60
max_lifetime_seconds = 600
health_check_query = "SELECT 42"
available_maindb_replicas = ["host=r1", "host=r2"]
replica_selection = "pinned"
pinned_replica_index = 1

[dsj]
base_url = "https://dsj.example.com"
email = "ops@example.com"
password = "pw"
jwt_token_ttl_seconds = 900
)" + kDatabases + kStripe;

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database_defaults.master_min_connections == 2);
    CHECK(cfg.database_defaults.master_max_connections == 8);
    CHECK(cfg.database_defaults.replica_max_connections == 4);
    CHECK(cfg.database_defaults.connection_timeout == std::chrono::milliseconds(1500));
    CHECK(cfg.database_defaults.statement_timeout == std::chrono::milliseconds(20000));
    CHECK(cfg.database_defaults.idle_timeout == std::chrono::seconds(60));
    CHECK(cfg.database_defaults.max_lifetime == std::chrono::seconds(600));
    CHECK(cfg.database_defaults.health_check_query == "SELECT 42");

    REQUIRE(cfg.replica_selection.available_maindb_replicas.size() == 2);
    CHECK(cfg.replica_selection.mode == ReplicaSelectionMode::PINNED);
    CHECK(cfg.replica_selection.pinned_index == 1);

    REQUIRE(cfg.databases.size() == 6);
    CHECK(cfg.databases.at("payout_maindb").master_url == "host=payout-main");
    CHECK(cfg.databases.at("payout_maindb").replica_url == "host=payout-main-replica");
    CHECK(cfg.databases.at("payout_bankdb").replica_url.empty());

    CHECK(cfg.stripe.max_workers == 3);
    REQUIRE(cfg.stripe.clients.size() == 1);
    CHECK(cfg.stripe.clients[0].country == "US");

    CHECK(cfg.dsj.base_url == "https://dsj.example.com");
    CHECK(cfg.dsj.jwt_token_ttl == std::chrono::seconds(900));
}

TEST_CASE("Config: defaults apply when sections are omitted", "[config]") {
    auto result = ConfigLoader::load_from_string(valid_config());
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database_defaults.master_max_connections == 10);
    CHECK(cfg.database_defaults.connection_timeout == std::chrono::milliseconds(5000));
    CHECK(cfg.replica_selection.available_maindb_replicas.empty());
    CHECK(cfg.replica_selection.mode == ReplicaSelectionMode::RANDOM);
    CHECK(cfg.dsj.jwt_token_ttl == std::chrono::seconds(1800));
}

TEST_CASE("Config: pool builders carry the shared defaults", "[config]") {
    DatabaseDefaults defaults;
    defaults.master_min_connections = 3;
    defaults.replica_max_connections = 7;
    defaults.statement_timeout = std::chrono::milliseconds(1234);

    const auto master = defaults.master_pool("host=m");
    const auto replica = defaults.replica_pool("host=r");

    CHECK(master.connection_string == "host=m");
    CHECK(master.min_connections == 3);
    CHECK(master.statement_timeout == std::chrono::milliseconds(1234));
    CHECK(replica.connection_string == "host=r");
    CHECK(replica.max_connections == 7);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: missing logical database is reported", "[config][validation]") {
    const std::string toml = R"(
[databases.payout_maindb]
master_url = "host=a"
)" + kStripe;

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("databases.payout_bankdb is missing") != std::string::npos);
    CHECK(result.error_message.find("databases.ledger_paymentdb is missing") != std::string::npos);
}

TEST_CASE("ConfigValidation: empty master_url is rejected", "[config][validation]") {
    AppConfig cfg = ConfigLoader::load_from_string(valid_config()).config;
    cfg.databases["payin_paymentdb"].master_url.clear();

    const auto errors = ConfigLoader::validate_config(cfg);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("payin_paymentdb.master_url") != std::string::npos);
}

TEST_CASE("ConfigValidation: min above max is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[database_defaults]
master_min_connections = 5
master_max_connections = 2
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("master_min_connections (5) > master_max_connections (2)")
          != std::string::npos);
}

TEST_CASE("ConfigValidation: zero max connections is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[database_defaults]
replica_min_connections = 0
replica_max_connections = 0
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("replica_max_connections must be > 0") != std::string::npos);
}

TEST_CASE("ConfigValidation: stripe needs workers and a keyed client", "[config][validation]") {
    const std::string toml = kDatabases + R"(
[stripe]
max_workers = 0

[[stripe.clients]]
country = "US"
api_key = ""
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("stripe.max_workers must be > 0") != std::string::npos);
    CHECK(result.error_message.find("stripe.clients[0].api_key") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown replica selection mode", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[database_defaults]
replica_selection = "round_robin"
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("replica_selection") != std::string::npos);
}

TEST_CASE("ConfigValidation: pinned index beyond candidates", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[database_defaults]
available_maindb_replicas = ["host=r1"]
replica_selection = "pinned"
pinned_replica_index = 3
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("pinned_replica_index (3) out of range") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown log level", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[logging]
level = "verbose"
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: all errors are reported together", "[config][validation]") {
    const std::string toml = R"(
[stripe]
max_workers = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("payout_maindb") != std::string::npos);
    CHECK(result.error_message.find("stripe.max_workers") != std::string::npos);
    CHECK(result.error_message.find("stripe.clients must list") != std::string::npos);
}

TEST_CASE("Config: malformed TOML is a load error", "[config]") {
    auto result = ConfigLoader::load_from_string("[databases.payout_maindb\nmaster_url = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("EnvConfig: expand env var in api key", "[config][env]") {
    ::setenv("PAYDB_TEST_STRIPE_KEY", "sk_live_xyz", 1);

    const std::string toml = kDatabases + R"(
[stripe]
[[stripe.clients]]
country = "US"
api_key = "${PAYDB_TEST_STRIPE_KEY}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.stripe.clients[0].api_key == "sk_live_xyz");

    ::unsetenv("PAYDB_TEST_STRIPE_KEY");
}

TEST_CASE("EnvConfig: missing env var expands to empty", "[config][env]") {
    ::unsetenv("PAYDB_NONEXISTENT_VAR_12345");

    auto result = ConfigLoader::load_from_string(valid_config(R"(
[dsj]
password = "pw-${PAYDB_NONEXISTENT_VAR_12345}-end"
)"));
    REQUIRE(result.success);
    CHECK(result.config.dsj.password == "pw--end");
}

TEST_CASE("EnvConfig: expansion reaches string arrays", "[config][env]") {
    ::setenv("PAYDB_TEST_REPLICA_HOST", "r9", 1);

    auto result = ConfigLoader::load_from_string(valid_config(R"(
[database_defaults]
available_maindb_replicas = ["host=${PAYDB_TEST_REPLICA_HOST}"]
)"));
    REQUIRE(result.success);
    REQUIRE(result.config.replica_selection.available_maindb_replicas.size() == 1);
    CHECK(result.config.replica_selection.available_maindb_replicas[0] == "host=r9");

    ::unsetenv("PAYDB_TEST_REPLICA_HOST");
}

TEST_CASE("EnvConfig: unclosed ${ is a load error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(valid_config(R"(
[dsj]
password = "${UNCLOSED"
)"));
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("ConfigInclude: included file supplies the databases", "[config][include]") {
    TmpDir tmp;
    tmp.file("databases.toml", kDatabases);

    auto main_path = tmp.file("main.toml", R"(
include = "databases.toml"
)" + kStripe);

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.databases.size() == 6);
}

TEST_CASE("ConfigInclude: including file wins over included values", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[database_defaults]
master_max_connections = 4
connection_timeout_ms = 100
)" + kDatabases);

    auto main_path = tmp.file("main.toml", R"(
include = ["base.toml"]

[database_defaults]
master_max_connections = 20
)" + kStripe);

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.database_defaults.master_max_connections == 20);
    CHECK(result.config.database_defaults.connection_timeout == std::chrono::milliseconds(100));
}

TEST_CASE("ConfigInclude: including file's replica list replaces the included one", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", R"(
[database_defaults]
available_maindb_replicas = ["host=a", "host=c"]
)" + kDatabases);

    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[database_defaults]
available_maindb_replicas = ["host=b"]
replica_selection = "pinned"
pinned_replica_index = 0
)" + kStripe);

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    const auto& replicas = result.config.replica_selection.available_maindb_replicas;
    REQUIRE(replicas.size() == 1);
    CHECK(replicas[0] == "host=b");
}

TEST_CASE("ConfigInclude: including file's stripe clients replace the included ones", "[config][include]") {
    TmpDir tmp;
    tmp.file("base.toml", kDatabases + kStripe);

    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[[stripe.clients]]
country = "CA"
api_key = "sk_test_ca"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.stripe.max_workers == 3);
    REQUIRE(result.config.stripe.clients.size() == 1);
    CHECK(result.config.stripe.clients[0].country == "CA");
    CHECK(result.config.stripe.clients[0].api_key == "sk_test_ca");
}

TEST_CASE("ConfigInclude: circular include is rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular config include") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing file is a load error", "[config][include]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/paydb.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}
