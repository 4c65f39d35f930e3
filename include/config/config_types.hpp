#pragma once

#include "db/iconnection_pool.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace paydb {

// ============================================================================
// Logical Databases (declared connect order)
// ============================================================================

namespace db_names {
    inline constexpr std::string_view kPayoutMainDb    = "payout_maindb";
    inline constexpr std::string_view kPayoutBankDb    = "payout_bankdb";
    inline constexpr std::string_view kPayinMainDb     = "payin_maindb";
    inline constexpr std::string_view kPayinPaymentDb  = "payin_paymentdb";
    inline constexpr std::string_view kLedgerMainDb    = "ledger_maindb";
    inline constexpr std::string_view kLedgerPaymentDb = "ledger_paymentdb";

    inline constexpr std::array<std::string_view, 6> kAll = {
        kPayoutMainDb, kPayoutBankDb, kPayinMainDb,
        kPayinPaymentDb, kLedgerMainDb, kLedgerPaymentDb,
    };
}

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Pool sizing/timeouts shared by every logical database
 */
struct DatabaseDefaults {
    size_t master_min_connections = 1;
    size_t master_max_connections = 10;
    size_t replica_min_connections = 1;
    size_t replica_max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds statement_timeout{30000};
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds max_lifetime{3600};
    std::string health_check_query{"SELECT 1"};

    [[nodiscard]] PoolConfig master_pool(const std::string& url) const {
        return make_pool(url, master_min_connections, master_max_connections);
    }

    [[nodiscard]] PoolConfig replica_pool(const std::string& url) const {
        return make_pool(url, replica_min_connections, replica_max_connections);
    }

private:
    [[nodiscard]] PoolConfig make_pool(const std::string& url, size_t min_conn, size_t max_conn) const {
        PoolConfig pool;
        pool.connection_string = url;
        pool.min_connections = min_conn;
        pool.max_connections = max_conn;
        pool.connection_timeout = connection_timeout;
        pool.statement_timeout = statement_timeout;
        pool.idle_timeout = idle_timeout;
        pool.max_lifetime = max_lifetime;
        pool.health_check_query = health_check_query;
        return pool;
    }
};

struct DatabaseEndpointConfig {
    std::string name;
    std::string master_url;
    std::string replica_url;  // empty = replica() served by the master pool
};

enum class ReplicaSelectionMode {
    RANDOM,
    PINNED
};

struct ReplicaSelectionConfig {
    std::vector<std::string> available_maindb_replicas;
    ReplicaSelectionMode mode = ReplicaSelectionMode::RANDOM;
    size_t pinned_index = 0;
};

struct StripeClientSettings {
    std::string country;
    std::string api_key;
};

struct StripeConfig {
    size_t max_workers = 5;
    std::vector<StripeClientSettings> clients;
};

struct DsjConfig {
    std::string base_url;
    std::string email;
    std::string password;
    std::chrono::seconds jwt_token_ttl{1800};
    std::chrono::milliseconds timeout{10000};
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    LoggingConfig logging;
    DatabaseDefaults database_defaults;
    std::map<std::string, DatabaseEndpointConfig> databases;  // keyed by logical id
    ReplicaSelectionConfig replica_selection;
    StripeConfig stripe;
    DsjConfig dsj;
};

} // namespace paydb
