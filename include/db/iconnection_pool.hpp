#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace paydb {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration (one endpoint)
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};   // acquire wait
    std::chrono::milliseconds statement_timeout{30000};   // 0 = disabled
    std::chrono::seconds idle_timeout{300};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t connections_discarded = 0;
};

/**
 * @brief Abstract connection pool interface
 *
 * Lifecycle: constructed closed -> open() -> acquire()* -> drain().
 * A drained pool may be opened again.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Establish the initial min_connections
     * @throws ConnectionError if any of them cannot be established;
     *         connections created before the failure are closed first
     */
    virtual void open() = 0;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for acquisition
     * @return RAII connection handle or nullptr on timeout/error/closed pool
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Acquire with the configured connection_timeout
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire() = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close all idle connections and refuse new acquires
     *
     * Every idle connection is closed even if one close fails; the first
     * failure is rethrown as ConnectionError afterwards.
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * @brief Logical database name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;

    /**
     * @brief Endpoint role ("master" or "replica")
     */
    [[nodiscard]] virtual const std::string& role() const = 0;
};

} // namespace paydb
