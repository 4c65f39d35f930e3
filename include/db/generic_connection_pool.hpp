#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace paydb {

/**
 * @brief Bounded connection pool over any IDbConnection
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Explicit open(): pre-warms min_connections, all-or-nothing
 * - Lazy growth: connections created on-demand up to max
 * - Health checking: connections idle longer than idle_timeout are
 *   validated before being handed out
 * - Lifetime: connections older than max_lifetime are recycled on acquire
 * - RAII: PooledConnection auto-returns on destruction; broken leases are discarded
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Logical database id (for logging and errors)
     * @param role "master" or "replica"
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        std::string role,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    void open() override;

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds timeout) override;
    std::unique_ptr<PooledConnection> acquire() override;

    PoolStats get_stats() const override;

    void drain() override;

    bool is_open() const override { return open_.load(std::memory_order_acquire); }

    const std::string& name() const override { return db_name_; }
    const std::string& role() const override { return role_; }

    const PoolConfig& config() const { return config_; }

private:
    /**
     * @brief Create new connection via factory and apply the statement timeout
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection that leaves the pool for good (never throws)
     */
    void retire(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool broken);

    std::string db_name_;
    std::string role_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
    mutable std::mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_discarded_{0};

    std::atomic<bool> open_{false};
};

} // namespace paydb
