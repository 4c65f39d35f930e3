#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/query_handle.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace paydb {

/**
 * @brief One logical database: a master pool plus a replica pool
 *
 * State is either DISCONNECTED or CONNECTED from a caller's point of view;
 * connect() and disconnect() are serialized and all-or-nothing.
 *
 * Replica policy: when no replica endpoint is configured, replica() is served
 * by the master pool. This is intended for low-volume databases and is
 * reported by replica_served_by_master().
 */
class DatabaseHandle {
public:
    enum class State { DISCONNECTED, CONNECTING, CONNECTED };

    /**
     * @param db_id Logical database id
     * @param master Master pool configuration
     * @param replica Replica pool configuration; empty connection_string = use master
     * @param factory Connection factory shared by both pools
     */
    DatabaseHandle(std::string db_id,
                   PoolConfig master,
                   PoolConfig replica,
                   std::shared_ptr<IConnectionFactory> factory);

    ~DatabaseHandle();

    DatabaseHandle(const DatabaseHandle&) = delete;
    DatabaseHandle& operator=(const DatabaseHandle&) = delete;

    /**
     * @brief Handle using its own configured replica endpoint
     */
    [[nodiscard]] static std::unique_ptr<DatabaseHandle> create(
        std::string db_id,
        const PoolConfig& master,
        const PoolConfig& replica,
        std::shared_ptr<IConnectionFactory> factory);

    /**
     * @brief Handle whose replica is replaced by a process-wide alternative, when one was selected
     */
    [[nodiscard]] static std::unique_ptr<DatabaseHandle> create_with_alternative_replica(
        std::string db_id,
        const PoolConfig& master,
        PoolConfig replica,
        const std::optional<std::string>& alternative_replica,
        std::shared_ptr<IConnectionFactory> factory);

    /**
     * @brief Open the master pool, then the replica pool
     * @throws ConnectionError naming this database; nothing stays open on failure
     *
     * No-op when already connected.
     */
    void connect();

    /**
     * @brief Drain both pools; no-op when not connected
     * @throws ConnectionError if releasing either pool failed (both are attempted;
     *         the handle is DISCONNECTED afterwards either way)
     */
    void disconnect();

    /**
     * @throws InvariantViolation when not connected
     */
    [[nodiscard]] QueryHandle master() const;

    /**
     * @throws InvariantViolation when not connected
     */
    [[nodiscard]] QueryHandle replica() const;

    [[nodiscard]] const std::string& id() const { return db_id_; }
    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_connected() const { return state() == State::CONNECTED; }

    [[nodiscard]] const std::string& master_endpoint() const { return master_config_.connection_string; }

    /**
     * @brief Endpoint replica() reads from (master's when none configured)
     */
    [[nodiscard]] const std::string& replica_endpoint() const;
    [[nodiscard]] bool replica_served_by_master() const { return replica_pool_ == nullptr; }

private:
    void require_connected(std::string_view accessor) const;

    std::string db_id_;
    PoolConfig master_config_;
    PoolConfig replica_config_;

    std::shared_ptr<IConnectionPool> master_pool_;
    std::shared_ptr<IConnectionPool> replica_pool_;  // null = master serves reads

    std::mutex lifecycle_mutex_;
    std::atomic<State> state_{State::DISCONNECTED};
};

[[nodiscard]] const char* database_state_to_string(DatabaseHandle::State state);

} // namespace paydb
