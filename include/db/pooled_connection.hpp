#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace paydb {

/**
 * @brief RAII lease of a pooled database connection
 *
 * Automatically hands the connection back to its pool on destruction.
 * A lease marked broken is discarded by the pool instead of being reused.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool broken)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Do not return this connection to the idle set
     *
     * Used after a connectivity failure surfaced mid-statement.
     */
    void mark_broken() { broken_ = true; }
    [[nodiscard]] bool is_broken() const { return broken_; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace paydb
