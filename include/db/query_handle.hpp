#pragma once

#include "db/db_row.hpp"
#include "db/iconnection_pool.hpp"
#include "db/statement.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paydb {

struct DbResultSet;

/**
 * @brief Query-executable accessor bound to one pool of a logical database
 *
 * Returned by DatabaseHandle::master() / replica(). Cheap to copy.
 * Each call leases one connection for one round trip.
 *
 * Failures are logged with the database id, role and operation name, then
 * raised as ConnectionError / IntegrityError / QueryError. Nothing is retried.
 */
class QueryHandle {
public:
    QueryHandle(std::shared_ptr<IConnectionPool> pool, std::string db_id, std::string role);

    /**
     * @brief Execute and return the first row, if any
     */
    [[nodiscard]] std::optional<DbRow> fetch_one(const Statement& stmt, std::string_view op = {}) const;

    /**
     * @brief Execute and return every row (possibly none)
     */
    [[nodiscard]] std::vector<DbRow> fetch_all(const Statement& stmt, std::string_view op = {}) const;

    /**
     * @brief Execute a statement without a result set
     * @return affected row count
     */
    uint64_t execute(const Statement& stmt, std::string_view op = {}) const;

    [[nodiscard]] const std::string& db_id() const { return db_id_; }
    [[nodiscard]] const std::string& role() const { return role_; }

private:
    DbResultSet run(const Statement& stmt, std::string_view op) const;

    std::shared_ptr<IConnectionPool> pool_;
    std::string db_id_;
    std::string role_;
};

} // namespace paydb
