#pragma once

#include "db/statement.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace paydb {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 * SQL NULL is kept as std::nullopt, distinct from an empty string.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;       // five-character SQLSTATE on failure, if reported

    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML without RETURNING
    uint64_t affected_rows = 0;

    // Statement produced a tuple set (SELECT, ... RETURNING)
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a parameterized statement
     * @param stmt SQL text with $n placeholders and bound values
     * @return Result set with rows or affected count; never throws for SQL errors
     */
    [[nodiscard]] virtual DbResultSet execute(const Statement& stmt) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     *
     * May throw if the backend reports a failure while releasing.
     */
    virtual void close() = 0;
};

} // namespace paydb
