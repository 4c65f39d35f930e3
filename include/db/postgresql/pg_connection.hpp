#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace paydb {

/**
 * @brief libpq session behind one pooled connection
 *
 * Owns the PGconn. Statements are sent with PQexecParams, parameters and
 * results both in text format. Server errors come back as a failed
 * DbResultSet carrying PG_DIAG_SQLSTATE; a session that dropped without
 * reporting one is labelled 08006.
 */
class PgConnection : public IDbConnection {
public:
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const Statement& stmt) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    [[nodiscard]] DbResultSet failed(const PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief Opens libpq sessions pinned to the UTC time zone
 *
 * timestamptz columns therefore always render with a "+00" offset.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace paydb
