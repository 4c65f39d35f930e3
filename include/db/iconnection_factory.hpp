#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace paydb {

/**
 * @brief Opens connections for a pool endpoint
 *
 * PgConnectionFactory in production; tests substitute scripted factories
 * to simulate unreachable endpoints.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @param connection_string libpq conninfo of the master or replica endpoint
     * @return Open connection, or nullptr if the endpoint cannot be reached
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace paydb
