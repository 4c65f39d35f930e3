#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace paydb {

/**
 * @brief Base class for storage failures
 *
 * Carries the logical database id (e.g. "payin_paymentdb") and, when the
 * server reported one, the five-character SQLSTATE.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(std::string db_id, const std::string& message, std::string sqlstate = {})
        : std::runtime_error(message),
          db_id_(std::move(db_id)),
          sqlstate_(std::move(sqlstate)) {}

    [[nodiscard]] const std::string& db_id() const noexcept { return db_id_; }
    [[nodiscard]] const std::string& sqlstate() const noexcept { return sqlstate_; }

private:
    std::string db_id_;
    std::string sqlstate_;
};

/**
 * @brief Connection could not be established, acquired or released
 *
 * Fatal at startup. Collected during shutdown.
 */
class ConnectionError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

/**
 * @brief Write violated a storage constraint (SQLSTATE class 23)
 */
class IntegrityError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

/**
 * @brief Any other statement failure (syntax, type mismatch, timeout, bad value)
 */
class QueryError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

/**
 * @brief Programming-contract violation
 *
 * Raised for caller bugs: double attach, missing context, an
 * insert ... RETURNING that produced no row. Never retried.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief SQLSTATE classification helpers
 */
namespace sqlstate {

[[nodiscard]] inline bool is_integrity_violation(std::string_view code) {
    return code.size() == 5 && code.substr(0, 2) == "23";
}

// Class 08 (connection exception) and 57P01..57P03 (admin shutdown, crash, cannot connect now)
[[nodiscard]] inline bool is_connection_failure(std::string_view code) {
    if (code.size() != 5) return false;
    return code.substr(0, 2) == "08" || code.substr(0, 4) == "57P0";
}

} // namespace sqlstate

} // namespace paydb
