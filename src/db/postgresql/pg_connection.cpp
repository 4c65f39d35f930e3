#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>
#include <string_view>

namespace paydb {

namespace {

constexpr const char* kConnectionDoesNotExist = "08003";
constexpr const char* kConnectionFailure = "08006";

struct ResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

// Runs a parameterless utility statement (SET ..., health check)
bool run_utility(PGconn* conn, const std::string& sql) {
    const ResultPtr res(PQexec(conn, sql.c_str()));
    if (!res) return false;
    const auto status = PQresultStatus(res.get());
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

DbResultSet read_tuples(const PGresult* res) {
    DbResultSet out;
    out.success = true;
    out.has_rows = true;

    const int columns = PQnfields(res);
    const int rows = PQntuples(res);
    out.column_names.reserve(static_cast<size_t>(columns));
    for (int c = 0; c < columns; ++c) {
        out.column_names.emplace_back(PQfname(res, c));
    }

    out.rows.reserve(static_cast<size_t>(rows));
    for (int r = 0; r < rows; ++r) {
        auto& row = out.rows.emplace_back();
        row.reserve(static_cast<size_t>(columns));
        for (int c = 0; c < columns; ++c) {
            if (PQgetisnull(res, r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::in_place, PQgetvalue(res, r, c),
                                 static_cast<size_t>(PQgetlength(res, r, c)));
            }
        }
    }
    out.affected_rows = static_cast<uint64_t>(rows);
    return out;
}

DbResultSet read_command(const PGresult* res) {
    DbResultSet out;
    out.success = true;
    // PQcmdTuples is empty for commands that report no count
    const std::string_view count = PQcmdTuples(const_cast<PGresult*>(res));
    out.affected_rows = utils::try_parse_int<uint64_t>(count).value_or(0);
    return out;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const Statement& stmt) {
    if (!conn_) {
        DbResultSet closed;
        closed.error_message = "connection already closed";
        closed.sqlstate = kConnectionDoesNotExist;
        return closed;
    }

    std::vector<const char*> values;
    values.reserve(stmt.params.size());
    for (const auto& param : stmt.params) {
        values.push_back(param ? param->c_str() : nullptr);  // nullptr = SQL NULL
    }

    // Parameter types are inferred by the server
    const ResultPtr res(PQexecParams(conn_, stmt.sql.c_str(),
        static_cast<int>(values.size()), nullptr, values.data(), nullptr, nullptr, 0));

    switch (res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR) {
        case PGRES_TUPLES_OK:  return read_tuples(res.get());
        case PGRES_COMMAND_OK: return read_command(res.get());
        default:               return failed(res.get());
    }
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    return is_connected() && run_utility(conn_, health_check_query);
}

bool PgConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    return conn_ && run_utility(conn_, std::format("SET statement_timeout = {}", timeout_ms));
}

void PgConnection::close() {
    if (!conn_) return;
    PQfinish(conn_);
    conn_ = nullptr;
}

DbResultSet PgConnection::failed(const PGresult* res) const {
    DbResultSet out;
    out.error_message = PQerrorMessage(conn_);

    if (res) {
        if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
            out.sqlstate = state;
        }
        if (const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY)) {
            out.error_message = primary;
        }
    }
    if (out.sqlstate.empty() && PQstatus(conn_) != CONNECTION_OK) {
        out.sqlstate = kConnectionFailure;
    }
    return out;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        utils::log::error("libpq could not allocate a connection");
        return nullptr;
    }

    auto session = std::make_unique<PgConnection>(conn);
    if (!session->is_connected()) {
        utils::log::error(std::format("PostgreSQL connect failed: {}", PQerrorMessage(conn)));
        return nullptr;
    }
    if (!run_utility(conn, "SET TIME ZONE 'UTC'")) {
        utils::log::error(std::format("PostgreSQL session time zone not set: {}", PQerrorMessage(conn)));
        return nullptr;
    }
    return session;
}

} // namespace paydb
