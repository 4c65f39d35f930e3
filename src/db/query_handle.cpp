#include "db/query_handle.hpp"
#include "db/idb_connection.hpp"
#include "db/pooled_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace paydb {

QueryHandle::QueryHandle(std::shared_ptr<IConnectionPool> pool, std::string db_id, std::string role)
    : pool_(std::move(pool)),
      db_id_(std::move(db_id)),
      role_(std::move(role)) {}

DbResultSet QueryHandle::run(const Statement& stmt, std::string_view op) const {
    const std::string_view op_name = op.empty() ? std::string_view("query") : op;

    auto conn = pool_->acquire();
    if (!conn) {
        const auto msg = std::format("[{}/{}] {}: no connection available (pool {} or acquire timed out)",
            db_id_, role_, op_name, pool_->is_open() ? "exhausted" : "closed");
        utils::log::error(msg);
        throw ConnectionError(db_id_, msg);
    }

    auto result = (*conn)->execute(stmt);
    if (result.success) {
        return result;
    }

    const auto msg = std::format("[{}/{}] {} failed (sqlstate={}): {}",
        db_id_, role_, op_name, result.sqlstate.empty() ? "none" : result.sqlstate,
        result.error_message);
    utils::log::error(msg);

    if (sqlstate::is_integrity_violation(result.sqlstate)) {
        throw IntegrityError(db_id_, msg, result.sqlstate);
    }
    if (sqlstate::is_connection_failure(result.sqlstate) || !(*conn)->is_connected()) {
        conn->mark_broken();
        throw ConnectionError(db_id_, msg, result.sqlstate);
    }
    throw QueryError(db_id_, msg, result.sqlstate);
}

std::optional<DbRow> QueryHandle::fetch_one(const Statement& stmt, std::string_view op) const {
    auto result = run(stmt, op);
    if (result.rows.empty()) {
        return std::nullopt;
    }
    if (result.rows.size() > 1) {
        utils::log::debug(std::format("[{}/{}] {}: fetch_one discarded {} extra rows",
            db_id_, role_, op.empty() ? std::string_view("query") : op, result.rows.size() - 1));
    }
    result.rows.resize(1);
    auto rows = DbRow::from_result(result.column_names, std::move(result.rows), db_id_);
    return std::move(rows.front());
}

std::vector<DbRow> QueryHandle::fetch_all(const Statement& stmt, std::string_view op) const {
    auto result = run(stmt, op);
    return DbRow::from_result(result.column_names, std::move(result.rows), db_id_);
}

uint64_t QueryHandle::execute(const Statement& stmt, std::string_view op) const {
    return run(stmt, op).affected_rows;
}

} // namespace paydb
