#include "db/statement.hpp"

#include <format>
#include <stdexcept>

namespace paydb {

namespace {

std::string column_list(std::span<const std::string_view> columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += columns[i];
    }
    return out;
}

std::string next_placeholder(std::vector<SqlParam>& params, SqlParam value) {
    params.push_back(std::move(value));
    return std::format("${}", params.size());
}

} // anonymous namespace

void Where::render(std::string& sql, std::vector<SqlParam>& params) const {
    if (terms_.empty()) return;

    sql += " WHERE ";
    for (size_t i = 0; i < terms_.size(); ++i) {
        const auto& term = terms_[i];
        if (i > 0) sql += " AND ";
        sql += term.column;

        switch (term.op) {
            case Op::EQ:
                sql += " = ";
                sql += next_placeholder(params, term.values.front());
                break;
            case Op::GE:
                sql += " >= ";
                sql += next_placeholder(params, term.values.front());
                break;
            case Op::IN: {
                // An empty IN list is invalid SQL; callers short-circuit before this
                if (term.values.empty()) {
                    throw std::invalid_argument(
                        std::format("IN predicate on '{}' has no values", term.column));
                }
                sql += " IN (";
                for (size_t j = 0; j < term.values.size(); ++j) {
                    if (j > 0) sql += ", ";
                    sql += next_placeholder(params, term.values[j]);
                }
                sql += ")";
                break;
            }
        }
    }
}

namespace statements {

Statement insert_returning(
    std::string_view table,
    const ColumnValues& values,
    std::span<const std::string_view> returning) {

    if (values.empty()) {
        throw std::invalid_argument(std::format("INSERT into '{}' has no values", table));
    }

    Statement stmt;
    std::string names;
    std::string placeholders;
    for (const auto& [column, value] : values.entries()) {
        if (!names.empty()) {
            names += ", ";
            placeholders += ", ";
        }
        names += column;
        placeholders += next_placeholder(stmt.params, value);
    }

    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ({}) RETURNING {}",
        table, names, placeholders, column_list(returning));
    return stmt;
}

Statement select_where(
    std::string_view table,
    std::span<const std::string_view> columns,
    const Where& where,
    std::string_view order_by) {

    Statement stmt;
    stmt.sql = std::format("SELECT {} FROM {}", column_list(columns), table);
    where.render(stmt.sql, stmt.params);
    if (!order_by.empty()) {
        stmt.sql += " ORDER BY ";
        stmt.sql += order_by;
    }
    return stmt;
}

Statement update_returning(
    std::string_view table,
    const ColumnValues& values,
    const Where& where,
    std::span<const std::string_view> returning) {

    if (values.empty()) {
        throw std::invalid_argument(std::format("UPDATE of '{}' has no values", table));
    }
    if (where.empty()) {
        throw std::invalid_argument(std::format("UPDATE of '{}' has no WHERE predicate", table));
    }

    Statement stmt;
    std::string assignments;
    for (const auto& [column, value] : values.entries()) {
        if (!assignments.empty()) assignments += ", ";
        assignments += column;
        assignments += " = ";
        assignments += next_placeholder(stmt.params, value);
    }

    stmt.sql = std::format("UPDATE {} SET {}", table, assignments);
    where.render(stmt.sql, stmt.params);
    stmt.sql += " RETURNING ";
    stmt.sql += column_list(returning);
    return stmt;
}

} // namespace statements

} // namespace paydb
