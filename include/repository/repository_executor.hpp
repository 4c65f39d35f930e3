#pragma once

#include "core/error.hpp"
#include "db/database_handle.hpp"
#include "db/db_row.hpp"
#include "db/statement.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <vector>

namespace paydb {

/**
 * @brief Which pool of a logical database an operation runs against
 */
enum class Route {
    MASTER,
    REPLICA
};

[[nodiscard]] const char* route_to_string(Route route);

/**
 * @brief Shared repository capability: execute against a chosen pool and map rows
 *
 * Typed repositories hold one executor per logical database they touch and
 * delegate every round trip to it. The executor keeps a non-owning reference
 * to the DatabaseHandle, which the AppContext owns.
 *
 * Write policy: inserts and updates always run on master with RETURNING.
 *
 * Models used with the typed helpers provide:
 *   static constexpr std::string_view kTable;
 *   static constexpr std::array<std::string_view, N> kColumns;
 *   static Model from_row(const DbRow&);
 */
class RepositoryExecutor {
public:
    explicit RepositoryExecutor(const DatabaseHandle& db) : db_(db) {}

    [[nodiscard]] std::optional<DbRow> fetch_one(
        const Statement& stmt, Route route, std::string_view op) const;

    [[nodiscard]] std::vector<DbRow> fetch_all(
        const Statement& stmt, Route route, std::string_view op) const;

    // ========================================================================
    // Typed helpers
    // ========================================================================

    template<typename Model>
    [[nodiscard]] std::optional<Model> find_one(
        const Where& where, Route route, std::string_view op) const {
        auto row = fetch_one(statements::select_where(Model::kTable, Model::kColumns, where), route, op);
        if (!row) return std::nullopt;
        return Model::from_row(*row);
    }

    template<typename Model>
    [[nodiscard]] std::vector<Model> find_all(
        const Where& where, Route route, std::string_view op,
        std::string_view order_by = {}) const {
        auto rows = fetch_all(
            statements::select_where(Model::kTable, Model::kColumns, where, order_by), route, op);
        std::vector<Model> out;
        out.reserve(rows.size());
        for (const auto& row : rows) {
            out.push_back(Model::from_row(row));
        }
        return out;
    }

    /**
     * @brief INSERT ... RETURNING on master; exactly one row is expected
     * @throws IntegrityError on a constraint violation
     * @throws InvariantViolation if the server returned no row
     */
    template<typename Model>
    [[nodiscard]] Model insert_one(const ColumnValues& values, std::string_view op) const {
        auto row = fetch_one(
            statements::insert_returning(Model::kTable, values, Model::kColumns), Route::MASTER, op);
        if (!row) {
            throw InvariantViolation(std::format(
                "{}: insert into {}.{} returned no row", op, db_.id(), Model::kTable));
        }
        return Model::from_row(*row);
    }

    /**
     * @brief UPDATE ... RETURNING on master, writing only the supplied columns
     *
     * With nothing supplied no write is issued and the current row is read
     * from master instead. std::nullopt when the predicate matched nothing.
     */
    template<typename Model>
    [[nodiscard]] std::optional<Model> update_one(
        const ColumnValues& set, const Where& where, std::string_view op) const {
        if (set.empty()) {
            return find_one<Model>(where, Route::MASTER, op);
        }
        auto row = fetch_one(
            statements::update_returning(Model::kTable, set, where, Model::kColumns), Route::MASTER, op);
        if (!row) return std::nullopt;
        return Model::from_row(*row);
    }

    [[nodiscard]] const DatabaseHandle& database() const { return db_; }

private:
    [[nodiscard]] QueryHandle pool(Route route) const;

    const DatabaseHandle& db_;
};

} // namespace paydb
