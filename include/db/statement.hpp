#pragma once

#include "core/patch.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paydb {

// std::nullopt is sent as SQL NULL
using SqlParam = std::optional<std::string>;

/**
 * @brief Parameterized SQL statement ($1..$n placeholders, text format)
 */
struct Statement {
    std::string sql;
    std::vector<SqlParam> params;
};

// ============================================================================
// Value encoding (C++ value -> text parameter)
// ============================================================================

namespace sql_value {

inline SqlParam encode(const std::string& v) { return v; }
inline SqlParam encode(const char* v) { return std::string(v); }
inline SqlParam encode(int64_t v) { return std::to_string(v); }
inline SqlParam encode(int v) { return std::to_string(v); }
inline SqlParam encode(bool v) { return std::string(utils::booltostr(v)); }
inline SqlParam encode(const utils::Timestamp& v) { return utils::format_timestamp(v); }
inline SqlParam encode(const nlohmann::json& v) { return v.dump(); }

template<typename T>
SqlParam encode(const std::optional<T>& v) {
    if (!v) return std::nullopt;
    return encode(*v);
}

} // namespace sql_value

/**
 * @brief Ordered column -> value list for INSERT and UPDATE ... SET
 *
 * Patch fields that were not supplied are skipped, so they never reach
 * the generated SQL.
 */
class ColumnValues {
public:
    template<typename T>
    ColumnValues& set(std::string_view column, const T& value) {
        entries_.emplace_back(std::string(column), sql_value::encode(value));
        return *this;
    }

    // Optional insert field: omitted entirely when empty so the column default applies
    template<typename T>
    ColumnValues& set_if_present(std::string_view column, const std::optional<T>& value) {
        if (value) {
            entries_.emplace_back(std::string(column), sql_value::encode(*value));
        }
        return *this;
    }

    template<typename T>
    ColumnValues& set_patch(std::string_view column, const Patch<T>& patch) {
        if (patch.is_supplied()) {
            entries_.emplace_back(std::string(column), sql_value::encode(patch.as_optional()));
        }
        return *this;
    }

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] const std::vector<std::pair<std::string, SqlParam>>& entries() const {
        return entries_;
    }

private:
    std::vector<std::pair<std::string, SqlParam>> entries_;
};

/**
 * @brief Conjunction of column predicates (col = $n, col >= $n, col IN (...))
 */
class Where {
public:
    template<typename T>
    Where& eq(std::string_view column, const T& value) {
        terms_.push_back({std::string(column), Op::EQ, {sql_value::encode(value)}});
        return *this;
    }

    template<typename T>
    Where& ge(std::string_view column, const T& value) {
        terms_.push_back({std::string(column), Op::GE, {sql_value::encode(value)}});
        return *this;
    }

    template<typename T>
    Where& in(std::string_view column, const std::vector<T>& values) {
        Term term{std::string(column), Op::IN, {}};
        term.values.reserve(values.size());
        for (const auto& v : values) {
            term.values.push_back(sql_value::encode(v));
        }
        terms_.push_back(std::move(term));
        return *this;
    }

    [[nodiscard]] bool empty() const { return terms_.empty(); }

    // Appends " WHERE ..." to sql and the bound values to params
    void render(std::string& sql, std::vector<SqlParam>& params) const;

private:
    enum class Op { EQ, GE, IN };

    struct Term {
        std::string column;
        Op op;
        std::vector<SqlParam> values;
    };

    std::vector<Term> terms_;
};

/**
 * @brief Builders for the statement shapes used by repositories
 *
 * Column lists are always explicit so RETURNING and SELECT yield the
 * entity's full row in declared order.
 */
namespace statements {

[[nodiscard]] Statement insert_returning(
    std::string_view table,
    const ColumnValues& values,
    std::span<const std::string_view> returning);

[[nodiscard]] Statement select_where(
    std::string_view table,
    std::span<const std::string_view> columns,
    const Where& where,
    std::string_view order_by = {});

[[nodiscard]] Statement update_returning(
    std::string_view table,
    const ColumnValues& values,
    const Where& where,
    std::span<const std::string_view> returning);

} // namespace statements

} // namespace paydb
