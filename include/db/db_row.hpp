#pragma once

#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace paydb {

/**
 * @brief One result row with by-name typed access
 *
 * Rows from the same result set share the column index.
 *
 * Accessor rules:
 * - optional_*: missing column or SQL NULL -> std::nullopt
 * - get_*:      missing column or SQL NULL -> QueryError naming the column
 * - any value that does not parse as the requested type -> QueryError
 */
class DbRow {
public:
    using ColumnIndex = std::unordered_map<std::string, size_t>;

    DbRow(std::shared_ptr<const ColumnIndex> index,
          std::vector<std::optional<std::string>> values,
          std::string source);

    /**
     * @brief Build rows for a whole result set
     * @param source logical database id, used in error messages
     */
    [[nodiscard]] static std::vector<DbRow> from_result(
        const std::vector<std::string>& column_names,
        std::vector<std::vector<std::optional<std::string>>> rows,
        const std::string& source);

    [[nodiscard]] bool has_column(std::string_view column) const;
    [[nodiscard]] bool is_null(std::string_view column) const;
    [[nodiscard]] size_t size() const { return values_.size(); }

    [[nodiscard]] std::string get_string(std::string_view column) const;
    [[nodiscard]] int64_t get_int(std::string_view column) const;
    [[nodiscard]] bool get_bool(std::string_view column) const;
    [[nodiscard]] utils::Timestamp get_timestamp(std::string_view column) const;
    [[nodiscard]] nlohmann::json get_json(std::string_view column) const;

    [[nodiscard]] std::optional<std::string> optional_string(std::string_view column) const;
    [[nodiscard]] std::optional<int64_t> optional_int(std::string_view column) const;
    [[nodiscard]] std::optional<bool> optional_bool(std::string_view column) const;
    [[nodiscard]] std::optional<utils::Timestamp> optional_timestamp(std::string_view column) const;
    [[nodiscard]] std::optional<nlohmann::json> optional_json(std::string_view column) const;

private:
    [[nodiscard]] const std::optional<std::string>* find(std::string_view column) const;
    [[nodiscard]] const std::string& require(std::string_view column) const;
    [[noreturn]] void fail(std::string_view column, std::string_view reason) const;

    std::shared_ptr<const ColumnIndex> index_;
    std::vector<std::optional<std::string>> values_;
    std::string source_;
};

} // namespace paydb
