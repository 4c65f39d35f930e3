#include "db/db_row.hpp"
#include "core/error.hpp"

#include <format>

namespace paydb {

DbRow::DbRow(std::shared_ptr<const ColumnIndex> index,
             std::vector<std::optional<std::string>> values,
             std::string source)
    : index_(std::move(index)),
      values_(std::move(values)),
      source_(std::move(source)) {}

std::vector<DbRow> DbRow::from_result(
    const std::vector<std::string>& column_names,
    std::vector<std::vector<std::optional<std::string>>> rows,
    const std::string& source) {

    auto index = std::make_shared<ColumnIndex>();
    for (size_t i = 0; i < column_names.size(); ++i) {
        index->emplace(column_names[i], i);
    }

    std::vector<DbRow> result;
    result.reserve(rows.size());
    for (auto& row : rows) {
        result.emplace_back(index, std::move(row), source);
    }
    return result;
}

const std::optional<std::string>* DbRow::find(std::string_view column) const {
    const auto it = index_->find(std::string(column));
    if (it == index_->end() || it->second >= values_.size()) {
        return nullptr;
    }
    return &values_[it->second];
}

bool DbRow::has_column(std::string_view column) const {
    return find(column) != nullptr;
}

bool DbRow::is_null(std::string_view column) const {
    const auto* value = find(column);
    return value == nullptr || !value->has_value();
}

void DbRow::fail(std::string_view column, std::string_view reason) const {
    throw QueryError(source_, std::format("column '{}': {}", column, reason));
}

const std::string& DbRow::require(std::string_view column) const {
    const auto* value = find(column);
    if (!value) fail(column, "not present in result");
    if (!value->has_value()) fail(column, "unexpected NULL");
    return **value;
}

// ---- required accessors ---------------------------------------------------

std::string DbRow::get_string(std::string_view column) const {
    return require(column);
}

int64_t DbRow::get_int(std::string_view column) const {
    const auto& text = require(column);
    const auto parsed = utils::try_parse_int<int64_t>(text);
    if (!parsed) fail(column, std::format("'{}' is not an integer", text));
    return *parsed;
}

bool DbRow::get_bool(std::string_view column) const {
    const auto& text = require(column);
    if (text == "t" || text == "true") return true;
    if (text == "f" || text == "false") return false;
    fail(column, std::format("'{}' is not a boolean", text));
}

utils::Timestamp DbRow::get_timestamp(std::string_view column) const {
    const auto& text = require(column);
    const auto parsed = utils::parse_timestamp(text);
    if (!parsed) fail(column, std::format("'{}' is not a timestamp", text));
    return *parsed;
}

nlohmann::json DbRow::get_json(std::string_view column) const {
    const auto& text = require(column);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        fail(column, std::format("invalid JSON: {}", e.what()));
    }
}

// ---- optional accessors ---------------------------------------------------

std::optional<std::string> DbRow::optional_string(std::string_view column) const {
    if (is_null(column)) return std::nullopt;
    return get_string(column);
}

std::optional<int64_t> DbRow::optional_int(std::string_view column) const {
    if (is_null(column)) return std::nullopt;
    return get_int(column);
}

std::optional<bool> DbRow::optional_bool(std::string_view column) const {
    if (is_null(column)) return std::nullopt;
    return get_bool(column);
}

std::optional<utils::Timestamp> DbRow::optional_timestamp(std::string_view column) const {
    if (is_null(column)) return std::nullopt;
    return get_timestamp(column);
}

std::optional<nlohmann::json> DbRow::optional_json(std::string_view column) const {
    if (is_null(column)) return std::nullopt;
    return get_json(column);
}

} // namespace paydb
