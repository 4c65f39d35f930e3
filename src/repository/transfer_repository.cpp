#include "repository/transfer_repository.hpp"

#include <array>
#include <string>

namespace paydb {

TransferRepository::TransferRepository(const DatabaseHandle& main_db)
    : main_db_(main_db) {}

Transfer TransferRepository::create_transfer(const TransferCreate& data) {
    return main_db_.insert_one<Transfer>(data.to_columns(utils::now_utc()), "create_transfer");
}

std::optional<Transfer> TransferRepository::get_transfer_by_id(int64_t transfer_id) {
    return main_db_.find_one<Transfer>(
        Where().eq("id", transfer_id), Route::REPLICA, "get_transfer_by_id");
}

std::vector<Transfer> TransferRepository::get_transfers_by_ids(const std::vector<int64_t>& transfer_ids) {
    if (transfer_ids.empty()) {
        return {};
    }
    return main_db_.find_all<Transfer>(
        Where().in("id", transfer_ids), Route::MASTER, "get_transfers_by_ids", "id");
}

std::vector<int64_t> TransferRepository::get_transfers_by_submitted_at_and_method(
    utils::Timestamp start_time, std::string_view method) {
    static constexpr std::array<std::string_view, 1> kIdColumn = {"id"};

    Where where;
    where.ge("submitted_at", start_time)
         .eq("method", std::string(method));

    auto rows = main_db_.fetch_all(
        statements::select_where(Transfer::kTable, kIdColumn, where, "id"),
        Route::REPLICA, "get_transfers_by_submitted_at_and_method");

    std::vector<int64_t> ids;
    ids.reserve(rows.size());
    for (const auto& row : rows) {
        ids.push_back(row.get_int("id"));
    }
    return ids;
}

std::optional<Transfer> TransferRepository::update_transfer_by_id(
    int64_t transfer_id, const TransferUpdate& data) {
    return main_db_.update_one<Transfer>(
        data.to_columns(), Where().eq("id", transfer_id), "update_transfer_by_id");
}

} // namespace paydb
