#pragma once

#include "core/patch.hpp"
#include "core/utils.hpp"
#include "db/db_row.hpp"
#include "db/statement.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paydb {

namespace transfer_methods {
    inline constexpr std::string_view kStripe = "stripe";
}

// ============================================================================
// transfers (payout_maindb)
// ============================================================================

struct Transfer {
    static constexpr std::string_view kTable = "transfers";
    static constexpr std::array<std::string_view, 18> kColumns = {
        "id", "subtotal", "adjustments", "amount", "method", "currency", "status",
        "submitted_at", "submitted_by_id", "submitting_at", "stripe_transfer_id",
        "payment_account_id", "recipient_id", "recipient_ct_id", "manual_transfer_reason",
        "status_code", "deleted_at", "created_at",
    };

    int64_t id = 0;
    int64_t subtotal = 0;
    int64_t adjustments = 0;
    int64_t amount = 0;
    std::string method;
    std::optional<std::string> currency;
    std::optional<std::string> status;
    std::optional<utils::Timestamp> submitted_at;
    std::optional<int64_t> submitted_by_id;
    std::optional<utils::Timestamp> submitting_at;
    std::optional<std::string> stripe_transfer_id;
    std::optional<int64_t> payment_account_id;
    std::optional<int64_t> recipient_id;
    std::optional<int64_t> recipient_ct_id;
    std::optional<std::string> manual_transfer_reason;
    std::optional<std::string> status_code;
    std::optional<utils::Timestamp> deleted_at;
    utils::Timestamp created_at;

    [[nodiscard]] static Transfer from_row(const DbRow& row);
    bool operator==(const Transfer&) const = default;
};

/**
 * @brief New transfer; created_at is stamped by the repository
 */
struct TransferCreate {
    int64_t subtotal = 0;
    int64_t adjustments = 0;
    int64_t amount = 0;
    std::string method;
    std::optional<std::string> currency;
    std::optional<std::string> status;
    std::optional<utils::Timestamp> submitted_at;
    std::optional<int64_t> submitted_by_id;
    std::optional<utils::Timestamp> submitting_at;
    std::optional<std::string> stripe_transfer_id;
    std::optional<int64_t> payment_account_id;
    std::optional<int64_t> recipient_id;
    std::optional<int64_t> recipient_ct_id;
    std::optional<std::string> manual_transfer_reason;
    std::optional<std::string> status_code;

    [[nodiscard]] ColumnValues to_columns(utils::Timestamp created_at) const;
};

struct TransferUpdate {
    Patch<int64_t> subtotal;
    Patch<int64_t> adjustments;
    Patch<int64_t> amount;
    Patch<std::string> method;
    Patch<std::string> currency;
    Patch<std::string> status;
    Patch<utils::Timestamp> submitted_at;
    Patch<int64_t> submitted_by_id;
    Patch<utils::Timestamp> submitting_at;
    Patch<std::string> stripe_transfer_id;
    Patch<int64_t> payment_account_id;
    Patch<int64_t> recipient_id;
    Patch<int64_t> recipient_ct_id;
    Patch<std::string> manual_transfer_reason;
    Patch<std::string> status_code;
    Patch<utils::Timestamp> deleted_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

} // namespace paydb
