#pragma once

#include "core/patch.hpp"
#include "core/utils.hpp"
#include "db/db_row.hpp"
#include "db/statement.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paydb {

// ============================================================================
// pgp_payment_methods (payin_paymentdb)
// ============================================================================

struct PgpPaymentMethod {
    static constexpr std::string_view kTable = "pgp_payment_methods";
    static constexpr std::array<std::string_view, 13> kColumns = {
        "id", "pgp_code", "pgp_resource_id", "payer_id", "legacy_consumer_id", "object",
        "type", "metadata", "created_at", "updated_at", "deleted_at", "attached_at",
        "detached_at",
    };

    std::string id;
    std::string pgp_code;
    std::string pgp_resource_id;
    std::optional<std::string> payer_id;
    std::optional<std::string> legacy_consumer_id;
    std::optional<std::string> object;
    std::optional<std::string> type;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;
    std::optional<utils::Timestamp> deleted_at;
    std::optional<utils::Timestamp> attached_at;
    std::optional<utils::Timestamp> detached_at;

    [[nodiscard]] static PgpPaymentMethod from_row(const DbRow& row);
    bool operator==(const PgpPaymentMethod&) const = default;
};

struct InsertPgpPaymentMethodInput {
    std::string id;
    std::string pgp_code;
    std::string pgp_resource_id;
    std::optional<std::string> payer_id;
    std::optional<std::string> legacy_consumer_id;
    std::optional<std::string> object;
    std::optional<std::string> type;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;
    std::optional<utils::Timestamp> attached_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

// Keys tried in order: id, pgp_resource_id
struct GetPgpPaymentMethodByIdInput {
    std::optional<std::string> id;
    std::optional<std::string> pgp_resource_id;
};

struct UpdatePgpPaymentMethodSetInput {
    Patch<std::string> payer_id;
    Patch<utils::Timestamp> deleted_at;
    Patch<utils::Timestamp> updated_at;
    Patch<utils::Timestamp> detached_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

struct UpdatePgpPaymentMethodWhereInput {
    std::string id;
};

// ============================================================================
// stripe_card (payin_maindb)
// ============================================================================

struct StripeCard {
    static constexpr std::string_view kTable = "stripe_card";
    static constexpr std::array<std::string_view, 20> kColumns = {
        "id", "stripe_id", "fingerprint", "last4", "dynamic_last4", "exp_month", "exp_year",
        "type", "active", "country_of_origin", "zip_code", "consumer_id", "stripe_customer_id",
        "external_stripe_customer_id", "tokenization_method", "address_line1_check",
        "address_zip_check", "validation_card_id", "created_at", "removed_at",
    };

    int64_t id = 0;
    std::string stripe_id;
    std::string fingerprint;
    std::string last4;
    std::string dynamic_last4;
    std::string exp_month;
    std::string exp_year;
    std::string type;
    bool active = true;
    std::optional<std::string> country_of_origin;
    std::optional<std::string> zip_code;
    std::optional<int64_t> consumer_id;
    std::optional<int64_t> stripe_customer_id;
    std::optional<std::string> external_stripe_customer_id;
    std::optional<std::string> tokenization_method;
    std::optional<std::string> address_line1_check;
    std::optional<std::string> address_zip_check;
    std::optional<std::string> validation_card_id;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> removed_at;

    [[nodiscard]] static StripeCard from_row(const DbRow& row);
    bool operator==(const StripeCard&) const = default;
};

// id is assigned by the database
struct InsertStripeCardInput {
    std::string stripe_id;
    std::string fingerprint;
    std::string last4;
    std::string dynamic_last4;
    std::string exp_month;
    std::string exp_year;
    std::string type;
    bool active = true;
    std::optional<std::string> country_of_origin;
    std::optional<std::string> zip_code;
    std::optional<int64_t> consumer_id;
    std::optional<int64_t> stripe_customer_id;
    std::optional<std::string> external_stripe_customer_id;
    std::optional<std::string> tokenization_method;
    std::optional<std::string> address_line1_check;
    std::optional<std::string> address_zip_check;
    std::optional<std::string> validation_card_id;
    std::optional<utils::Timestamp> created_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

// Keys tried in order: id, stripe_id
struct GetStripeCardByIdInput {
    std::optional<int64_t> id;
    std::optional<std::string> stripe_id;
};

struct UpdateStripeCardSetInput {
    Patch<bool> active;
    Patch<utils::Timestamp> removed_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

struct UpdateStripeCardWhereInput {
    int64_t id = 0;
};

} // namespace paydb
