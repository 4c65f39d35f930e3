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
// payers (payin_paymentdb)
// ============================================================================

struct Payer {
    static constexpr std::string_view kTable = "payers";
    static constexpr std::array<std::string_view, 11> kColumns = {
        "id", "payer_type", "country", "legacy_stripe_customer_id", "account_balance",
        "description", "dd_payer_id", "metadata", "created_at", "updated_at", "deleted_at",
    };

    std::string id;
    std::string payer_type;
    std::string country;
    std::optional<std::string> legacy_stripe_customer_id;
    std::optional<int64_t> account_balance;
    std::optional<std::string> description;
    std::optional<std::string> dd_payer_id;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;
    std::optional<utils::Timestamp> deleted_at;

    [[nodiscard]] static Payer from_row(const DbRow& row);
    bool operator==(const Payer&) const = default;
};

struct InsertPayerInput {
    std::string id;
    std::string payer_type;
    std::string country;
    std::optional<std::string> legacy_stripe_customer_id;
    std::optional<int64_t> account_balance;
    std::optional<std::string> description;
    std::optional<std::string> dd_payer_id;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

/**
 * @brief Payer lookup; exactly one key is expected
 *
 * Keys are tried in order: id, legacy_stripe_customer_id, dd_payer_id.
 */
struct GetPayerByIdInput {
    std::optional<std::string> id;
    std::optional<std::string> legacy_stripe_customer_id;
    std::optional<std::string> dd_payer_id;
};

struct UpdatePayerSetInput {
    Patch<std::string> legacy_stripe_customer_id;
    Patch<int64_t> account_balance;
    Patch<std::string> description;
    Patch<nlohmann::json> metadata;
    Patch<utils::Timestamp> updated_at;
    Patch<utils::Timestamp> deleted_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

struct UpdatePayerWhereInput {
    std::string id;
};

// ============================================================================
// pgp_customers (payin_paymentdb)
// ============================================================================

struct PgpCustomer {
    static constexpr std::string_view kTable = "pgp_customers";
    static constexpr std::array<std::string_view, 16> kColumns = {
        "id", "payer_id", "pgp_resource_id", "currency", "pgp_code", "legacy_id",
        "legacy_stripe_customer_id", "account_balance", "description",
        "default_payment_method_id", "legacy_default_source_id", "legacy_default_card_id",
        "metadata", "created_at", "updated_at", "deleted_at",
    };

    std::string id;
    std::string payer_id;
    std::string pgp_resource_id;
    std::optional<std::string> currency;
    std::optional<std::string> pgp_code;
    std::optional<int64_t> legacy_id;
    std::optional<std::string> legacy_stripe_customer_id;
    std::optional<int64_t> account_balance;
    std::optional<std::string> description;
    std::optional<std::string> default_payment_method_id;
    std::optional<std::string> legacy_default_source_id;
    std::optional<std::string> legacy_default_card_id;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;
    std::optional<utils::Timestamp> deleted_at;

    [[nodiscard]] static PgpCustomer from_row(const DbRow& row);
    bool operator==(const PgpCustomer&) const = default;
};

struct InsertPgpCustomerInput {
    std::string id;
    std::string payer_id;
    std::string pgp_resource_id;
    std::optional<std::string> currency;
    std::optional<std::string> pgp_code;
    std::optional<int64_t> legacy_id;
    std::optional<std::string> legacy_stripe_customer_id;
    std::optional<int64_t> account_balance;
    std::optional<std::string> description;
    std::optional<std::string> default_payment_method_id;
    std::optional<std::string> legacy_default_source_id;
    std::optional<std::string> legacy_default_card_id;
    std::optional<nlohmann::json> metadata;
    std::optional<utils::Timestamp> created_at;
    std::optional<utils::Timestamp> updated_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

// payer_id is required; pgp_code narrows to one provider when supplied
struct GetPgpCustomerInput {
    std::string payer_id;
    std::optional<std::string> pgp_code;
};

struct UpdatePgpCustomerSetInput {
    Patch<std::string> default_payment_method_id;
    Patch<std::string> legacy_default_source_id;
    Patch<std::string> legacy_default_card_id;
    Patch<utils::Timestamp> updated_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

struct UpdatePgpCustomerWhereInput {
    std::string id;
};

// ============================================================================
// stripe_customer (payin_maindb)
// ============================================================================

struct StripeCustomer {
    static constexpr std::string_view kTable = "stripe_customer";
    static constexpr std::array<std::string_view, 8> kColumns = {
        "id", "stripe_id", "country_shortname", "owner_type", "owner_id",
        "default_card", "default_source", "created_at",
    };

    int64_t id = 0;
    std::string stripe_id;
    std::string country_shortname;
    std::string owner_type;
    int64_t owner_id = 0;
    std::optional<std::string> default_card;
    std::optional<std::string> default_source;
    std::optional<utils::Timestamp> created_at;

    [[nodiscard]] static StripeCustomer from_row(const DbRow& row);
    bool operator==(const StripeCustomer&) const = default;
};

// id is assigned by the database
struct InsertStripeCustomerInput {
    std::string stripe_id;
    std::string country_shortname;
    std::string owner_type;
    int64_t owner_id = 0;
    std::optional<std::string> default_card;
    std::optional<std::string> default_source;
    std::optional<utils::Timestamp> created_at;

    [[nodiscard]] ColumnValues to_columns() const;
};

// Keys tried in order: id, stripe_id
struct GetStripeCustomerInput {
    std::optional<int64_t> id;
    std::optional<std::string> stripe_id;
};

struct UpdateStripeCustomerSetInput {
    Patch<std::string> default_card;
    Patch<std::string> default_source;

    [[nodiscard]] ColumnValues to_columns() const;
};

struct UpdateStripeCustomerWhereInput {
    int64_t id = 0;
};

} // namespace paydb
