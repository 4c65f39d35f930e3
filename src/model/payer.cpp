#include "model/payer.hpp"

namespace paydb {

// ============================================================================
// Payer
// ============================================================================

Payer Payer::from_row(const DbRow& row) {
    return Payer{
        .id = row.get_string("id"),
        .payer_type = row.get_string("payer_type"),
        .country = row.get_string("country"),
        .legacy_stripe_customer_id = row.optional_string("legacy_stripe_customer_id"),
        .account_balance = row.optional_int("account_balance"),
        .description = row.optional_string("description"),
        .dd_payer_id = row.optional_string("dd_payer_id"),
        .metadata = row.optional_json("metadata"),
        .created_at = row.optional_timestamp("created_at"),
        .updated_at = row.optional_timestamp("updated_at"),
        .deleted_at = row.optional_timestamp("deleted_at"),
    };
}

ColumnValues InsertPayerInput::to_columns() const {
    ColumnValues values;
    values.set("id", id)
          .set("payer_type", payer_type)
          .set("country", country)
          .set_if_present("legacy_stripe_customer_id", legacy_stripe_customer_id)
          .set_if_present("account_balance", account_balance)
          .set_if_present("description", description)
          .set_if_present("dd_payer_id", dd_payer_id)
          .set_if_present("metadata", metadata)
          .set_if_present("created_at", created_at)
          .set_if_present("updated_at", updated_at);
    return values;
}

ColumnValues UpdatePayerSetInput::to_columns() const {
    ColumnValues values;
    values.set_patch("legacy_stripe_customer_id", legacy_stripe_customer_id)
          .set_patch("account_balance", account_balance)
          .set_patch("description", description)
          .set_patch("metadata", metadata)
          .set_patch("updated_at", updated_at)
          .set_patch("deleted_at", deleted_at);
    return values;
}

// ============================================================================
// PgpCustomer
// ============================================================================

PgpCustomer PgpCustomer::from_row(const DbRow& row) {
    return PgpCustomer{
        .id = row.get_string("id"),
        .payer_id = row.get_string("payer_id"),
        .pgp_resource_id = row.get_string("pgp_resource_id"),
        .currency = row.optional_string("currency"),
        .pgp_code = row.optional_string("pgp_code"),
        .legacy_id = row.optional_int("legacy_id"),
        .legacy_stripe_customer_id = row.optional_string("legacy_stripe_customer_id"),
        .account_balance = row.optional_int("account_balance"),
        .description = row.optional_string("description"),
        .default_payment_method_id = row.optional_string("default_payment_method_id"),
        .legacy_default_source_id = row.optional_string("legacy_default_source_id"),
        .legacy_default_card_id = row.optional_string("legacy_default_card_id"),
        .metadata = row.optional_json("metadata"),
        .created_at = row.optional_timestamp("created_at"),
        .updated_at = row.optional_timestamp("updated_at"),
        .deleted_at = row.optional_timestamp("deleted_at"),
    };
}

ColumnValues InsertPgpCustomerInput::to_columns() const {
    ColumnValues values;
    values.set("id", id)
          .set("payer_id", payer_id)
          .set("pgp_resource_id", pgp_resource_id)
          .set_if_present("currency", currency)
          .set_if_present("pgp_code", pgp_code)
          .set_if_present("legacy_id", legacy_id)
          .set_if_present("legacy_stripe_customer_id", legacy_stripe_customer_id)
          .set_if_present("account_balance", account_balance)
          .set_if_present("description", description)
          .set_if_present("default_payment_method_id", default_payment_method_id)
          .set_if_present("legacy_default_source_id", legacy_default_source_id)
          .set_if_present("legacy_default_card_id", legacy_default_card_id)
          .set_if_present("metadata", metadata)
          .set_if_present("created_at", created_at)
          .set_if_present("updated_at", updated_at);
    return values;
}

ColumnValues UpdatePgpCustomerSetInput::to_columns() const {
    ColumnValues values;
    values.set_patch("default_payment_method_id", default_payment_method_id)
          .set_patch("legacy_default_source_id", legacy_default_source_id)
          .set_patch("legacy_default_card_id", legacy_default_card_id)
          .set_patch("updated_at", updated_at);
    return values;
}

// ============================================================================
// StripeCustomer
// ============================================================================

StripeCustomer StripeCustomer::from_row(const DbRow& row) {
    return StripeCustomer{
        .id = row.get_int("id"),
        .stripe_id = row.get_string("stripe_id"),
        .country_shortname = row.get_string("country_shortname"),
        .owner_type = row.get_string("owner_type"),
        .owner_id = row.get_int("owner_id"),
        .default_card = row.optional_string("default_card"),
        .default_source = row.optional_string("default_source"),
        .created_at = row.optional_timestamp("created_at"),
    };
}

ColumnValues InsertStripeCustomerInput::to_columns() const {
    ColumnValues values;
    values.set("stripe_id", stripe_id)
          .set("country_shortname", country_shortname)
          .set("owner_type", owner_type)
          .set("owner_id", owner_id)
          .set_if_present("default_card", default_card)
          .set_if_present("default_source", default_source)
          .set_if_present("created_at", created_at);
    return values;
}

ColumnValues UpdateStripeCustomerSetInput::to_columns() const {
    ColumnValues values;
    values.set_patch("default_card", default_card)
          .set_patch("default_source", default_source);
    return values;
}

} // namespace paydb
