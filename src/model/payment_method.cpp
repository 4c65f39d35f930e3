#include "model/payment_method.hpp"

namespace paydb {

PgpPaymentMethod PgpPaymentMethod::from_row(const DbRow& row) {
    return PgpPaymentMethod{
        .id = row.get_string("id"),
        .pgp_code = row.get_string("pgp_code"),
        .pgp_resource_id = row.get_string("pgp_resource_id"),
        .payer_id = row.optional_string("payer_id"),
        .legacy_consumer_id = row.optional_string("legacy_consumer_id"),
        .object = row.optional_string("object"),
        .type = row.optional_string("type"),
        .metadata = row.optional_json("metadata"),
        .created_at = row.optional_timestamp("created_at"),
        .updated_at = row.optional_timestamp("updated_at"),
        .deleted_at = row.optional_timestamp("deleted_at"),
        .attached_at = row.optional_timestamp("attached_at"),
        .detached_at = row.optional_timestamp("detached_at"),
    };
}

ColumnValues InsertPgpPaymentMethodInput::to_columns() const {
    ColumnValues values;
    values.set("id", id)
          .set("pgp_code", pgp_code)
          .set("pgp_resource_id", pgp_resource_id)
          .set_if_present("payer_id", payer_id)
          .set_if_present("legacy_consumer_id", legacy_consumer_id)
          .set_if_present("object", object)
          .set_if_present("type", type)
          .set_if_present("metadata", metadata)
          .set_if_present("created_at", created_at)
          .set_if_present("updated_at", updated_at)
          .set_if_present("attached_at", attached_at);
    return values;
}

ColumnValues UpdatePgpPaymentMethodSetInput::to_columns() const {
    ColumnValues values;
    values.set_patch("payer_id", payer_id)
          .set_patch("deleted_at", deleted_at)
          .set_patch("updated_at", updated_at)
          .set_patch("detached_at", detached_at);
    return values;
}

StripeCard StripeCard::from_row(const DbRow& row) {
    return StripeCard{
        .id = row.get_int("id"),
        .stripe_id = row.get_string("stripe_id"),
        .fingerprint = row.get_string("fingerprint"),
        .last4 = row.get_string("last4"),
        .dynamic_last4 = row.get_string("dynamic_last4"),
        .exp_month = row.get_string("exp_month"),
        .exp_year = row.get_string("exp_year"),
        .type = row.get_string("type"),
        .active = row.get_bool("active"),
        .country_of_origin = row.optional_string("country_of_origin"),
        .zip_code = row.optional_string("zip_code"),
        .consumer_id = row.optional_int("consumer_id"),
        .stripe_customer_id = row.optional_int("stripe_customer_id"),
        .external_stripe_customer_id = row.optional_string("external_stripe_customer_id"),
        .tokenization_method = row.optional_string("tokenization_method"),
        .address_line1_check = row.optional_string("address_line1_check"),
        .address_zip_check = row.optional_string("address_zip_check"),
        .validation_card_id = row.optional_string("validation_card_id"),
        .created_at = row.optional_timestamp("created_at"),
        .removed_at = row.optional_timestamp("removed_at"),
    };
}

ColumnValues InsertStripeCardInput::to_columns() const {
    ColumnValues values;
    values.set("stripe_id", stripe_id)
          .set("fingerprint", fingerprint)
          .set("last4", last4)
          .set("dynamic_last4", dynamic_last4)
          .set("exp_month", exp_month)
          .set("exp_year", exp_year)
          .set("type", type)
          .set("active", active)
          .set_if_present("country_of_origin", country_of_origin)
          .set_if_present("zip_code", zip_code)
          .set_if_present("consumer_id", consumer_id)
          .set_if_present("stripe_customer_id", stripe_customer_id)
          .set_if_present("external_stripe_customer_id", external_stripe_customer_id)
          .set_if_present("tokenization_method", tokenization_method)
          .set_if_present("address_line1_check", address_line1_check)
          .set_if_present("address_zip_check", address_zip_check)
          .set_if_present("validation_card_id", validation_card_id)
          .set_if_present("created_at", created_at);
    return values;
}

ColumnValues UpdateStripeCardSetInput::to_columns() const {
    ColumnValues values;
    values.set_patch("active", active)
          .set_patch("removed_at", removed_at);
    return values;
}

} // namespace paydb
