#include "model/transfer.hpp"

namespace paydb {

Transfer Transfer::from_row(const DbRow& row) {
    return Transfer{
        .id = row.get_int("id"),
        .subtotal = row.get_int("subtotal"),
        .adjustments = row.get_int("adjustments"),
        .amount = row.get_int("amount"),
        .method = row.get_string("method"),
        .currency = row.optional_string("currency"),
        .status = row.optional_string("status"),
        .submitted_at = row.optional_timestamp("submitted_at"),
        .submitted_by_id = row.optional_int("submitted_by_id"),
        .submitting_at = row.optional_timestamp("submitting_at"),
        .stripe_transfer_id = row.optional_string("stripe_transfer_id"),
        .payment_account_id = row.optional_int("payment_account_id"),
        .recipient_id = row.optional_int("recipient_id"),
        .recipient_ct_id = row.optional_int("recipient_ct_id"),
        .manual_transfer_reason = row.optional_string("manual_transfer_reason"),
        .status_code = row.optional_string("status_code"),
        .deleted_at = row.optional_timestamp("deleted_at"),
        .created_at = row.get_timestamp("created_at"),
    };
}

ColumnValues TransferCreate::to_columns(utils::Timestamp created_at) const {
    ColumnValues values;
    values.set("subtotal", subtotal)
          .set("adjustments", adjustments)
          .set("amount", amount)
          .set("method", method)
          .set_if_present("currency", currency)
          .set_if_present("status", status)
          .set_if_present("submitted_at", submitted_at)
          .set_if_present("submitted_by_id", submitted_by_id)
          .set_if_present("submitting_at", submitting_at)
          .set_if_present("stripe_transfer_id", stripe_transfer_id)
          .set_if_present("payment_account_id", payment_account_id)
          .set_if_present("recipient_id", recipient_id)
          .set_if_present("recipient_ct_id", recipient_ct_id)
          .set_if_present("manual_transfer_reason", manual_transfer_reason)
          .set_if_present("status_code", status_code)
          .set("created_at", created_at);
    return values;
}

ColumnValues TransferUpdate::to_columns() const {
    ColumnValues values;
    values.set_patch("subtotal", subtotal)
          .set_patch("adjustments", adjustments)
          .set_patch("amount", amount)
          .set_patch("method", method)
          .set_patch("currency", currency)
          .set_patch("status", status)
          .set_patch("submitted_at", submitted_at)
          .set_patch("submitted_by_id", submitted_by_id)
          .set_patch("submitting_at", submitting_at)
          .set_patch("stripe_transfer_id", stripe_transfer_id)
          .set_patch("payment_account_id", payment_account_id)
          .set_patch("recipient_id", recipient_id)
          .set_patch("recipient_ct_id", recipient_ct_id)
          .set_patch("manual_transfer_reason", manual_transfer_reason)
          .set_patch("status_code", status_code)
          .set_patch("deleted_at", deleted_at);
    return values;
}

} // namespace paydb
