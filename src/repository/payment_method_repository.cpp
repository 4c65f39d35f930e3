#include "repository/payment_method_repository.hpp"

#include <stdexcept>

namespace paydb {

PaymentMethodRepository::PaymentMethodRepository(
    const DatabaseHandle& payment_db, const DatabaseHandle& main_db)
    : payment_db_(payment_db), main_db_(main_db) {}

// ============================================================================
// pgp_payment_methods
// ============================================================================

PgpPaymentMethod PaymentMethodRepository::insert_pgp_payment_method(
    const InsertPgpPaymentMethodInput& input) {
    return payment_db_.insert_one<PgpPaymentMethod>(input.to_columns(), "insert_pgp_payment_method");
}

std::optional<PgpPaymentMethod> PaymentMethodRepository::get_pgp_payment_method_by_id(
    const GetPgpPaymentMethodByIdInput& input) {
    Where where;
    if (input.id) {
        where.eq("id", *input.id);
    } else if (input.pgp_resource_id) {
        where.eq("pgp_resource_id", *input.pgp_resource_id);
    } else {
        throw std::invalid_argument("get_pgp_payment_method_by_id: no lookup key supplied");
    }
    return payment_db_.find_one<PgpPaymentMethod>(where, Route::MASTER, "get_pgp_payment_method_by_id");
}

std::optional<PgpPaymentMethod> PaymentMethodRepository::update_pgp_payment_method(
    const UpdatePgpPaymentMethodSetInput& set, const UpdatePgpPaymentMethodWhereInput& where) {
    return payment_db_.update_one<PgpPaymentMethod>(
        set.to_columns(), Where().eq("id", where.id), "update_pgp_payment_method");
}

std::vector<PgpPaymentMethod> PaymentMethodRepository::list_pgp_payment_methods_by_payer_id(
    const std::string& payer_id) {
    return payment_db_.find_all<PgpPaymentMethod>(
        Where().eq("payer_id", payer_id), Route::REPLICA,
        "list_pgp_payment_methods_by_payer_id", "id");
}

// ============================================================================
// stripe_card
// ============================================================================

StripeCard PaymentMethodRepository::insert_stripe_card(const InsertStripeCardInput& input) {
    return main_db_.insert_one<StripeCard>(input.to_columns(), "insert_stripe_card");
}

std::optional<StripeCard> PaymentMethodRepository::get_stripe_card_by_id(
    const GetStripeCardByIdInput& input) {
    Where where;
    if (input.id) {
        where.eq("id", *input.id);
    } else if (input.stripe_id) {
        where.eq("stripe_id", *input.stripe_id);
    } else {
        throw std::invalid_argument("get_stripe_card_by_id: no lookup key supplied");
    }
    return main_db_.find_one<StripeCard>(where, Route::MASTER, "get_stripe_card_by_id");
}

std::optional<StripeCard> PaymentMethodRepository::update_stripe_card(
    const UpdateStripeCardSetInput& set, const UpdateStripeCardWhereInput& where) {
    return main_db_.update_one<StripeCard>(
        set.to_columns(), Where().eq("id", where.id), "update_stripe_card");
}

std::vector<StripeCard> PaymentMethodRepository::list_stripe_cards_by_consumer_id(int64_t consumer_id) {
    return main_db_.find_all<StripeCard>(
        Where().eq("consumer_id", consumer_id), Route::REPLICA,
        "list_stripe_cards_by_consumer_id", "id");
}

} // namespace paydb
