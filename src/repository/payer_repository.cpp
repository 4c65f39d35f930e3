#include "repository/payer_repository.hpp"

#include <stdexcept>

namespace paydb {

PayerRepository::PayerRepository(const DatabaseHandle& payment_db, const DatabaseHandle& main_db)
    : payment_db_(payment_db), main_db_(main_db) {}

// ============================================================================
// payers
// ============================================================================

Payer PayerRepository::insert_payer(const InsertPayerInput& input) {
    return payment_db_.insert_one<Payer>(input.to_columns(), "insert_payer");
}

std::optional<Payer> PayerRepository::get_payer_by_id(const GetPayerByIdInput& input) {
    Where where;
    if (input.id) {
        where.eq("id", *input.id);
    } else if (input.legacy_stripe_customer_id) {
        where.eq("legacy_stripe_customer_id", *input.legacy_stripe_customer_id);
    } else if (input.dd_payer_id) {
        where.eq("dd_payer_id", *input.dd_payer_id);
    } else {
        throw std::invalid_argument("get_payer_by_id: no lookup key supplied");
    }
    return payment_db_.find_one<Payer>(where, Route::MASTER, "get_payer_by_id");
}

std::optional<Payer> PayerRepository::update_payer_by_id(
    const UpdatePayerSetInput& set, const UpdatePayerWhereInput& where) {
    return payment_db_.update_one<Payer>(
        set.to_columns(), Where().eq("id", where.id), "update_payer_by_id");
}

// ============================================================================
// pgp_customers
// ============================================================================

PgpCustomer PayerRepository::insert_pgp_customer(const InsertPgpCustomerInput& input) {
    return payment_db_.insert_one<PgpCustomer>(input.to_columns(), "insert_pgp_customer");
}

std::optional<PgpCustomer> PayerRepository::get_pgp_customer(const GetPgpCustomerInput& input) {
    Where where;
    where.eq("payer_id", input.payer_id);
    if (input.pgp_code) {
        where.eq("pgp_code", *input.pgp_code);
    }
    return payment_db_.find_one<PgpCustomer>(where, Route::MASTER, "get_pgp_customer");
}

std::optional<PgpCustomer> PayerRepository::update_pgp_customer(
    const UpdatePgpCustomerSetInput& set, const UpdatePgpCustomerWhereInput& where) {
    return payment_db_.update_one<PgpCustomer>(
        set.to_columns(), Where().eq("id", where.id), "update_pgp_customer");
}

// ============================================================================
// stripe_customer
// ============================================================================

StripeCustomer PayerRepository::insert_stripe_customer(const InsertStripeCustomerInput& input) {
    return main_db_.insert_one<StripeCustomer>(input.to_columns(), "insert_stripe_customer");
}

std::optional<StripeCustomer> PayerRepository::get_stripe_customer(const GetStripeCustomerInput& input) {
    Where where;
    if (input.id) {
        where.eq("id", *input.id);
    } else if (input.stripe_id) {
        where.eq("stripe_id", *input.stripe_id);
    } else {
        throw std::invalid_argument("get_stripe_customer: no lookup key supplied");
    }
    return main_db_.find_one<StripeCustomer>(where, Route::MASTER, "get_stripe_customer");
}

std::optional<StripeCustomer> PayerRepository::update_stripe_customer(
    const UpdateStripeCustomerSetInput& set, const UpdateStripeCustomerWhereInput& where) {
    return main_db_.update_one<StripeCustomer>(
        set.to_columns(), Where().eq("id", where.id), "update_stripe_customer");
}

} // namespace paydb
