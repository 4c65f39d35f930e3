#pragma once

#include "model/payer.hpp"
#include "repository/repository_executor.hpp"

#include <optional>

namespace paydb {

class DatabaseHandle;

/**
 * @brief Payer, PGP customer and Stripe customer storage
 *
 * Every read goes to master: payer flows read their own writes.
 */
class IPayerRepository {
public:
    virtual ~IPayerRepository() = default;

    // payers
    [[nodiscard]] virtual Payer insert_payer(const InsertPayerInput& input) = 0;

    /**
     * @throws std::invalid_argument if no lookup key is populated
     */
    [[nodiscard]] virtual std::optional<Payer> get_payer_by_id(const GetPayerByIdInput& input) = 0;

    [[nodiscard]] virtual std::optional<Payer> update_payer_by_id(
        const UpdatePayerSetInput& set, const UpdatePayerWhereInput& where) = 0;

    // pgp_customers
    [[nodiscard]] virtual PgpCustomer insert_pgp_customer(const InsertPgpCustomerInput& input) = 0;
    [[nodiscard]] virtual std::optional<PgpCustomer> get_pgp_customer(const GetPgpCustomerInput& input) = 0;
    [[nodiscard]] virtual std::optional<PgpCustomer> update_pgp_customer(
        const UpdatePgpCustomerSetInput& set, const UpdatePgpCustomerWhereInput& where) = 0;

    // stripe_customer
    [[nodiscard]] virtual StripeCustomer insert_stripe_customer(const InsertStripeCustomerInput& input) = 0;
    [[nodiscard]] virtual std::optional<StripeCustomer> get_stripe_customer(
        const GetStripeCustomerInput& input) = 0;
    [[nodiscard]] virtual std::optional<StripeCustomer> update_stripe_customer(
        const UpdateStripeCustomerSetInput& set, const UpdateStripeCustomerWhereInput& where) = 0;
};

class PayerRepository final : public IPayerRepository {
public:
    /**
     * @param payment_db payin_paymentdb (payers, pgp_customers)
     * @param main_db payin_maindb (stripe_customer)
     */
    PayerRepository(const DatabaseHandle& payment_db, const DatabaseHandle& main_db);

    [[nodiscard]] Payer insert_payer(const InsertPayerInput& input) override;
    [[nodiscard]] std::optional<Payer> get_payer_by_id(const GetPayerByIdInput& input) override;
    [[nodiscard]] std::optional<Payer> update_payer_by_id(
        const UpdatePayerSetInput& set, const UpdatePayerWhereInput& where) override;

    [[nodiscard]] PgpCustomer insert_pgp_customer(const InsertPgpCustomerInput& input) override;
    [[nodiscard]] std::optional<PgpCustomer> get_pgp_customer(const GetPgpCustomerInput& input) override;
    [[nodiscard]] std::optional<PgpCustomer> update_pgp_customer(
        const UpdatePgpCustomerSetInput& set, const UpdatePgpCustomerWhereInput& where) override;

    [[nodiscard]] StripeCustomer insert_stripe_customer(const InsertStripeCustomerInput& input) override;
    [[nodiscard]] std::optional<StripeCustomer> get_stripe_customer(
        const GetStripeCustomerInput& input) override;
    [[nodiscard]] std::optional<StripeCustomer> update_stripe_customer(
        const UpdateStripeCustomerSetInput& set, const UpdateStripeCustomerWhereInput& where) override;

private:
    RepositoryExecutor payment_db_;
    RepositoryExecutor main_db_;
};

} // namespace paydb
