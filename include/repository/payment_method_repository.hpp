#pragma once

#include "model/payment_method.hpp"
#include "repository/repository_executor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paydb {

class DatabaseHandle;

/**
 * @brief PGP payment method and Stripe card storage
 *
 * Point lookups read master; per-owner listings read replica.
 */
class IPaymentMethodRepository {
public:
    virtual ~IPaymentMethodRepository() = default;

    // pgp_payment_methods
    [[nodiscard]] virtual PgpPaymentMethod insert_pgp_payment_method(
        const InsertPgpPaymentMethodInput& input) = 0;
    [[nodiscard]] virtual std::optional<PgpPaymentMethod> get_pgp_payment_method_by_id(
        const GetPgpPaymentMethodByIdInput& input) = 0;
    [[nodiscard]] virtual std::optional<PgpPaymentMethod> update_pgp_payment_method(
        const UpdatePgpPaymentMethodSetInput& set, const UpdatePgpPaymentMethodWhereInput& where) = 0;
    [[nodiscard]] virtual std::vector<PgpPaymentMethod> list_pgp_payment_methods_by_payer_id(
        const std::string& payer_id) = 0;

    // stripe_card
    [[nodiscard]] virtual StripeCard insert_stripe_card(const InsertStripeCardInput& input) = 0;
    [[nodiscard]] virtual std::optional<StripeCard> get_stripe_card_by_id(
        const GetStripeCardByIdInput& input) = 0;
    [[nodiscard]] virtual std::optional<StripeCard> update_stripe_card(
        const UpdateStripeCardSetInput& set, const UpdateStripeCardWhereInput& where) = 0;
    [[nodiscard]] virtual std::vector<StripeCard> list_stripe_cards_by_consumer_id(
        int64_t consumer_id) = 0;
};

class PaymentMethodRepository final : public IPaymentMethodRepository {
public:
    /**
     * @param payment_db payin_paymentdb (pgp_payment_methods)
     * @param main_db payin_maindb (stripe_card)
     */
    PaymentMethodRepository(const DatabaseHandle& payment_db, const DatabaseHandle& main_db);

    [[nodiscard]] PgpPaymentMethod insert_pgp_payment_method(
        const InsertPgpPaymentMethodInput& input) override;
    [[nodiscard]] std::optional<PgpPaymentMethod> get_pgp_payment_method_by_id(
        const GetPgpPaymentMethodByIdInput& input) override;
    [[nodiscard]] std::optional<PgpPaymentMethod> update_pgp_payment_method(
        const UpdatePgpPaymentMethodSetInput& set, const UpdatePgpPaymentMethodWhereInput& where) override;
    [[nodiscard]] std::vector<PgpPaymentMethod> list_pgp_payment_methods_by_payer_id(
        const std::string& payer_id) override;

    [[nodiscard]] StripeCard insert_stripe_card(const InsertStripeCardInput& input) override;
    [[nodiscard]] std::optional<StripeCard> get_stripe_card_by_id(
        const GetStripeCardByIdInput& input) override;
    [[nodiscard]] std::optional<StripeCard> update_stripe_card(
        const UpdateStripeCardSetInput& set, const UpdateStripeCardWhereInput& where) override;
    [[nodiscard]] std::vector<StripeCard> list_stripe_cards_by_consumer_id(int64_t consumer_id) override;

private:
    RepositoryExecutor payment_db_;
    RepositoryExecutor main_db_;
};

} // namespace paydb
