#pragma once

#include "clients/dsj_client.hpp"
#include "clients/stripe_client_pool.hpp"
#include "config/config_types.hpp"
#include "db/database_handle.hpp"
#include "db/iconnection_factory.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paydb {

/**
 * @brief Process-wide owner of every logical database and external client
 *
 * Built once at startup, frozen afterwards: request handling only reads it.
 * Repositories borrow DatabaseHandle references and must not outlive it.
 *
 * Startup (create):
 *   1. pick the alternative maindb replica once
 *   2. build the six handles (maindb handles share the selected replica)
 *   3. connect them one by one in declared order; the first failure
 *      disconnects what was already connected and propagates
 *   4. build the Stripe client pool and the DSJ client
 *
 * Shutdown (close):
 *   disconnect all handles concurrently, then always shut the Stripe pool
 *   down, then rethrow the first disconnect failure.
 */
class AppContext {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @throws ConnectionError naming the first database that failed to connect
     * @throws std::invalid_argument if a logical database is missing from config
     * @throws std::out_of_range for a pinned replica index past the candidates
     */
    [[nodiscard]] static std::unique_ptr<AppContext> create(
        const AppConfig& config,
        std::shared_ptr<IConnectionFactory> connection_factory);

    // Constructible only through create()
    explicit AppContext(PrivateTag) {}
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    /**
     * @brief Release every database and the Stripe pool; second call is a no-op
     * @throws ConnectionError first disconnect failure, after the pool is released
     */
    void close();

    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] const DatabaseHandle& payout_maindb() const { return *payout_maindb_; }
    [[nodiscard]] const DatabaseHandle& payout_bankdb() const { return *payout_bankdb_; }
    [[nodiscard]] const DatabaseHandle& payin_maindb() const { return *payin_maindb_; }
    [[nodiscard]] const DatabaseHandle& payin_paymentdb() const { return *payin_paymentdb_; }
    [[nodiscard]] const DatabaseHandle& ledger_maindb() const { return *ledger_maindb_; }
    [[nodiscard]] const DatabaseHandle& ledger_paymentdb() const { return *ledger_paymentdb_; }

    /**
     * @throws std::invalid_argument for an unknown logical database id
     */
    [[nodiscard]] const DatabaseHandle& database(std::string_view db_id) const;

    [[nodiscard]] StripeClientPool& stripe() const { return *stripe_; }
    [[nodiscard]] DsjClient& dsj_client() const { return *dsj_client_; }

    /**
     * @brief Replica endpoint shared by the maindb handles, if one was selected
     */
    [[nodiscard]] const std::optional<std::string>& selected_maindb_replica() const {
        return selected_maindb_replica_;
    }

private:
    void disconnect_connected() noexcept;

    // Declared connect order; owns the handles
    std::vector<std::unique_ptr<DatabaseHandle>> databases_;

    DatabaseHandle* payout_maindb_ = nullptr;
    DatabaseHandle* payout_bankdb_ = nullptr;
    DatabaseHandle* payin_maindb_ = nullptr;
    DatabaseHandle* payin_paymentdb_ = nullptr;
    DatabaseHandle* ledger_maindb_ = nullptr;
    DatabaseHandle* ledger_paymentdb_ = nullptr;

    std::optional<std::string> selected_maindb_replica_;
    std::unique_ptr<StripeClientPool> stripe_;
    std::unique_ptr<DsjClient> dsj_client_;

    std::atomic<bool> closed_{false};
};

/**
 * @brief Explicit holder the hosting layer attaches the context to
 *
 * Misuse is a caller bug and raises InvariantViolation:
 *   attach while attached, get while empty, detach of a different context.
 */
class ContextSlot {
public:
    void attach(std::shared_ptr<AppContext> context);
    [[nodiscard]] AppContext& get() const;
    [[nodiscard]] bool exists() const;

    /**
     * @return the detached context, so the caller can close it
     */
    std::shared_ptr<AppContext> detach(const AppContext& context);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<AppContext> context_;
};

} // namespace paydb
