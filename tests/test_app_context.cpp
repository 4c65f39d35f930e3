#include <catch2/catch_test_macros.hpp>
#include "context/app_context.hpp"
#include "core/error.hpp"
#include "mocks/mock_connection.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

using namespace paydb;
using namespace paydb::testing;

namespace {

std::string master_of(std::string_view db) { return std::format("host={}-master", db); }
std::string replica_of(std::string_view db) { return std::format("host={}-replica", db); }

AppConfig test_config(std::vector<std::string> maindb_replicas = {}) {
    AppConfig config;
    config.database_defaults.master_min_connections = 1;
    config.database_defaults.replica_min_connections = 1;
    config.database_defaults.connection_timeout = std::chrono::milliseconds(50);

    for (const auto name : db_names::kAll) {
        DatabaseEndpointConfig db;
        db.name = std::string(name);
        db.master_url = master_of(name);
        db.replica_url = replica_of(name);
        config.databases.emplace(db.name, db);
    }

    config.replica_selection.available_maindb_replicas = std::move(maindb_replicas);
    config.stripe.max_workers = 2;
    config.stripe.clients.push_back({.country = "US", .api_key = "sk_test"});
    config.dsj.base_url = "http://127.0.0.1:1";
    return config;
}

bool was_requested(const MockConnectionFactory& factory, const std::string& endpoint) {
    const auto requested = factory.requested();
    return std::find(requested.begin(), requested.end(), endpoint) != requested.end();
}

} // namespace

TEST_CASE("AppContext: create connects every database", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto ctx = AppContext::create(test_config(), factory);

    for (const auto name : db_names::kAll) {
        CHECK(ctx->database(name).is_connected());
    }
    CHECK(ctx->payout_bankdb().id() == "payout_bankdb");
    CHECK(ctx->ledger_paymentdb().replica_endpoint() == replica_of(db_names::kLedgerPaymentDb));
    CHECK(factory->open_connections() == 12);
    CHECK_FALSE(ctx->selected_maindb_replica().has_value());
    CHECK(ctx->stripe().has_country("US"));
    CHECK_FALSE(ctx->dsj_client().has_valid_token());

    CHECK_THROWS_AS(ctx->database("unknown_db"), std::invalid_argument);

    ctx->close();
    CHECK(ctx->is_closed());
    CHECK(factory->open_connections() == 0);
}

TEST_CASE("AppContext: maindb handles share one alternative replica", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto ctx = AppContext::create(test_config({"host=r1", "host=r2"}), factory);

    REQUIRE(ctx->selected_maindb_replica().has_value());
    const auto chosen = *ctx->selected_maindb_replica();
    CHECK((chosen == "host=r1" || chosen == "host=r2"));

    CHECK(ctx->payout_maindb().replica_endpoint() == chosen);
    CHECK(ctx->payin_maindb().replica_endpoint() == chosen);
    CHECK(ctx->ledger_maindb().replica_endpoint() == chosen);

    // Non-maindb databases keep their own replicas
    CHECK(ctx->payout_bankdb().replica_endpoint() == replica_of(db_names::kPayoutBankDb));
    CHECK(ctx->payin_paymentdb().replica_endpoint() == replica_of(db_names::kPayinPaymentDb));
    CHECK(ctx->ledger_paymentdb().replica_endpoint() == replica_of(db_names::kLedgerPaymentDb));

    const std::string other = chosen == "host=r1" ? "host=r2" : "host=r1";
    CHECK_FALSE(was_requested(*factory, other));
    ctx->close();
}

TEST_CASE("AppContext: pinned replica selection", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto config = test_config({"host=r1", "host=r2"});
    config.replica_selection.mode = ReplicaSelectionMode::PINNED;
    config.replica_selection.pinned_index = 1;

    auto ctx = AppContext::create(config, factory);
    CHECK(ctx->selected_maindb_replica() == std::optional<std::string>("host=r2"));
    ctx->close();
}

TEST_CASE("AppContext: first connect failure stops startup", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->fail_connect_to(master_of(db_names::kPayinMainDb));

    try {
        (void)AppContext::create(test_config(), factory);
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        CHECK(e.db_id() == "payin_maindb");
    }

    // Databases after the failing one are never attempted
    CHECK_FALSE(was_requested(*factory, master_of(db_names::kPayinPaymentDb)));
    CHECK_FALSE(was_requested(*factory, master_of(db_names::kLedgerMainDb)));
    CHECK_FALSE(was_requested(*factory, master_of(db_names::kLedgerPaymentDb)));

    // Databases connected before it were released
    CHECK(was_requested(*factory, master_of(db_names::kPayoutMainDb)));
    CHECK(factory->open_connections() == 0);
}

TEST_CASE("AppContext: missing database config is rejected", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto config = test_config();
    config.databases.erase("ledger_maindb");

    CHECK_THROWS_AS(AppContext::create(config, factory), std::invalid_argument);
    CHECK(factory->requested().empty());
}

TEST_CASE("AppContext: disconnect failure still releases everything", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->fail_close_for(replica_of(db_names::kPayoutBankDb));

    auto ctx = AppContext::create(test_config(), factory);

    try {
        ctx->close();
        FAIL("expected ConnectionError");
    } catch (const ConnectionError& e) {
        CHECK(e.db_id() == "payout_bankdb");
    }

    CHECK(ctx->is_closed());
    CHECK(ctx->stripe().is_shut_down());
    CHECK(factory->open_connections() == 0);
    for (const auto name : db_names::kAll) {
        CHECK_FALSE(ctx->database(name).is_connected());
    }
}

TEST_CASE("AppContext: close is idempotent", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto ctx = AppContext::create(test_config(), factory);

    ctx->close();
    CHECK_NOTHROW(ctx->close());
    CHECK(factory->closed() == 12);
}

TEST_CASE("AppContext: destruction closes an open context", "[context]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    {
        auto ctx = AppContext::create(test_config(), factory);
        CHECK(factory->open_connections() == 12);
    }
    CHECK(factory->open_connections() == 0);
}

// ============================================================================
// ContextSlot
// ============================================================================

TEST_CASE("ContextSlot: attach, get, detach", "[context][slot]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    std::shared_ptr<AppContext> ctx = AppContext::create(test_config(), factory);

    ContextSlot slot;
    CHECK_FALSE(slot.exists());

    slot.attach(ctx);
    CHECK(slot.exists());
    CHECK(&slot.get() == ctx.get());

    auto detached = slot.detach(*ctx);
    CHECK(detached == ctx);
    CHECK_FALSE(slot.exists());
    detached->close();
}

TEST_CASE("ContextSlot: misuse raises InvariantViolation", "[context][slot]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    std::shared_ptr<AppContext> first = AppContext::create(test_config(), factory);
    std::shared_ptr<AppContext> second = AppContext::create(test_config(), factory);

    ContextSlot slot;
    CHECK_THROWS_AS(slot.get(), InvariantViolation);
    CHECK_THROWS_AS(slot.detach(*first), InvariantViolation);
    CHECK_THROWS_AS(slot.attach(nullptr), InvariantViolation);

    slot.attach(first);
    CHECK_THROWS_AS(slot.attach(second), InvariantViolation);
    CHECK_THROWS_AS(slot.detach(*second), InvariantViolation);
    CHECK(&slot.get() == first.get());

    (void)slot.detach(*first);
    first->close();
    second->close();
}
