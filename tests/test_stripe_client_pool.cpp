#include <catch2/catch_test_macros.hpp>
#include "clients/stripe_client_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace paydb;

namespace {

StripeConfig two_countries(size_t workers) {
    StripeConfig config;
    config.max_workers = workers;
    config.clients.push_back({.country = "US", .api_key = "sk_us"});
    config.clients.push_back({.country = "CA", .api_key = "sk_ca"});
    return config;
}

} // namespace

TEST_CASE("StripeClientPool: submit runs with the country's client", "[clients][stripe]") {
    StripeClientPool pool(two_countries(2));
    CHECK(pool.worker_count() == 2);

    auto us = pool.submit("US", [](const StripeClient& c) { return c.api_key; });
    auto ca = pool.submit("CA", [](const StripeClient& c) { return c.country; });

    CHECK(us.get() == "sk_us");
    CHECK(ca.get() == "CA");
}

TEST_CASE("StripeClientPool: exceptions reach the future", "[clients][stripe]") {
    StripeClientPool pool(two_countries(1));

    auto failing = pool.submit("US", [](const StripeClient&) -> int {
        throw std::runtime_error("card_declined");
    });
    CHECK_THROWS_AS(failing.get(), std::runtime_error);

    // Worker survives the failure
    auto ok = pool.submit("US", [](const StripeClient&) { return 7; });
    CHECK(ok.get() == 7);
}

TEST_CASE("StripeClientPool: unknown country is rejected", "[clients][stripe]") {
    StripeClientPool pool(two_countries(1));
    CHECK_FALSE(pool.has_country("MX"));
    CHECK_THROWS_AS(pool.submit("MX", [](const StripeClient&) { return 0; }), std::invalid_argument);
}

TEST_CASE("StripeClientPool: work runs concurrently up to max_workers", "[clients][stripe]") {
    StripeClientPool pool(two_countries(3));

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(pool.submit("US", [&](const StripeClient&) {
            const int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            running.fetch_sub(1);
        }));
    }
    for (auto& f : futures) f.get();

    CHECK(peak.load() <= 3);
    CHECK(peak.load() >= 1);
    CHECK(pool.get_stats().completed == 6);
}

TEST_CASE("StripeClientPool: shutdown stops intake but drains the queue", "[clients][stripe]") {
    StripeClientPool pool(two_countries(1));

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit("CA", [&](const StripeClient&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        }));
    }

    pool.shutdown(true);
    CHECK(pool.is_shut_down());
    CHECK(done.load() == 4);

    CHECK_THROWS_AS(pool.submit("CA", [](const StripeClient&) { return 1; }), std::runtime_error);
}

TEST_CASE("StripeClientPool: non-waiting shutdown returns immediately", "[clients][stripe]") {
    StripeClientPool pool(two_countries(1));
    auto pending = pool.submit("US", [](const StripeClient&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return 1;
    });

    pool.shutdown(false);
    CHECK(pool.is_shut_down());
    CHECK(pending.get() == 1);

    // Repeated shutdown is harmless
    pool.shutdown(true);
}

TEST_CASE("StripeClientPool: failed worker launch joins the started workers", "[clients][stripe]") {
    std::atomic<int> launched{0};
    std::atomic<int> exited{0};
    const StripeClientPool::ThreadStarter start = [&](std::function<void()> loop) {
        if (launched.load() == 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        launched.fetch_add(1);
        return std::thread([&exited, loop = std::move(loop)] {
            loop();
            exited.fetch_add(1);
        });
    };

    CHECK_THROWS_AS(StripeClientPool(two_countries(4), start), std::system_error);
    CHECK(launched.load() == 2);
    CHECK(exited.load() == 2);
}
