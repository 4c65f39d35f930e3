#include <catch2/catch_test_macros.hpp>
#include "clients/dsj_client.hpp"

#include <httplib.h>

#include <atomic>
#include <format>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace paydb;

namespace {

DsjConfig unreachable() {
    DsjConfig config;
    // Port 1 on loopback refuses connections immediately
    config.base_url = "http://127.0.0.1:1";
    config.email = "ops@example.com";
    config.password = "secret";
    config.timeout = std::chrono::milliseconds(500);
    return config;
}

// Loopback back-office API served from a background thread
struct FakeDsjServer {
    httplib::Server server;
    std::thread thread;
    int port = 0;
    std::atomic<int> auth_calls{0};
    std::mutex mutex;
    std::string last_authorization;

    FakeDsjServer() {
        port = server.bind_to_any_port("127.0.0.1");
    }

    // Handlers must be registered before start()
    void start() {
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeDsjServer() {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    void issue_token(const std::string& body) {
        server.Post(DsjClient::kAuthPath, [this, body](const httplib::Request&, httplib::Response& res) {
            auth_calls.fetch_add(1);
            res.set_content(body, "application/json");
        });
    }

    DsjConfig config() const {
        DsjConfig cfg;
        cfg.base_url = std::format("http://127.0.0.1:{}", port);
        cfg.email = "ops@example.com";
        cfg.password = "secret";
        cfg.timeout = std::chrono::milliseconds(2000);
        return cfg;
    }
};

} // namespace

TEST_CASE("DsjClient: construction performs no I/O", "[clients][dsj]") {
    DsjClient client(unreachable());
    CHECK(client.base_url() == "http://127.0.0.1:1");
    CHECK_FALSE(client.has_valid_token());
}

TEST_CASE("DsjClient: transport failure surfaces as runtime_error", "[clients][dsj]") {
    DsjClient client(unreachable());

    CHECK_THROWS_AS(client.get("/v1/transfers/1/"), std::runtime_error);
    CHECK_THROWS_AS(client.post("/v1/transfers/", nlohmann::json{{"amount", 100}}), std::runtime_error);
    CHECK_FALSE(client.has_valid_token());
}

TEST_CASE("DsjClient: token is fetched once and sent as Bearer", "[clients][dsj]") {
    FakeDsjServer dsj;
    dsj.issue_token(R"({"token":"jwt-1"})");
    dsj.server.Get("/v1/transfers/1/", [&dsj](const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard lock(dsj.mutex);
            dsj.last_authorization = req.get_header_value("Authorization");
        }
        res.set_content(R"({"id":1,"status":"paid"})", "application/json");
    });

    dsj.start();
    DsjClient client(dsj.config());
    auto first = client.get("/v1/transfers/1/");
    auto second = client.get("/v1/transfers/1/");

    CHECK(first["status"] == "paid");
    CHECK(second["id"] == 1);
    CHECK(dsj.auth_calls.load() == 1);
    CHECK(client.has_valid_token());

    std::lock_guard lock(dsj.mutex);
    CHECK(dsj.last_authorization == "Bearer jwt-1");
}

TEST_CASE("DsjClient: expired token is refreshed", "[clients][dsj]") {
    FakeDsjServer dsj;
    dsj.issue_token(R"({"token":"jwt-1"})");
    dsj.server.Get("/v1/ping/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{}", "application/json");
    });

    dsj.start();
    auto cfg = dsj.config();
    cfg.jwt_token_ttl = std::chrono::seconds(0);
    DsjClient client(cfg);

    (void)client.get("/v1/ping/");
    (void)client.get("/v1/ping/");
    CHECK(dsj.auth_calls.load() == 2);
    CHECK_FALSE(client.has_valid_token());
}

TEST_CASE("DsjClient: non-2xx response raises runtime_error", "[clients][dsj]") {
    FakeDsjServer dsj;
    dsj.issue_token(R"({"token":"jwt-1"})");
    dsj.server.Post("/v1/transfers/", [](const httplib::Request&, httplib::Response& res) {
        res.status = 500;
        res.set_content(R"({"error":"internal"})", "application/json");
    });

    dsj.start();
    DsjClient client(dsj.config());
    CHECK_THROWS_AS(client.post("/v1/transfers/", nlohmann::json{{"amount", 100}}), std::runtime_error);
    // Token itself was obtained
    CHECK(client.has_valid_token());
}

TEST_CASE("DsjClient: auth response without a token is rejected", "[clients][dsj]") {
    FakeDsjServer dsj;
    dsj.issue_token(R"({"detail":"ok"})");
    dsj.server.Get("/v1/transfers/1/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{}", "application/json");
    });

    dsj.start();
    DsjClient client(dsj.config());
    CHECK_THROWS_AS(client.get("/v1/transfers/1/"), std::runtime_error);
    CHECK_FALSE(client.has_valid_token());
}
