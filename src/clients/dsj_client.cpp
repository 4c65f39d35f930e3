#include "clients/dsj_client.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace paydb {

namespace {

constexpr const char* kJsonContentType = "application/json";

nlohmann::json parse_response(const httplib::Result& res, std::string_view method, const std::string& path) {
    if (!res) {
        throw std::runtime_error(std::format("DSJ {} {} failed: {}",
            method, path, httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error(std::format("DSJ {} {} returned HTTP {}: {}",
            method, path, res->status, res->body));
    }
    if (res->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::format("DSJ {} {} returned invalid JSON: {}", method, path, e.what()));
    }
}

} // anonymous namespace

DsjClient::DsjClient(DsjConfig config)
    : config_(std::move(config)) {}

DsjClient::~DsjClient() = default;

std::unique_ptr<httplib::Client> DsjClient::make_client() const {
    auto client = std::make_unique<httplib::Client>(config_.base_url);
    const auto timeout = config_.timeout;
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
    client->set_connection_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    client->set_read_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    client->set_write_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    return client;
}

bool DsjClient::has_valid_token() const {
    std::lock_guard lock(token_mutex_);
    return !jwt_.empty() && std::chrono::steady_clock::now() < jwt_expires_at_;
}

std::string DsjClient::bearer_token() {
    std::lock_guard lock(token_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (!jwt_.empty() && now < jwt_expires_at_) {
        return jwt_;
    }

    const nlohmann::json credentials = {
        {"email", config_.email},
        {"password", config_.password},
    };

    auto client = make_client();
    auto res = client->Post(kAuthPath, credentials.dump(), kJsonContentType);
    const auto body = parse_response(res, "POST", kAuthPath);

    if (!body.contains("token") || !body["token"].is_string()) {
        throw std::runtime_error("DSJ auth response has no token");
    }

    jwt_ = body["token"].get<std::string>();
    jwt_expires_at_ = now + config_.jwt_token_ttl;
    utils::log::debug(std::format("DSJ token refreshed, valid for {}s", config_.jwt_token_ttl.count()));
    return jwt_;
}

nlohmann::json DsjClient::get(const std::string& path) {
    const httplib::Headers headers = {
        {"Authorization", std::format("Bearer {}", bearer_token())},
    };
    auto client = make_client();
    return parse_response(client->Get(path, headers), "GET", path);
}

nlohmann::json DsjClient::post(const std::string& path, const nlohmann::json& body) {
    const httplib::Headers headers = {
        {"Authorization", std::format("Bearer {}", bearer_token())},
    };
    auto client = make_client();
    return parse_response(client->Post(path, headers, body.dump(), kJsonContentType), "POST", path);
}

} // namespace paydb
