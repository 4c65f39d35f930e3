#pragma once

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace httplib {
class Client;
}

namespace paydb {

/**
 * @brief Back-office (DSJ) HTTP API client
 *
 * Authenticates with email/password on first use (POST /v1/auth/token/) and
 * reuses the JWT until jwt_token_ttl has elapsed. Construction performs no
 * network I/O.
 *
 * Non-2xx responses and transport failures raise std::runtime_error.
 */
class DsjClient {
public:
    explicit DsjClient(DsjConfig config);
    ~DsjClient();

    DsjClient(const DsjClient&) = delete;
    DsjClient& operator=(const DsjClient&) = delete;

    [[nodiscard]] nlohmann::json get(const std::string& path);
    [[nodiscard]] nlohmann::json post(const std::string& path, const nlohmann::json& body);

    /**
     * @brief True while a token obtained earlier is still within its TTL
     */
    [[nodiscard]] bool has_valid_token() const;

    [[nodiscard]] const std::string& base_url() const { return config_.base_url; }

    static constexpr const char* kAuthPath = "/v1/auth/token/";

private:
    [[nodiscard]] std::string bearer_token();
    [[nodiscard]] std::unique_ptr<httplib::Client> make_client() const;

    DsjConfig config_;

    mutable std::mutex token_mutex_;
    std::string jwt_;
    std::chrono::steady_clock::time_point jwt_expires_at_{};
};

} // namespace paydb
