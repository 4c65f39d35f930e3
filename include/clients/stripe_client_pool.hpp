#pragma once

#include "config/config_types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace paydb {

/**
 * @brief Credentials for one Stripe platform account (per country)
 */
struct StripeClient {
    std::string country;
    std::string api_key;
};

/**
 * @brief Worker pool for the blocking payment-gateway SDK
 *
 * Calls are submitted per country and run on one of max_workers threads;
 * results and exceptions come back through std::future.
 *
 * Lifecycle:
 *   submit(...)      -> accepted until shutdown()
 *   shutdown(true)   -> stop intake, drain the queue, join workers now
 *   shutdown(false)  -> stop intake, return immediately; queued work still
 *                       drains and the destructor joins
 */
class StripeClientPool {
public:
    // Launches one worker thread running the given loop
    using ThreadStarter = std::function<std::thread(std::function<void()>)>;

    explicit StripeClientPool(const StripeConfig& config);

    /**
     * @brief Construct with a custom thread launcher
     *
     * If a launch throws, workers already started are stopped and joined
     * before the exception propagates.
     */
    StripeClientPool(const StripeConfig& config, const ThreadStarter& start_thread);
    ~StripeClientPool();

    StripeClientPool(const StripeClientPool&) = delete;
    StripeClientPool& operator=(const StripeClientPool&) = delete;
    StripeClientPool(StripeClientPool&&) = delete;
    StripeClientPool& operator=(StripeClientPool&&) = delete;

    /**
     * @brief Run fn(const StripeClient&) on a worker
     * @throws std::invalid_argument for an unconfigured country
     * @throws std::runtime_error after shutdown()
     */
    template<typename Fn>
    [[nodiscard]] auto submit(const std::string& country, Fn fn)
        -> std::future<std::invoke_result_t<Fn, const StripeClient&>> {
        using Result = std::invoke_result_t<Fn, const StripeClient&>;

        const StripeClient& client = client_for(country);
        auto task = std::make_shared<std::packaged_task<Result()>>(
            [&client, fn = std::move(fn)]() mutable { return fn(client); });
        auto future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    void shutdown(bool wait);

    [[nodiscard]] bool is_shut_down() const { return shut_down_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t worker_count() const { return worker_count_; }
    [[nodiscard]] bool has_country(const std::string& country) const;

    struct Stats {
        uint64_t submitted;
        uint64_t completed;
        size_t queued;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] const StripeClient& client_for(const std::string& country) const;
    void enqueue(std::function<void()> job);
    void worker_loop();
    void join_workers();

    std::unordered_map<std::string, StripeClient> clients_;
    size_t worker_count_;

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool stopping_ = false;

    std::mutex join_mutex_;
    std::atomic<bool> shut_down_{false};

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> completed_{0};
};

} // namespace paydb
