#include "clients/stripe_client_pool.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace paydb {

StripeClientPool::StripeClientPool(const StripeConfig& config)
    : StripeClientPool(config, [](std::function<void()> loop) { return std::thread(std::move(loop)); }) {}

StripeClientPool::StripeClientPool(const StripeConfig& config, const ThreadStarter& start_thread)
    : worker_count_(config.max_workers > 0 ? config.max_workers : 1) {

    for (const auto& settings : config.clients) {
        clients_.insert_or_assign(settings.country, StripeClient{settings.country, settings.api_key});
    }

    workers_.reserve(worker_count_);
    try {
        for (size_t i = 0; i < worker_count_; ++i) {
            workers_.push_back(start_thread([this] { worker_loop(); }));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Stripe client pool failed to start worker {} of {}: {}",
            workers_.size() + 1, worker_count_, e.what()));
        {
            std::lock_guard lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        join_workers();
        throw;
    }

    utils::log::info(std::format("Stripe client pool started: {} countries, {} workers",
        clients_.size(), worker_count_));
}

StripeClientPool::~StripeClientPool() {
    shutdown(true);
}

bool StripeClientPool::has_country(const std::string& country) const {
    return clients_.contains(country);
}

const StripeClient& StripeClientPool::client_for(const std::string& country) const {
    const auto it = clients_.find(country);
    if (it == clients_.end()) {
        throw std::invalid_argument(std::format("no stripe client configured for country '{}'", country));
    }
    return it->second;
}

void StripeClientPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("stripe client pool is shut down");
        }
        queue_.push_back(std::move(job));
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
    queue_cv_.notify_one();
}

void StripeClientPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores any exception in the caller's future
        job();
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

void StripeClientPool::shutdown(bool wait) {
    bool first_call = false;
    {
        std::lock_guard lock(queue_mutex_);
        if (!stopping_) {
            stopping_ = true;
            first_call = true;
        }
    }
    if (first_call) {
        queue_cv_.notify_all();
        shut_down_.store(true, std::memory_order_release);
        utils::log::info(std::format("Stripe client pool shutting down (wait={})", utils::booltostr(wait)));
    }

    if (wait) {
        join_workers();
    }
}

void StripeClientPool::join_workers() {
    std::lock_guard lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

StripeClientPool::Stats StripeClientPool::get_stats() const {
    std::lock_guard lock(queue_mutex_);
    return {
        .submitted = submitted_.load(std::memory_order_relaxed),
        .completed = completed_.load(std::memory_order_relaxed),
        .queued = queue_.size(),
    };
}

} // namespace paydb
