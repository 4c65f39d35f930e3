#include "db/generic_connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace paydb {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    std::string role,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      role_(std::move(role)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(std::max<size_t>(config.max_connections, 1))) {}

GenericConnectionPool::~GenericConnectionPool() {
    if (!is_open()) return;
    try {
        drain();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("ConnectionPool '{}/{}' drain on destruction failed: {}",
            db_name_, role_, e.what()));
    }
}

void GenericConnectionPool::open() {
    if (is_open()) return;

    std::deque<std::unique_ptr<IDbConnection>> warmed;
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            for (auto& c : warmed) {
                retire(std::move(c));
            }
            throw ConnectionError(db_name_, std::format(
                "failed to establish {} connection {} of {} for database '{}'",
                role_, i + 1, config_.min_connections, db_name_));
        }
        warmed.emplace_back(std::move(conn));
    }

    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto& conn : warmed) {
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
            idle_connections_.emplace_back(std::move(conn));
        }
    }
    open_.store(true, std::memory_order_release);

    utils::log::info(std::format("ConnectionPool opened for database '{}' ({}): {} connections (min={}, max={})",
        db_name_, role_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire() {
    return acquire(config_.connection_timeout);
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (!is_open()) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Re-check after acquiring the slot: drain() may have run meanwhile
    if (!is_open()) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point birth{};
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = created_at_.find(conn.get()); it != created_at_.end()) {
                birth = it->second;
            }
            if (const auto it = last_used_.find(conn.get()); it != last_used_.end()) {
                last_used = it->second;
            }
        }
    }

    const auto replace = [this](std::unique_ptr<IDbConnection> stale) {
        retire(std::move(stale));
        auto fresh = create_connection();
        if (fresh) {
            const auto now = std::chrono::steady_clock::now();
            std::lock_guard lock(mutex_);
            created_at_[fresh.get()] = now;
            last_used_[fresh.get()] = now;
        }
        return fresh;
    };

    if (!conn) {
        conn = create_connection();
        if (conn) {
            const auto now = std::chrono::steady_clock::now();
            birth = now;
            last_used = now;
            std::lock_guard lock(mutex_);
            created_at_[conn.get()] = now;
            last_used_[conn.get()] = now;
        }
    } else if (config_.max_lifetime.count() > 0 &&
               std::chrono::steady_clock::now() - birth > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        conn = replace(std::move(conn));
    } else if (std::chrono::steady_clock::now() - last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Only long-idle connections pay for the health-check round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        conn = replace(std::move(conn));
    }

    if (!conn) {
        semaphore_.release();
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool broken) {
        this->return_connection(std::move(c), broken);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    open_.store(false, std::memory_order_release);

    std::deque<std::unique_ptr<IDbConnection>> to_close;
    {
        std::lock_guard lock(mutex_);
        to_close.swap(idle_connections_);
        created_at_.clear();
        last_used_.clear();
    }

    // Attempt every close; report the first failure once all are done
    std::exception_ptr first_failure;
    for (auto& conn : to_close) {
        try {
            conn->close();
        } catch (...) {
            if (!first_failure) first_failure = std::current_exception();
        }
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    }
    to_close.clear();

    if (first_failure) {
        try {
            std::rethrow_exception(first_failure);
        } catch (const std::exception& e) {
            utils::log::error(std::format("ConnectionPool drain failed for database '{}' ({}): {}",
                db_name_, role_, e.what()));
            throw ConnectionError(db_name_, std::format(
                "failed to release {} connection for database '{}': {}", role_, db_name_, e.what()));
        }
    }

    utils::log::info(std::format("ConnectionPool drained for database '{}' ({})", db_name_, role_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        utils::log::warn(std::format("Failed to create {} connection for database '{}'",
            role_, db_name_));
        return nullptr;
    }

    if (config_.statement_timeout.count() > 0 &&
        !conn->set_query_timeout(static_cast<uint32_t>(config_.statement_timeout.count()))) {
        utils::log::warn(std::format("Failed to set statement_timeout on {} connection for database '{}'",
            role_, db_name_));
    }

    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

void GenericConnectionPool::retire(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    try {
        conn->close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Closing retired {} connection for database '{}' failed: {}",
            role_, db_name_, e.what()));
    }
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool broken) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (broken || !is_open()) {
        if (broken) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        }
        retire(std::move(conn));
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on the next
    // acquire via the idle_timeout check
    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace paydb
