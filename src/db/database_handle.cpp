#include "db/database_handle.hpp"
#include "db/generic_connection_pool.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <exception>
#include <format>

namespace paydb {

namespace {
constexpr const char* kMasterRole = "master";
constexpr const char* kReplicaRole = "replica";
} // anonymous namespace

const char* database_state_to_string(DatabaseHandle::State state) {
    switch (state) {
        case DatabaseHandle::State::DISCONNECTED: return "disconnected";
        case DatabaseHandle::State::CONNECTING:   return "connecting";
        case DatabaseHandle::State::CONNECTED:    return "connected";
        default:                                  return "unknown";
    }
}

DatabaseHandle::DatabaseHandle(std::string db_id,
                               PoolConfig master,
                               PoolConfig replica,
                               std::shared_ptr<IConnectionFactory> factory)
    : db_id_(std::move(db_id)),
      master_config_(std::move(master)),
      replica_config_(std::move(replica)) {

    master_pool_ = std::make_shared<GenericConnectionPool>(
        db_id_, kMasterRole, master_config_, factory);

    if (!replica_config_.connection_string.empty()) {
        replica_pool_ = std::make_shared<GenericConnectionPool>(
            db_id_, kReplicaRole, replica_config_, std::move(factory));
    }
}

DatabaseHandle::~DatabaseHandle() {
    if (!is_connected()) return;
    try {
        disconnect();
    } catch (const ConnectionError& e) {
        utils::log::warn(std::format("Database '{}' disconnect on destruction failed: {}",
            db_id_, e.what()));
    }
}

std::unique_ptr<DatabaseHandle> DatabaseHandle::create(
    std::string db_id,
    const PoolConfig& master,
    const PoolConfig& replica,
    std::shared_ptr<IConnectionFactory> factory) {
    return std::make_unique<DatabaseHandle>(std::move(db_id), master, replica, std::move(factory));
}

std::unique_ptr<DatabaseHandle> DatabaseHandle::create_with_alternative_replica(
    std::string db_id,
    const PoolConfig& master,
    PoolConfig replica,
    const std::optional<std::string>& alternative_replica,
    std::shared_ptr<IConnectionFactory> factory) {

    if (alternative_replica) {
        replica.connection_string = *alternative_replica;
    }
    return std::make_unique<DatabaseHandle>(
        std::move(db_id), master, std::move(replica), std::move(factory));
}

void DatabaseHandle::connect() {
    std::lock_guard lock(lifecycle_mutex_);
    if (state() == State::CONNECTED) {
        utils::log::debug(std::format("Database '{}' already connected", db_id_));
        return;
    }

    state_.store(State::CONNECTING, std::memory_order_release);
    utils::log::info(std::format("Connecting database '{}'", db_id_));

    try {
        master_pool_->open();
    } catch (const ConnectionError& e) {
        state_.store(State::DISCONNECTED, std::memory_order_release);
        throw ConnectionError(db_id_, std::format(
            "database '{}': master connect failed: {}", db_id_, e.what()));
    }

    if (replica_pool_) {
        try {
            replica_pool_->open();
        } catch (const ConnectionError& e) {
            try {
                master_pool_->drain();
            } catch (const ConnectionError& drain_err) {
                utils::log::warn(std::format("Database '{}': master release after failed replica connect: {}",
                    db_id_, drain_err.what()));
            }
            state_.store(State::DISCONNECTED, std::memory_order_release);
            throw ConnectionError(db_id_, std::format(
                "database '{}': replica connect failed: {}", db_id_, e.what()));
        }
    }

    state_.store(State::CONNECTED, std::memory_order_release);
    utils::log::info(std::format("Database '{}' connected (replica: {})",
        db_id_, replica_pool_ ? "dedicated" : "served by master"));
}

void DatabaseHandle::disconnect() {
    std::lock_guard lock(lifecycle_mutex_);
    if (state() != State::CONNECTED) {
        return;
    }

    state_.store(State::DISCONNECTED, std::memory_order_release);

    // Release both pools even if the first one fails
    std::exception_ptr first_failure;
    try {
        master_pool_->drain();
    } catch (const ConnectionError&) {
        first_failure = std::current_exception();
    }
    if (replica_pool_) {
        try {
            replica_pool_->drain();
        } catch (const ConnectionError&) {
            if (!first_failure) first_failure = std::current_exception();
        }
    }

    if (first_failure) {
        utils::log::error(std::format("Database '{}' disconnected with errors", db_id_));
        std::rethrow_exception(first_failure);
    }
    utils::log::info(std::format("Database '{}' disconnected", db_id_));
}

void DatabaseHandle::require_connected(std::string_view accessor) const {
    if (!is_connected()) {
        throw InvariantViolation(std::format(
            "database '{}' used via {}() while {}", db_id_, accessor,
            database_state_to_string(state())));
    }
}

QueryHandle DatabaseHandle::master() const {
    require_connected("master");
    return QueryHandle(master_pool_, db_id_, kMasterRole);
}

QueryHandle DatabaseHandle::replica() const {
    require_connected("replica");
    if (!replica_pool_) {
        return QueryHandle(master_pool_, db_id_, kMasterRole);
    }
    return QueryHandle(replica_pool_, db_id_, kReplicaRole);
}

const std::string& DatabaseHandle::replica_endpoint() const {
    return replica_pool_ ? replica_config_.connection_string : master_config_.connection_string;
}

} // namespace paydb
