#include "context/app_context.hpp"
#include "db/replica_selector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <future>
#include <stdexcept>
#include <system_error>

namespace paydb {

namespace {

bool uses_alternative_replica(std::string_view db_id) {
    return db_id == db_names::kPayoutMainDb
        || db_id == db_names::kPayinMainDb
        || db_id == db_names::kLedgerMainDb;
}

} // anonymous namespace

// ============================================================================
// AppContext
// ============================================================================

std::unique_ptr<AppContext> AppContext::create(
    const AppConfig& config,
    std::shared_ptr<IConnectionFactory> connection_factory) {

    auto ctx = std::make_unique<AppContext>(PrivateTag{});

    // One selection shared by every maindb handle
    const auto selector = ReplicaSelector::from_config(config.replica_selection);
    ctx->selected_maindb_replica_ = selector.select(config.replica_selection.available_maindb_replicas);

    const auto& defaults = config.database_defaults;
    for (const auto name : db_names::kAll) {
        const auto it = config.databases.find(std::string(name));
        if (it == config.databases.end()) {
            throw std::invalid_argument(std::format("logical database '{}' is not configured", name));
        }
        const auto& endpoint = it->second;

        auto master = defaults.master_pool(endpoint.master_url);
        auto replica = defaults.replica_pool(endpoint.replica_url);
        if (uses_alternative_replica(name)) {
            ctx->databases_.push_back(DatabaseHandle::create_with_alternative_replica(
                std::string(name), master, std::move(replica),
                ctx->selected_maindb_replica_, connection_factory));
        } else {
            ctx->databases_.push_back(DatabaseHandle::create(
                std::string(name), master, replica, connection_factory));
        }
    }

    ctx->payout_maindb_ = ctx->databases_[0].get();
    ctx->payout_bankdb_ = ctx->databases_[1].get();
    ctx->payin_maindb_ = ctx->databases_[2].get();
    ctx->payin_paymentdb_ = ctx->databases_[3].get();
    ctx->ledger_maindb_ = ctx->databases_[4].get();
    ctx->ledger_paymentdb_ = ctx->databases_[5].get();

    // Sequential so the first failing database is unambiguous
    for (const auto& db : ctx->databases_) {
        try {
            db->connect();
        } catch (const ConnectionError& e) {
            utils::log::error(std::format("Failed to connect to {}: {}", db->id(), e.what()));
            ctx->disconnect_connected();
            ctx->closed_.store(true, std::memory_order_release);
            throw;
        }
    }

    ctx->stripe_ = std::make_unique<StripeClientPool>(config.stripe);
    ctx->dsj_client_ = std::make_unique<DsjClient>(config.dsj);

    utils::log::info(std::format("App context created ({} databases)", ctx->databases_.size()));
    return ctx;
}

AppContext::~AppContext() {
    if (is_closed()) return;
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("App context close on destruction failed: {}", e.what()));
    }
}

void AppContext::disconnect_connected() noexcept {
    for (auto it = databases_.rbegin(); it != databases_.rend(); ++it) {
        if (!(*it)->is_connected()) continue;
        try {
            (*it)->disconnect();
        } catch (const ConnectionError& e) {
            utils::log::warn(std::format("Releasing {} after failed startup: {}", (*it)->id(), e.what()));
        }
    }
}

void AppContext::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    utils::log::info("Closing app context");

    std::exception_ptr first_failure;
    {
        std::vector<std::future<void>> pending;
        pending.reserve(databases_.size());
        try {
            for (const auto& db : databases_) {
                pending.push_back(std::async(std::launch::async, [&db] { db->disconnect(); }));
            }
        } catch (const std::system_error&) {
            first_failure = std::current_exception();
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            } catch (const std::exception& e) {
                utils::log::error(std::format("Disconnect of {} failed: {}", databases_[i]->id(), e.what()));
                if (!first_failure) first_failure = std::current_exception();
            }
        }
    }

    // Always released, whatever happened to the databases
    if (stripe_) {
        stripe_->shutdown(false);
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
    utils::log::info("App context closed");
}

const DatabaseHandle& AppContext::database(std::string_view db_id) const {
    for (const auto& db : databases_) {
        if (db->id() == db_id) return *db;
    }
    throw std::invalid_argument(std::format("unknown logical database '{}'", db_id));
}

// ============================================================================
// ContextSlot
// ============================================================================

void ContextSlot::attach(std::shared_ptr<AppContext> context) {
    if (!context) {
        throw InvariantViolation("cannot attach a null app context");
    }
    std::lock_guard lock(mutex_);
    if (context_) {
        throw InvariantViolation("app context is already set");
    }
    context_ = std::move(context);
}

AppContext& ContextSlot::get() const {
    std::lock_guard lock(mutex_);
    if (!context_) {
        throw InvariantViolation("app context is not set");
    }
    return *context_;
}

bool ContextSlot::exists() const {
    std::lock_guard lock(mutex_);
    return context_ != nullptr;
}

std::shared_ptr<AppContext> ContextSlot::detach(const AppContext& context) {
    std::lock_guard lock(mutex_);
    if (!context_) {
        throw InvariantViolation("app context is not set");
    }
    if (context_.get() != &context) {
        throw InvariantViolation("detaching an app context that is not the attached one");
    }
    return std::move(context_);
}

} // namespace paydb
