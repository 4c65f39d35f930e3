#include "config/config_loader.hpp"
#include "context/app_context.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <string>
#include <thread>

using namespace paydb;

namespace {

std::atomic<bool> g_stop_requested{false};
std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal.store(signal);
    g_stop_requested.store(true);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("paydb starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/paydb.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/3] Creating app context");
        std::shared_ptr<AppContext> context;
        try {
            context = AppContext::create(config, std::make_shared<PgConnectionFactory>());
        } catch (const ConnectionError& e) {
            utils::log::error(std::format("Startup aborted, database '{}' unavailable: {}",
                e.db_id(), e.what()));
            return 1;
        }

        ContextSlot slot;
        slot.attach(context);

        utils::log::info("[3/3] Ready, waiting for SIGINT/SIGTERM");
        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        utils::log::info(std::format("Received signal {}, shutting down...", g_signal.load()));

        auto detached = slot.detach(*context);
        context.reset();
        try {
            detached->close();
        } catch (const ConnectionError& e) {
            utils::log::error(std::format("Shutdown completed with errors: {}", e.what()));
        }

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    utils::log::info("paydb stopped");
    return 0;
}
