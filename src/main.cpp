#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/lifecycle_manager.hpp"
#include "core/utils.hpp"
#include "server/gateway_server.hpp"

#include <csignal>
#include <format>
#include <memory>

using namespace wafgate;

// Global instance for signal handling
std::shared_ptr<GatewayServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("WAF gateway starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/wafgate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(cfg.logging.level);

        utils::log::info(std::format("[2/3] Initializing inspection engine ({} rule sources, plugin {})",
            cfg.waf.directives_files.size(), cfg.waf.engine_plugin));
        auto& lifecycle = LifecycleManager::global();
        try {
            lifecycle.initialize(cfg.waf);
        } catch (const RuleSourceError& e) {
            utils::log::error(std::format("Fatal: {}", e.what()));
            return 1;
        }
        if (lifecycle.failed()) {
            // Requests will be answered with 500 until restart
            utils::log::error(std::format("Engine unavailable: {}", lifecycle.init_error()));
        }
        if (!cfg.server.block_message.empty()) {
            lifecycle.set_block_message(cfg.server.block_message);
        }

        utils::log::info("[3/3] Starting HTTP server");
        g_server = std::make_shared<GatewayServer>(cfg.server, lifecycle);
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
