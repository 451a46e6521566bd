#include "server/gateway_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace wafgate {

GatewayServer::GatewayServer(const ServerConfig& config, LifecycleManager& lifecycle)
    : config_(config),
      waf_(lifecycle, WafMiddleware::Options{.default_block_status = config.default_block_status}),
      svr_(std::make_unique<httplib::Server>()) {}

GatewayServer::~GatewayServer() = default;

// ============================================================================
// start() - registers routes, listens
// ============================================================================

void GatewayServer::start() {
    auto& svr = *svr_;

    const auto pool_size = static_cast<size_t>(config_.thread_pool_size);
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting WAF gateway on {}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    running_.store(true, std::memory_order_release);
    if (!svr.listen(config_.host.c_str(), config_.port)) {
        running_.store(false, std::memory_order_release);
        throw std::runtime_error(
            std::format("Failed to start HTTP server on {}:{}", config_.host, config_.port));
    }
}

void GatewayServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    waf_.cancel_in_flight();
    svr_->stop();

    const auto stats = waf_.get_stats();
    utils::log::info(std::format(
        "Server stopped: {} requests ({} allowed, {} bypassed, {} blocked, {} failed)",
        stats.total_requests, stats.allowed, stats.bypassed, stats.blocked, stats.failed));
}

// ============================================================================
// Route registration
// ============================================================================

void GatewayServer::register_routes(httplib::Server& svr) {
    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", http::kJsonContentType);
    });

    svr.Get("/", waf_.wrap([](const httplib::Request&, httplib::Response& res) {
        res.set_content("Hello from behind the WAF\n", "text/plain");
    }));

    svr.Post("/submit", waf_.wrap([](const httplib::Request& req, httplib::Response& res) {
        res.set_content(std::format("received {} bytes\n{}", req.body.size(), req.body),
                        "text/plain");
    }));
}

} // namespace wafgate
