#pragma once

#include "config/config_loader.hpp"
#include "server/waf_middleware.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace wafgate {

/**
 * @brief Demo HTTP gateway with every route guarded by WafMiddleware
 *
 * Routes:
 *   GET  /         - plain greeting
 *   POST /submit   - echoes the inspected body back
 *   GET  /health   - liveness, not inspected
 */
class GatewayServer {
public:
    GatewayServer(const ServerConfig& config, LifecycleManager& lifecycle);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /**
     * @brief Register routes and block in listen()
     * @throws std::runtime_error if the socket cannot be bound
     */
    void start();

    /**
     * @brief Cancel in-flight inspections and stop listening
     */
    void stop();

    [[nodiscard]] const WafMiddleware& middleware() const { return waf_; }

private:
    void register_routes(httplib::Server& svr);

    const ServerConfig config_;
    WafMiddleware waf_;
    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> running_{false};
};

} // namespace wafgate
