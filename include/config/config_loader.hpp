#pragma once

#include "config/waf_config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wafgate {

// ============================================================================
// Server Config (gateway binary)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int thread_pool_size = 8;           // Validated >= 1 before use
    std::string block_message;          // Empty = built-in message
    int default_block_status = 403;     // Status for non-deny interruptions
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";         // debug | info
};

// ============================================================================
// GatewayConfig - Complete parsed configuration
// ============================================================================

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    WafConfig waf = WafConfig::defaults();
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML (toml++)
// ============================================================================

/**
 * Recognized tables: [server], [logging], [waf]. Missing keys keep their
 * defaults; string values support ${ENV_VAR} substitution.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to wafgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a parsed config
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);
};

} // namespace wafgate
