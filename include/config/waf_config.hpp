#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace wafgate {

// ============================================================================
// WafConfig - engine behaviour, fixed at initialization
// ============================================================================

struct WafConfig {
    // Core
    std::vector<std::string> directives_files;  // Rule sources, loaded in order
    std::string rule_engine = "On";             // On | Off | DetectionOnly
    std::filesystem::path root_dir;             // Base for relative rule paths (empty = cwd)
    std::string engine_plugin;                  // Shared library implementing the engine ABI

    // Request body (limits <= 0 keep the engine default)
    bool request_body_access = false;
    int64_t request_body_limit = 0;
    int64_t request_body_in_memory_limit = 0;

    // Response body
    bool response_body_access = false;
    int64_t response_body_limit = 0;
    std::vector<std::string> response_body_mime_types;

    // Logging
    std::function<void(std::string_view)> debug_logger;
    bool enable_error_log = false;

    static WafConfig defaults() {
        WafConfig cfg;
        cfg.directives_files = {"./conf/wafgate.conf"};
        cfg.rule_engine = "On";

        cfg.request_body_access = true;
        cfg.request_body_limit = 10 * 1024 * 1024;
        cfg.request_body_in_memory_limit = 128 * 1024;

        cfg.response_body_access = false;
        cfg.response_body_limit = 512 * 1024;
        cfg.response_body_mime_types = {
            "text/html", "text/plain", "application/json", "application/xml"};

        cfg.enable_error_log = true;
        return cfg;
    }
};

} // namespace wafgate
