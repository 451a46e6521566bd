#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace wafgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{8080}));
    cfg.thread_pool_size = static_cast<int>(s["threads"].value_or(int64_t{8}));
    cfg.block_message = s["block_message"].value_or(""s);
    cfg.default_block_status = static_cast<int>(s["default_block_status"].value_or(int64_t{403}));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

WafConfig extract_waf(const toml::table& root) {
    WafConfig cfg = WafConfig::defaults();
    const auto* waf = root["waf"].as_table();
    if (!waf) return cfg;
    const auto& w = *waf;

    if (w["directives_files"].as_array()) {
        cfg.directives_files = toml_string_array(w, "directives_files");
    }
    cfg.rule_engine = w["rule_engine"].value_or(cfg.rule_engine);
    if (auto root_dir = w["root_dir"].value<std::string>(); root_dir && !root_dir->empty()) {
        cfg.root_dir = *root_dir;
    }
    cfg.engine_plugin = w["engine_plugin"].value_or(""s);

    cfg.request_body_access = w["request_body_access"].value_or(cfg.request_body_access);
    cfg.request_body_limit = w["request_body_limit"].value_or(cfg.request_body_limit);
    cfg.request_body_in_memory_limit =
        w["request_body_in_memory_limit"].value_or(cfg.request_body_in_memory_limit);

    cfg.response_body_access = w["response_body_access"].value_or(cfg.response_body_access);
    cfg.response_body_limit = w["response_body_limit"].value_or(cfg.response_body_limit);
    if (w["response_body_mime_types"].as_array()) {
        cfg.response_body_mime_types = toml_string_array(w, "response_body_mime_types");
    }

    cfg.enable_error_log = w["error_log"].value_or(cfg.enable_error_log);
    if (w["debug_log"].value_or(false)) {
        cfg.debug_logger = [](std::string_view line) {
            utils::log::debug(std::format("[engine] {}", line));
        };
    }
    return cfg;
}

GatewayConfig extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.waf = extract_waf(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(GatewayConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size < 1) {
        errors.push_back(std::format("server.threads must be > 0, got {}",
                                     config.server.thread_pool_size));
    }
    if (config.server.default_block_status < 100 || config.server.default_block_status > 599) {
        errors.push_back(std::format("server.default_block_status must be 100-599, got {}",
                                     config.server.default_block_status));
    }

    if (config.logging.level != "debug" && config.logging.level != "info") {
        errors.push_back(std::format("logging.level must be debug or info, got '{}'",
                                     config.logging.level));
    }

    if (config.waf.directives_files.empty()) {
        errors.push_back("waf.directives_files must list at least one rule file");
    }
    for (size_t i = 0; i < config.waf.directives_files.size(); ++i) {
        if (config.waf.directives_files[i].empty()) {
            errors.push_back(std::format("waf.directives_files[{}] must not be empty", i));
        }
    }

    return errors;
}

} // namespace wafgate
