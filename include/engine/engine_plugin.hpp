#pragma once

#include <cstddef>
#include <cstdint>

// C ABI for rule engines loaded via dlopen/dlsym.
// Engine libraries implement the vtable below and export a factory function.

extern "C" {

struct WafEnginePluginInfo {
    const char* name;
    const char* version;
    uint32_t api_version;   // Must match WAFGATE_ENGINE_API_VERSION
};

constexpr uint32_t WAFGATE_ENGINE_API_VERSION = 1;

// Filled by the engine when a phase interrupts. Strings stay valid until the
// transaction is closed.
struct WafEngineInterruption {
    const char* action;     // "deny", "redirect", "drop", ...
    int status;             // 0 = no explicit status
    int rule_id;
    const char* data;
};

typedef void (*WafMatchedRuleFn)(void* ctx, const char* severity,
                                 const char* log_line, int rule_id);
typedef void (*WafDebugLogFn)(void* ctx, const char* line, size_t line_len);

// Phase calls returning int: 1 = interrupted (out filled), 0 = continue, -1 = error
struct WafEnginePlugin {
    void* instance;
    WafEnginePluginInfo (*get_info)(void* instance);

    // json_config: engine settings document. Returns 0 on success, otherwise
    // writes a NUL-terminated message into err (at most err_len bytes).
    int (*configure)(void* instance, const char* json_config, size_t json_len,
                     void* callback_ctx, WafMatchedRuleFn on_matched_rule,
                     WafDebugLogFn on_debug, char* err, size_t err_len);

    void* (*new_transaction)(void* instance, const char* id);

    void (*process_connection)(void* tx, const char* client_host, int client_port,
                               const char* server_host, int server_port);
    void (*process_uri)(void* tx, const char* uri, const char* method, const char* protocol);
    void (*add_request_header)(void* tx, const char* key, size_t key_len,
                               const char* value, size_t value_len);
    void (*set_server_name)(void* tx, const char* host);
    int (*process_request_headers)(void* tx, WafEngineInterruption* out);
    int (*is_request_body_accessible)(void* tx);
    int (*append_request_body)(void* tx, const char* data, size_t len,
                               WafEngineInterruption* out);
    int (*process_request_body)(void* tx, WafEngineInterruption* out);
    int (*is_rule_engine_off)(void* tx);
    void (*process_logging)(void* tx);
    void (*close_transaction)(void* tx);

    void (*destroy)(void* instance);
};

// Factory function signature (engine libraries export this)
// "create_waf_engine_plugin" -> WafEnginePlugin*

} // extern "C"
