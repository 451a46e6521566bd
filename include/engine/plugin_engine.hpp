#pragma once

#include "engine/engine_plugin.hpp"
#include "engine/inspection_engine.hpp"

#include <memory>
#include <stop_token>
#include <string>

namespace wafgate {

// RAII wrapper for a loaded engine library
class LoadedEngineLibrary {
public:
    LoadedEngineLibrary(std::string path, void* handle);
    ~LoadedEngineLibrary();

    LoadedEngineLibrary(const LoadedEngineLibrary&) = delete;
    LoadedEngineLibrary& operator=(const LoadedEngineLibrary&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }

    // Resolve symbol from the shared library
    [[nodiscard]] void* resolve(const char* symbol) const;

private:
    std::string path_;
    void* handle_;
};

/**
 * @brief IInspectionEngine backed by a WafEnginePlugin vtable
 *
 * Owns the vtable and the library it came from; the plugin instance is
 * destroyed before the library is closed. Plugin transactions expose no body
 * reader, so the body is replayed from the pipeline's capture.
 */
class PluginEngine : public IInspectionEngine, public IContextAwareEngine {
public:
    PluginEngine(WafEnginePlugin* plugin, std::unique_ptr<LoadedEngineLibrary> library);
    ~PluginEngine() override;

    PluginEngine(const PluginEngine&) = delete;
    PluginEngine& operator=(const PluginEngine&) = delete;

    /**
     * @brief Check API version and hand the settings document to the plugin
     */
    [[nodiscard]] Result<bool> configure(const EngineConfig& config);

    [[nodiscard]] std::unique_ptr<ITransaction> new_transaction() override;
    [[nodiscard]] std::unique_ptr<ITransaction> new_transaction(
        const TransactionOptions& options) override;

    [[nodiscard]] WafEnginePluginInfo info() const;

    /**
     * @brief Engine settings serialized as the JSON document passed to configure
     */
    [[nodiscard]] static std::string build_config_document(const EngineConfig& config);

private:
    static void dispatch_matched_rule(void* ctx, const char* severity,
                                      const char* log_line, int rule_id);
    static void dispatch_debug(void* ctx, const char* line, size_t line_len);

    std::unique_ptr<LoadedEngineLibrary> library_;   // Closed last
    WafEnginePlugin* plugin_;
    std::function<void(const MatchedRuleEvent&)> on_matched_rule_;
    std::function<void(std::string_view)> on_debug_;
};

/**
 * @brief Wrap an in-process vtable (no dlopen) and configure it
 */
[[nodiscard]] Result<std::shared_ptr<IInspectionEngine>> create_plugin_engine(
    WafEnginePlugin* plugin, const EngineConfig& config,
    std::unique_ptr<LoadedEngineLibrary> library = nullptr);

/**
 * @brief dlopen config.waf.engine_plugin, resolve its factory and configure it
 */
[[nodiscard]] Result<std::shared_ptr<IInspectionEngine>> load_engine_plugin(
    const EngineConfig& config);

} // namespace wafgate
