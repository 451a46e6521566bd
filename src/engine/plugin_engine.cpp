#include "engine/plugin_engine.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <dlfcn.h>

#include <array>
#include <stdexcept>
#include <format>

namespace wafgate {

namespace {

constexpr size_t kPluginErrorBufferSize = 512;

Interruption to_interruption(const WafEngineInterruption& in) {
    Interruption it;
    it.action = in.action ? in.action : "";
    it.status = in.status;
    it.rule_id = in.rule_id;
    it.data = in.data ? in.data : "";
    return it;
}

bool vtable_complete(const WafEnginePlugin& p) {
    return p.get_info && p.configure && p.new_transaction &&
           p.process_connection && p.process_uri && p.add_request_header &&
           p.set_server_name && p.process_request_headers &&
           p.is_request_body_accessible && p.append_request_body &&
           p.process_request_body && p.is_rule_engine_off &&
           p.process_logging && p.close_transaction && p.destroy;
}

// ============================================================================
// PluginTransaction
// ============================================================================

class PluginTransaction : public ITransaction {
public:
    PluginTransaction(const WafEnginePlugin* plugin, void* tx, std::stop_token cancellation)
        : plugin_(plugin), tx_(tx), cancellation_(std::move(cancellation)) {}

    ~PluginTransaction() override {
        close();
    }

    void process_connection(const std::string& client_host, int client_port,
                            const std::string& server_host, int server_port) override {
        plugin_->process_connection(tx_, client_host.c_str(), client_port,
                                    server_host.c_str(), server_port);
    }

    void process_uri(const std::string& uri, const std::string& method,
                     const std::string& protocol) override {
        plugin_->process_uri(tx_, uri.c_str(), method.c_str(), protocol.c_str());
    }

    void add_request_header(const std::string& key, const std::string& value) override {
        plugin_->add_request_header(tx_, key.data(), key.size(), value.data(), value.size());
    }

    void set_server_name(const std::string& host) override {
        plugin_->set_server_name(tx_, host.c_str());
    }

    std::optional<Interruption> process_request_headers() override {
        WafEngineInterruption out{};
        if (plugin_->process_request_headers(tx_, &out) > 0) {
            return to_interruption(out);
        }
        return std::nullopt;
    }

    bool is_request_body_accessible() const override {
        return plugin_->is_request_body_accessible(tx_) != 0;
    }

    BodyReadResult read_request_body_from(IBodyStream& stream) override {
        BodyReadResult result;
        std::array<char, kBodyChunkSize> buf;

        for (;;) {
            if (cancellation_.stop_requested()) {
                result.error = "request cancelled";
                return result;
            }

            auto r = stream.read(buf.data(), buf.size());
            if (r.is_error()) {
                result.error = r.error_message();
                return result;
            }
            const size_t n = r.value();
            if (n == 0) break;

            WafEngineInterruption out{};
            const int rc = plugin_->append_request_body(tx_, buf.data(), n, &out);
            if (rc < 0) {
                result.error = "engine failed to accept request body chunk";
                return result;
            }
            result.bytes_read += n;
            if (rc > 0) {
                result.interruption = to_interruption(out);
                return result;
            }
        }
        return result;
    }

    std::unique_ptr<IBodyStream> request_body_reader() override {
        // The plugin keeps no readable copy; the pipeline's capture replays the body
        return nullptr;
    }

    Result<std::optional<Interruption>> process_request_body() override {
        WafEngineInterruption out{};
        const int rc = plugin_->process_request_body(tx_, &out);
        if (rc < 0) {
            return Result<std::optional<Interruption>>::error(
                ErrorCategory::INTERNAL_ERROR, "engine failed to evaluate request body");
        }
        if (rc > 0) {
            return Result<std::optional<Interruption>>::ok(to_interruption(out));
        }
        return Result<std::optional<Interruption>>::ok(std::nullopt);
    }

    bool is_rule_engine_off() const override {
        return plugin_->is_rule_engine_off(tx_) != 0;
    }

    void process_logging() override {
        if (tx_) plugin_->process_logging(tx_);
    }

    void close() override {
        if (!tx_) return;
        plugin_->close_transaction(tx_);
        tx_ = nullptr;
    }

private:
    const WafEnginePlugin* plugin_;
    void* tx_;
    std::stop_token cancellation_;
};

} // anonymous namespace

// ============================================================================
// LoadedEngineLibrary
// ============================================================================

LoadedEngineLibrary::LoadedEngineLibrary(std::string path, void* handle)
    : path_(std::move(path)), handle_(handle) {}

LoadedEngineLibrary::~LoadedEngineLibrary() {
    if (handle_) {
        dlclose(handle_);
    }
}

void* LoadedEngineLibrary::resolve(const char* symbol) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, symbol);
}

// ============================================================================
// PluginEngine
// ============================================================================

PluginEngine::PluginEngine(WafEnginePlugin* plugin, std::unique_ptr<LoadedEngineLibrary> library)
    : library_(std::move(library)), plugin_(plugin) {}

PluginEngine::~PluginEngine() {
    // Destroy plugin instance before dlclose
    if (plugin_) {
        if (plugin_->destroy) {
            plugin_->destroy(plugin_->instance);
        }
        delete plugin_;
    }
}

WafEnginePluginInfo PluginEngine::info() const {
    return plugin_->get_info(plugin_->instance);
}

Result<bool> PluginEngine::configure(const EngineConfig& config) {
    if (!vtable_complete(*plugin_)) {
        return Result<bool>::error(ErrorCategory::INITIALIZATION_ERROR,
                                   "engine plugin vtable is incomplete");
    }

    const auto plugin_info = info();
    if (plugin_info.api_version != WAFGATE_ENGINE_API_VERSION) {
        return Result<bool>::error(ErrorCategory::INITIALIZATION_ERROR,
            std::format("engine plugin API version mismatch (got {}, expected {})",
                        plugin_info.api_version, WAFGATE_ENGINE_API_VERSION));
    }

    on_matched_rule_ = config.on_matched_rule;
    on_debug_ = config.on_debug;

    const std::string document = build_config_document(config);
    std::array<char, kPluginErrorBufferSize> err{};
    const int rc = plugin_->configure(plugin_->instance, document.data(), document.size(),
                                      this,
                                      on_matched_rule_ ? &PluginEngine::dispatch_matched_rule : nullptr,
                                      on_debug_ ? &PluginEngine::dispatch_debug : nullptr,
                                      err.data(), err.size());
    if (rc != 0) {
        err.back() = '\0';
        return Result<bool>::error(ErrorCategory::INITIALIZATION_ERROR,
            err[0] ? std::string(err.data()) : std::format("configure returned {}", rc));
    }

    utils::log::info(std::format("[WAF] engine plugin configured: {} v{}",
        plugin_info.name ? plugin_info.name : "unnamed",
        plugin_info.version ? plugin_info.version : "?"));
    return Result<bool>::ok(true);
}

std::unique_ptr<ITransaction> PluginEngine::new_transaction() {
    return new_transaction(TransactionOptions{utils::generate_uuid(), {}});
}

std::unique_ptr<ITransaction> PluginEngine::new_transaction(const TransactionOptions& options) {
    void* tx = plugin_->new_transaction(plugin_->instance, options.id.c_str());
    if (!tx) {
        throw std::runtime_error("engine plugin returned no transaction");
    }
    return std::make_unique<PluginTransaction>(plugin_, tx, options.cancellation);
}

std::string PluginEngine::build_config_document(const EngineConfig& config) {
    const auto& waf = config.waf;

    nlohmann::json doc;
    doc["directives_files"] = config.resolved_directives;
    doc["rule_engine"] = waf.rule_engine;
    if (!waf.root_dir.empty()) {
        doc["root_dir"] = waf.root_dir.string();
    }

    doc["request_body_access"] = waf.request_body_access;
    if (waf.request_body_limit > 0) {
        doc["request_body_limit"] = waf.request_body_limit;
    }
    if (waf.request_body_in_memory_limit > 0) {
        doc["request_body_in_memory_limit"] = waf.request_body_in_memory_limit;
    }

    doc["response_body_access"] = waf.response_body_access;
    if (waf.response_body_limit > 0) {
        doc["response_body_limit"] = waf.response_body_limit;
    }
    if (!waf.response_body_mime_types.empty()) {
        doc["response_body_mime_types"] = waf.response_body_mime_types;
    }

    doc["error_log"] = static_cast<bool>(config.on_matched_rule);
    doc["debug_log"] = static_cast<bool>(config.on_debug);
    return doc.dump();
}

void PluginEngine::dispatch_matched_rule(void* ctx, const char* severity,
                                         const char* log_line, int rule_id) {
    const auto* self = static_cast<const PluginEngine*>(ctx);
    if (!self || !self->on_matched_rule_) return;

    MatchedRuleEvent event;
    event.severity = severity ? severity : "";
    event.log_line = log_line ? log_line : "";
    event.rule_id = rule_id;
    self->on_matched_rule_(event);
}

void PluginEngine::dispatch_debug(void* ctx, const char* line, size_t line_len) {
    const auto* self = static_cast<const PluginEngine*>(ctx);
    if (!self || !self->on_debug_ || !line) return;
    self->on_debug_(std::string_view(line, line_len));
}

// ============================================================================
// Factories
// ============================================================================

Result<std::shared_ptr<IInspectionEngine>> create_plugin_engine(
        WafEnginePlugin* plugin, const EngineConfig& config,
        std::unique_ptr<LoadedEngineLibrary> library) {
    using R = Result<std::shared_ptr<IInspectionEngine>>;
    if (!plugin) {
        return R::error(ErrorCategory::INITIALIZATION_ERROR, "engine plugin factory returned null");
    }

    auto engine = std::make_shared<PluginEngine>(plugin, std::move(library));
    auto configured = engine->configure(config);
    if (configured.is_error()) {
        return R::error(configured.error_category(), configured.error_message());
    }
    return R::ok(std::move(engine));
}

Result<std::shared_ptr<IInspectionEngine>> load_engine_plugin(const EngineConfig& config) {
    using R = Result<std::shared_ptr<IInspectionEngine>>;
    const auto& path = config.waf.engine_plugin;
    if (path.empty()) {
        return R::error(ErrorCategory::INITIALIZATION_ERROR, "no engine plugin configured");
    }

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* reason = dlerror();
        return R::error(ErrorCategory::INITIALIZATION_ERROR,
            std::format("engine plugin load failed [{}]: {}", path, reason ? reason : "unknown"));
    }

    auto library = std::make_unique<LoadedEngineLibrary>(path, handle);

    // Resolve factory: WafEnginePlugin* create_waf_engine_plugin()
    using FactoryFn = WafEnginePlugin* (*)();
    const auto factory = reinterpret_cast<FactoryFn>(library->resolve("create_waf_engine_plugin"));
    if (!factory) {
        return R::error(ErrorCategory::INITIALIZATION_ERROR,
            std::format("engine plugin [{}]: missing create_waf_engine_plugin symbol", path));
    }

    return create_plugin_engine(factory(), config, std::move(library));
}

} // namespace wafgate
