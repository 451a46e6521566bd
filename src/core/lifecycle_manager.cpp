#include "core/lifecycle_manager.hpp"
#include "core/utils.hpp"
#include "engine/plugin_engine.hpp"

#include <format>
#include <fstream>

namespace wafgate {

LifecycleManager& LifecycleManager::global() {
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::initialize(const WafConfig& config, const EngineFactory& factory) {
    // A throwing callable would leave once_ unset and allow a retry, so
    // construct() records every outcome and the fatal error is rethrown here.
    std::optional<std::string> fatal;
    std::call_once(once_, [&] {
        try {
            construct(config, factory);
        } catch (const RuleSourceError& e) {
            record_failure(e.what());
            fatal = e.what();
        } catch (const std::exception& e) {
            record_failure(std::format("engine construction failed: {}", e.what()));
        } catch (...) {
            record_failure("engine construction failed: unknown exception");
        }
    });
    if (fatal) {
        throw RuleSourceError(*fatal);
    }
}

void LifecycleManager::initialize(const WafConfig& config) {
    initialize(config, [](const EngineConfig& engine_config) {
        return load_engine_plugin(engine_config);
    });
}

void LifecycleManager::initialize(const std::vector<std::string>& directives_files,
                                  const EngineFactory& factory) {
    if (directives_files.empty()) {
        initialize(WafConfig::defaults(), factory);
        return;
    }
    WafConfig config;
    config.directives_files = directives_files;
    initialize(config, factory);
}

void LifecycleManager::construct(const WafConfig& config, const EngineFactory& factory) {
    EngineConfig engine_config;
    engine_config.waf = config;
    engine_config.resolved_directives = resolve_directives(config);
    if (config.enable_error_log) {
        engine_config.on_matched_rule = log_matched_rule;
    }
    if (config.debug_logger) {
        engine_config.on_debug = config.debug_logger;
    }

    if (!factory) {
        record_failure("no engine factory configured");
        return;
    }

    try {
        auto built = factory(engine_config);
        if (built.is_error()) {
            record_failure(std::format("engine rejected configuration: {}", built.error_message()));
            return;
        }
        engine_ = std::move(built.value());
    } catch (const std::exception& e) {
        record_failure(std::format("engine rejected configuration: {}", e.what()));
        return;
    } catch (...) {
        record_failure("engine rejected configuration: unknown exception");
        return;
    }

    if (!engine_) {
        record_failure("engine factory returned no instance");
        return;
    }

    // Pick the transaction factory once instead of branching per request
    if (auto* ctx_engine = dynamic_cast<IContextAwareEngine*>(engine_.get())) {
        context_aware_ = true;
        new_tx_ = [ctx_engine](const TransactionOptions& options) {
            return ctx_engine->new_transaction(options);
        };
    } else {
        IInspectionEngine* plain = engine_.get();
        new_tx_ = [plain](const TransactionOptions&) {
            return plain->new_transaction();
        };
    }

    state_.store(State::READY, std::memory_order_release);
    utils::log::info(std::format("[WAF] engine initialized: {} rule source(s), rule engine {}{}",
        engine_config.resolved_directives.size(), config.rule_engine,
        context_aware_ ? ", context-aware transactions" : ""));
}

void LifecycleManager::record_failure(std::string message) {
    init_error_ = std::move(message);
    engine_.reset();
    new_tx_ = nullptr;
    state_.store(State::FAILED, std::memory_order_release);
    utils::log::error(std::format("[WAF] initialization failed: {}", init_error_));
}

std::vector<std::string> LifecycleManager::resolve_directives(const WafConfig& config) {
    namespace fs = std::filesystem;

    std::vector<std::string> resolved;
    resolved.reserve(config.directives_files.size());

    for (const auto& source : config.directives_files) {
        fs::path path(source);
        if (path.is_relative() && !config.root_dir.empty()) {
            path = config.root_dir / path;
        }

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw RuleSourceError(std::format("WAF directives file not found: {}", path.string()));
        }
        std::ifstream probe(path);
        if (!probe.is_open()) {
            throw RuleSourceError(std::format("WAF directives file not readable: {}", path.string()));
        }

        resolved.emplace_back(fs::absolute(path, ec).string());
        if (ec) {
            resolved.back() = path.string();
        }
    }
    return resolved;
}

std::shared_ptr<IInspectionEngine> LifecycleManager::engine() const {
    if (state() != State::READY) return nullptr;
    return engine_;
}

std::unique_ptr<ITransaction> LifecycleManager::new_transaction(
        const TransactionOptions& options) const {
    if (state() != State::READY) return nullptr;
    return new_tx_(options);
}

void LifecycleManager::set_block_message(const std::optional<std::string>& message) {
    if (message && !message->empty()) {
        block_message_ = *message;
    }
}

void log_matched_rule(const MatchedRuleEvent& event) {
    utils::log::warn(std::format("WAF rule matched: severity={} rule_id={} {}",
                                 event.severity, event.rule_id, event.log_line));
}

} // namespace wafgate
