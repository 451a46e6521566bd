#pragma once

#include "config/waf_config.hpp"
#include "engine/inspection_engine.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wafgate {

inline constexpr const char* kDefaultBlockMessage = "Request blocked by Web Application Firewall";

/**
 * @brief Owner of the process-wide inspection engine
 *
 * The engine is built at most once. The first initialize() call performs
 * construction and records success or a permanent failure; every later call,
 * from any thread, is a no-op and observes the same outcome.
 *
 * Readers check state() on each request (acquire load); the engine handle is
 * immutable once state() is READY.
 *
 * Usage:
 *   LifecycleManager::global().initialize(cfg, factory);
 *   LifecycleManager::global().set_block_message("Blocked");
 */
class LifecycleManager {
public:
    enum class State { UNINITIALIZED, READY, FAILED };

    using TransactionFactory =
        std::function<std::unique_ptr<ITransaction>(const TransactionOptions&)>;

    LifecycleManager() = default;

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    static LifecycleManager& global();

    /**
     * @brief Build the engine once from config
     * @throws RuleSourceError on the constructing call if a rule source is
     *         missing or unreadable (the failure is also recorded)
     */
    void initialize(const WafConfig& config, const EngineFactory& factory);

    /**
     * @brief Build the engine from the plugin named by config.engine_plugin
     */
    void initialize(const WafConfig& config);

    /**
     * @brief Build the engine with only rule sources set; defaults when empty
     */
    void initialize(const std::vector<std::string>& directives_files,
                    const EngineFactory& factory);

    void set_block_message(const std::optional<std::string>& message);
    [[nodiscard]] const std::string& block_message() const { return block_message_; }

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool failed() const { return state() == State::FAILED; }

    /**
     * @brief Engine handle, null unless state() is READY
     */
    [[nodiscard]] std::shared_ptr<IInspectionEngine> engine() const;

    [[nodiscard]] const std::string& init_error() const { return init_error_; }

    /**
     * @brief Whether the engine supports context-aware transactions
     */
    [[nodiscard]] bool context_aware() const { return context_aware_; }

    /**
     * @brief Create a transaction through the factory picked at startup
     * @pre state() == READY
     */
    [[nodiscard]] std::unique_ptr<ITransaction> new_transaction(
        const TransactionOptions& options) const;

    /**
     * @brief Resolve rule sources against root_dir and check readability
     * @throws RuleSourceError naming the first bad source
     */
    [[nodiscard]] static std::vector<std::string> resolve_directives(const WafConfig& config);

private:
    void construct(const WafConfig& config, const EngineFactory& factory);
    void record_failure(std::string message);

    std::once_flag once_;
    std::atomic<State> state_{State::UNINITIALIZED};

    // Written once inside call_once before state_ is published
    std::shared_ptr<IInspectionEngine> engine_;
    TransactionFactory new_tx_;
    bool context_aware_ = false;
    std::string init_error_;

    // Startup-only setting, not synchronized against request threads
    std::string block_message_ = kDefaultBlockMessage;
};

/**
 * @brief Default error-log callback: one warning per matched rule
 */
void log_matched_rule(const MatchedRuleEvent& event);

} // namespace wafgate
