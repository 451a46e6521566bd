#pragma once

#include "config/waf_config.hpp"
#include "core/error.hpp"
#include "http/body_stream.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace wafgate {

inline constexpr std::string_view kActionDeny = "deny";

/**
 * @brief Engine decision to stop processing a request
 */
struct Interruption {
    std::string action;     // "deny", "redirect", "drop", ... (engine vocabulary)
    int status = 0;         // 0 = no explicit status
    int rule_id = 0;
    std::string data;       // log metadata, never sent to the client
};

/**
 * @brief Rule match reported through the error-log callback
 */
struct MatchedRuleEvent {
    std::string severity;
    std::string log_line;
    int rule_id = 0;
};

/**
 * @brief Outcome of ITransaction::read_request_body_from
 */
struct BodyReadResult {
    std::optional<Interruption> interruption;
    size_t bytes_read = 0;
    std::optional<std::string> error;
};

/**
 * @brief Everything the engine needs at construction time
 */
struct EngineConfig {
    WafConfig waf;
    std::vector<std::string> resolved_directives;   // absolute, validated paths
    std::function<void(const MatchedRuleEvent&)> on_matched_rule;  // empty = error log off
    std::function<void(std::string_view)> on_debug;                // empty = no debug sink
};

/**
 * @brief Per-request engine state
 *
 * Created by IInspectionEngine, driven by TransactionPipeline only, and
 * released through process_logging() + close() exactly once.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    virtual void process_connection(const std::string& client_host, int client_port,
                                    const std::string& server_host, int server_port) = 0;
    virtual void process_uri(const std::string& uri, const std::string& method,
                             const std::string& protocol) = 0;
    virtual void add_request_header(const std::string& key, const std::string& value) = 0;
    virtual void set_server_name(const std::string& host) = 0;

    [[nodiscard]] virtual std::optional<Interruption> process_request_headers() = 0;

    [[nodiscard]] virtual bool is_request_body_accessible() const = 0;

    /**
     * @brief Pull the request body from stream into the engine
     *
     * The engine may stop early (e.g. body limit reached). It may keep a copy
     * of the bytes it consumed and expose it through request_body_reader().
     */
    [[nodiscard]] virtual BodyReadResult read_request_body_from(IBodyStream& stream) = 0;

    /**
     * @brief Reader over the bytes retained by read_request_body_from
     * @return null when the engine retains nothing
     */
    [[nodiscard]] virtual std::unique_ptr<IBodyStream> request_body_reader() = 0;

    [[nodiscard]] virtual Result<std::optional<Interruption>> process_request_body() = 0;

    [[nodiscard]] virtual bool is_rule_engine_off() const = 0;

    virtual void process_logging() = 0;
    virtual void close() = 0;
};

/**
 * @brief Rule engine instance, shared read-only by all requests
 */
class IInspectionEngine {
public:
    virtual ~IInspectionEngine() = default;

    [[nodiscard]] virtual std::unique_ptr<ITransaction> new_transaction() = 0;
};

struct TransactionOptions {
    std::string id;
    std::stop_token cancellation;
};

/**
 * @brief Optional capability: transactions aware of request context
 *
 * Engines implementing this receive a transaction id and a cancellation
 * token they may observe while ingesting the body.
 */
class IContextAwareEngine {
public:
    virtual ~IContextAwareEngine() = default;

    [[nodiscard]] virtual std::unique_ptr<ITransaction> new_transaction(
        const TransactionOptions& options) = 0;
};

using EngineFactory =
    std::function<Result<std::shared_ptr<IInspectionEngine>>(const EngineConfig&)>;

} // namespace wafgate
