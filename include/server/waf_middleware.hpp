#pragma once

#include "core/lifecycle_manager.hpp"
#include "core/response_translator.hpp"
#include "core/transaction_pipeline.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string_view>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
}

namespace wafgate {

/**
 * @brief Per-request WAF boundary for cpp-httplib handlers
 *
 * Checks engine state, projects the request, runs the inspection pipeline
 * and either lets the request through (with its body restored) or answers
 * it with {"code":0,"msg":...}. Every failure path is a structured 500; no
 * engine error text is ever sent to the client.
 *
 * Usage:
 *   WafMiddleware waf;
 *   svr.Post("/submit", waf.wrap([](const auto& req, auto& res) { ... }));
 */
class WafMiddleware {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    enum class Verdict {
        ALLOW,      // Inspected, no interruption
        BYPASSED,   // Rule engine administratively off
        BLOCKED,    // Interruption answered with the block message
        FAILED      // 500 answered (init, conversion, engine error, fault)
    };

    struct Options {
        int default_block_status = kDefaultBlockStatus;   // Non-deny interruptions
    };

    WafMiddleware();
    explicit WafMiddleware(LifecycleManager& lifecycle);
    WafMiddleware(LifecycleManager& lifecycle, Options options);

    /**
     * @brief Inspect req, writing the rejection into res when not allowed
     *
     * On ALLOW the inspected body is written back into req.body. The engine
     * transaction is released before this returns.
     */
    [[nodiscard]] Verdict handle(httplib::Request& req, httplib::Response& res);

    /**
     * @brief Guard a route handler
     *
     * next runs only for ALLOW/BYPASSED, on a copy of the request carrying
     * the restored body. The transaction is released after next returns.
     */
    [[nodiscard]] Handler wrap(Handler next);

    /**
     * @brief Signal cancellation to in-flight context-aware transactions
     */
    void cancel_in_flight() { stop_source_.request_stop(); }

    struct Stats {
        uint64_t total_requests;
        uint64_t allowed;
        uint64_t bypassed;
        uint64_t blocked;
        uint64_t failed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .allowed = allowed_.load(std::memory_order_relaxed),
            .bypassed = bypassed_.load(std::memory_order_relaxed),
            .blocked = blocked_.load(std::memory_order_relaxed),
            .failed = failed_.load(std::memory_order_relaxed),
        };
    }

    [[nodiscard]] const TransactionPipeline& pipeline() const { return pipeline_; }

    /**
     * @brief {"code":0,"msg":"..."} payload
     */
    [[nodiscard]] static std::string build_payload(std::string_view msg);

private:
    struct Inspection {
        Verdict verdict;
        ScopedTransaction tx;
    };

    [[nodiscard]] Inspection inspect(httplib::Request& req, httplib::Response& res);
    void respond_blocked(httplib::Response& res, const Interruption& interruption,
                         const RequestView& view);
    void count(Verdict verdict);

    static void respond_error(httplib::Response& res, std::string_view msg);

    LifecycleManager& lifecycle_;
    const Options options_;
    TransactionPipeline pipeline_;
    std::stop_source stop_source_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> bypassed_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace wafgate
