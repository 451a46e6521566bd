#pragma once

#include "engine/inspection_engine.hpp"
#include "http/request_view.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace wafgate {

/**
 * @brief RAII owner of an engine transaction
 *
 * Runs process_logging() then close() exactly once, on release() or on
 * destruction, whichever comes first. Move-only.
 */
class ScopedTransaction {
public:
    explicit ScopedTransaction(std::unique_ptr<ITransaction> tx);
    ~ScopedTransaction();

    ScopedTransaction(ScopedTransaction&& other) noexcept;
    ScopedTransaction& operator=(ScopedTransaction&& other) noexcept;

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    ITransaction* get() const { return tx_.get(); }
    ITransaction* operator->() const { return tx_.get(); }
    ITransaction& operator*() const { return *tx_; }

    void release() noexcept;
    [[nodiscard]] bool released() const { return tx_ == nullptr; }

private:
    std::unique_ptr<ITransaction> tx_;
};

struct PipelineOutcome {
    std::optional<Interruption> interruption;
    std::unique_ptr<IBodyStream> body;  // Replay stream; null unless the body phase ran

    [[nodiscard]] bool allowed() const { return !interruption.has_value(); }
};

/**
 * @brief Drives one transaction through the inspection phases
 *
 * Phases, in order, each able to stop the request:
 * 1. Connection  (remote/local endpoints)
 * 2. URI         (target, method, protocol)
 * 3. Headers     (all headers + synthetic Host/Transfer-Encoding)
 * 4. Body        (engine ingestion, replay stream rebuilt on success)
 * followed by request-body rule evaluation, which also covers query args.
 *
 * Stateless apart from counters; one instance serves all requests.
 */
class TransactionPipeline {
public:
    [[nodiscard]] Result<PipelineOutcome> run(ITransaction& tx, RequestView& view);

    struct Stats {
        uint64_t total_requests;
        uint64_t header_interruptions;
        uint64_t body_interruptions;
        uint64_t engine_errors;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .header_interruptions = header_interruptions_.load(std::memory_order_relaxed),
            .body_interruptions = body_interruptions_.load(std::memory_order_relaxed),
            .engine_errors = engine_errors_.load(std::memory_order_relaxed),
        };
    }

private:
    static void process_connection(ITransaction& tx, const RequestView& view);
    static void process_uri(ITransaction& tx, const RequestView& view);
    [[nodiscard]] static std::optional<Interruption> process_headers(
        ITransaction& tx, const RequestView& view);
    [[nodiscard]] Result<std::optional<Interruption>> ingest_body(
        ITransaction& tx, RequestView& view, PipelineOutcome& outcome);

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> header_interruptions_{0};
    std::atomic<uint64_t> body_interruptions_{0};
    std::atomic<uint64_t> engine_errors_{0};
};

} // namespace wafgate
