#include "core/transaction_pipeline.hpp"
#include "core/utils.hpp"

#include <format>

namespace wafgate {

// ============================================================================
// ScopedTransaction
// ============================================================================

ScopedTransaction::ScopedTransaction(std::unique_ptr<ITransaction> tx)
    : tx_(std::move(tx)) {}

ScopedTransaction::~ScopedTransaction() {
    release();
}

ScopedTransaction::ScopedTransaction(ScopedTransaction&& other) noexcept
    : tx_(std::move(other.tx_)) {}

ScopedTransaction& ScopedTransaction::operator=(ScopedTransaction&& other) noexcept {
    if (this != &other) {
        release();
        tx_ = std::move(other.tx_);
    }
    return *this;
}

void ScopedTransaction::release() noexcept {
    if (!tx_) return;
    auto tx = std::move(tx_);

    // close() must run even when the logging flush fails
    try {
        tx->process_logging();
    } catch (const std::exception& e) {
        utils::log::error(std::format("WAF transaction logging failed: {}", e.what()));
    } catch (...) {
        utils::log::error("WAF transaction logging failed: unknown exception");
    }
    try {
        tx->close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("WAF transaction close failed: {}", e.what()));
    } catch (...) {
        utils::log::error("WAF transaction close failed: unknown exception");
    }
}

// ============================================================================
// TransactionPipeline
// ============================================================================

Result<PipelineOutcome> TransactionPipeline::run(ITransaction& tx, RequestView& view) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    PipelineOutcome outcome;

    // Phase 1 + 2: never interrupt on their own
    process_connection(tx, view);
    process_uri(tx, view);

    // Phase 3: header-only rejects happen before any body byte is read
    if (auto it = process_headers(tx, view)) {
        header_interruptions_.fetch_add(1, std::memory_order_relaxed);
        outcome.interruption = std::move(it);
        return Result<PipelineOutcome>::ok(std::move(outcome));
    }

    // Phase 4: body ingestion
    if (tx.is_request_body_accessible() && view.has_body()) {
        auto ingested = ingest_body(tx, view, outcome);
        if (ingested.is_error()) {
            engine_errors_.fetch_add(1, std::memory_order_relaxed);
            return Result<PipelineOutcome>::error(ingested.error_category(),
                                                  ingested.error_message());
        }
        if (ingested.value()) {
            body_interruptions_.fetch_add(1, std::memory_order_relaxed);
            outcome.interruption = std::move(ingested.value());
            outcome.body.reset();
            return Result<PipelineOutcome>::ok(std::move(outcome));
        }
    }

    // Request-body rules run even without a body: they also inspect query args
    auto evaluated = tx.process_request_body();
    if (evaluated.is_error()) {
        engine_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<PipelineOutcome>::error(evaluated.error_category(),
                                              evaluated.error_message());
    }
    if (evaluated.value()) {
        body_interruptions_.fetch_add(1, std::memory_order_relaxed);
        outcome.interruption = std::move(evaluated.value());
        outcome.body.reset();
    }
    return Result<PipelineOutcome>::ok(std::move(outcome));
}

void TransactionPipeline::process_connection(ITransaction& tx, const RequestView& view) {
    tx.process_connection(view.remote_host, view.remote_port.value_or(0),
                          view.local_host, view.local_port.value_or(0));
}

void TransactionPipeline::process_uri(ITransaction& tx, const RequestView& view) {
    tx.process_uri(view.uri, view.method, view.protocol);
}

std::optional<Interruption> TransactionPipeline::process_headers(
        ITransaction& tx, const RequestView& view) {
    for (const auto& [key, value] : view.headers) {
        tx.add_request_header(key, value);
    }

    if (!view.host.empty()) {
        tx.add_request_header("Host", view.host);
        tx.set_server_name(view.host);
    }

    if (view.transfer_encoding) {
        tx.add_request_header("Transfer-Encoding", *view.transfer_encoding);
    }

    return tx.process_request_headers();
}

Result<std::optional<Interruption>> TransactionPipeline::ingest_body(
        ITransaction& tx, RequestView& view, PipelineOutcome& outcome) {
    BodyCaptureStream capture(std::move(view.body));

    auto read = tx.read_request_body_from(capture);
    if (read.error) {
        return Result<std::optional<Interruption>>::error(
            ErrorCategory::ENGINE_IO_ERROR,
            std::format("reading request body into engine failed: {}", *read.error));
    }
    if (read.interruption) {
        // Rejected mid-body: nothing is handed downstream
        return Result<std::optional<Interruption>>::ok(std::move(read.interruption));
    }

    if (read.bytes_read != capture.bytes_consumed()) {
        utils::log::debug(std::format("WAF engine reported {} body bytes, {} pulled from stream",
                                      read.bytes_read, capture.bytes_consumed()));
    }

    auto retained = tx.request_body_reader();
    if (!retained && capture.bytes_consumed() > 0) {
        utils::log::debug("WAF engine retained no body copy, replaying captured bytes");
    }
    outcome.body = std::move(capture).into_replay(std::move(retained));
    return Result<std::optional<Interruption>>::ok(std::nullopt);
}

} // namespace wafgate
