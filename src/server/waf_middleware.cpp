#include "server/waf_middleware.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace wafgate {

WafMiddleware::WafMiddleware()
    : WafMiddleware(LifecycleManager::global(), Options{}) {}

WafMiddleware::WafMiddleware(LifecycleManager& lifecycle)
    : WafMiddleware(lifecycle, Options{}) {}

WafMiddleware::WafMiddleware(LifecycleManager& lifecycle, Options options)
    : lifecycle_(lifecycle), options_(options) {}

WafMiddleware::Verdict WafMiddleware::handle(httplib::Request& req, httplib::Response& res) {
    auto inspection = inspect(req, res);
    return inspection.verdict;
}

WafMiddleware::Handler WafMiddleware::wrap(Handler next) {
    return [this, next = std::move(next)](const httplib::Request& req, httplib::Response& res) {
        // Route handlers get a const request; the copy carries the restored body
        httplib::Request forwarded = req;
        auto inspection = inspect(forwarded, res);
        if (inspection.verdict == Verdict::ALLOW || inspection.verdict == Verdict::BYPASSED) {
            next(forwarded, res);
        }
        // inspection.tx released here, after the downstream handler
    };
}

std::string WafMiddleware::build_payload(std::string_view msg) {
    return std::format(R"({{"code":0,"msg":"{}"}})", utils::escape_json(msg));
}

// ============================================================================
// Inspection
// ============================================================================

WafMiddleware::Inspection WafMiddleware::inspect(httplib::Request& req, httplib::Response& res) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    Inspection out{Verdict::FAILED, ScopedTransaction(nullptr)};

    if (lifecycle_.failed()) {
        respond_error(res, http::kMsgInitFailed);
        count(out.verdict);
        return out;
    }
    if (!lifecycle_.engine()) {
        respond_error(res, http::kMsgNotInitialized);
        count(out.verdict);
        return out;
    }

    auto converted = build_request_view(req);
    if (converted.is_error()) {
        utils::log::warn(std::format("WAF request conversion failed: {}", converted.error_message()));
        respond_error(res, http::kMsgConversionFailed);
        count(out.verdict);
        return out;
    }
    RequestView& view = converted.value();

    try {
        out.tx = ScopedTransaction(lifecycle_.new_transaction(
            TransactionOptions{utils::generate_uuid(), stop_source_.get_token()}));
        if (!out.tx.get()) {
            utils::log::error("WAF engine returned no transaction");
            respond_error(res, http::kMsgProcessingFailed);
            count(out.verdict);
            return out;
        }

        if (out.tx->is_rule_engine_off()) {
            out.verdict = Verdict::BYPASSED;
            count(out.verdict);
            return out;
        }

        auto result = pipeline_.run(*out.tx, view);
        if (result.is_error()) {
            utils::log::error(std::format("WAF request processing failed [{}]: {}",
                error_category_to_string(result.error_category()), result.error_message()));
            respond_error(res, http::kMsgProcessingFailed);
            count(out.verdict);
            return out;
        }

        auto& outcome = result.value();
        if (outcome.interruption) {
            respond_blocked(res, *outcome.interruption, view);
            out.verdict = Verdict::BLOCKED;
            count(out.verdict);
            return out;
        }

        if (outcome.body) {
            auto replay = read_all(*outcome.body);
            if (replay.is_error()) {
                utils::log::error(std::format("WAF body replay failed: {}", replay.error_message()));
                respond_error(res, http::kMsgProcessingFailed);
                count(out.verdict);
                return out;
            }
            req.body = std::move(replay.value());
        }
        out.verdict = Verdict::ALLOW;
    } catch (const std::exception& e) {
        utils::log::error(std::format("WAF fault: {}", e.what()));
        respond_error(res, http::kMsgProcessingFailed);
        out.verdict = Verdict::FAILED;
    } catch (...) {
        utils::log::error("WAF fault: unknown exception");
        respond_error(res, http::kMsgProcessingFailed);
        out.verdict = Verdict::FAILED;
    }

    count(out.verdict);
    return out;
}

void WafMiddleware::respond_blocked(httplib::Response& res, const Interruption& interruption,
                                    const RequestView& view) {
    const int status = translate(interruption, options_.default_block_status);
    utils::log::info(std::format("WAF blocked {} {} from {}: action={} rule_id={} status={}{}{}",
        view.method, view.uri, view.remote_host, interruption.action,
        interruption.rule_id, status,
        interruption.data.empty() ? "" : " data=", interruption.data));

    res.status = status;
    res.set_header(http::kBlockedHeader, "true");
    res.set_content(build_payload(lifecycle_.block_message()), http::kJsonContentType);
}

void WafMiddleware::respond_error(httplib::Response& res, std::string_view msg) {
    res.status = http::kInternalServerError;
    res.set_content(build_payload(msg), http::kJsonContentType);
}

void WafMiddleware::count(Verdict verdict) {
    switch (verdict) {
        case Verdict::ALLOW:    allowed_.fetch_add(1, std::memory_order_relaxed); break;
        case Verdict::BYPASSED: bypassed_.fetch_add(1, std::memory_order_relaxed); break;
        case Verdict::BLOCKED:  blocked_.fetch_add(1, std::memory_order_relaxed); break;
        case Verdict::FAILED:   failed_.fetch_add(1, std::memory_order_relaxed); break;
    }
}

} // namespace wafgate
