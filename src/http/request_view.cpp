#include "http/request_view.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <string_view>

namespace wafgate {

namespace {

constexpr std::string_view kHostHeader = "Host";
constexpr std::string_view kTransferEncodingHeader = "Transfer-Encoding";

std::optional<int> valid_port(int port) {
    if (port > 0 && port <= 65535) return port;
    return std::nullopt;
}

bool has_control_chars(std::string_view s) {
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) return true;
    }
    return false;
}

Result<RequestView> conversion_error(std::string message) {
    return Result<RequestView>::error(ErrorCategory::CONVERSION_ERROR, std::move(message));
}

} // anonymous namespace

Result<RequestView> build_request_view(const httplib::Request& req) {
    if (req.method.empty()) {
        return conversion_error("request method is empty");
    }
    if (req.version.empty()) {
        return conversion_error("request protocol version is empty");
    }

    RequestView view;
    view.method = req.method;
    view.protocol = req.version;
    view.uri = req.target.empty() ? req.path : req.target;
    if (view.uri.empty()) {
        return conversion_error("request target is empty");
    }
    if (has_control_chars(view.uri)) {
        return conversion_error(std::format("request target contains control characters ({} bytes)",
                                            view.uri.size()));
    }

    // httplib::Headers is a case-insensitive multimap: equal keys keep
    // insertion order, distinct keys come out sorted.
    view.headers.reserve(req.headers.size());
    for (const auto& [key, value] : req.headers) {
        if (utils::iequals(key, kHostHeader)) {
            if (view.host.empty()) view.host = value;
            continue;
        }
        if (utils::iequals(key, kTransferEncodingHeader)) {
            if (!view.transfer_encoding) {
                if (auto token = utils::first_token(value); !token.empty()) {
                    view.transfer_encoding = std::move(token);
                }
            }
            continue;
        }
        view.headers.emplace_back(key, value);
    }

    view.remote_host = req.remote_addr;
    view.remote_port = valid_port(req.remote_port);
    view.local_host = req.local_addr;
    view.local_port = valid_port(req.local_port);

    if (view.host.empty()) {
        view.host = req.local_addr;
    }

    if (!req.body.empty()) {
        view.body = std::make_unique<StringBodyStream>(req.body);
    }

    return Result<RequestView>::ok(std::move(view));
}

} // namespace wafgate
