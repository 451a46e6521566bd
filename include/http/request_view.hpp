#pragma once

#include "core/error.hpp"
#include "http/body_stream.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
}

namespace wafgate {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Protocol-neutral projection of an inbound request
 *
 * Host and Transfer-Encoding are lifted out of the header list into their own
 * fields; the pipeline re-adds them as synthetic headers for the engine.
 * Owned by exactly one request invocation.
 */
struct RequestView {
    std::string method;
    std::string uri;                    // Raw request-target, query string included
    std::string protocol;               // "HTTP/1.1"
    HeaderList headers;                 // Duplicates kept, original relative order

    std::string remote_host;
    std::optional<int> remote_port;
    std::string local_host;
    std::optional<int> local_port;

    std::string host;                   // Host header, or the server address
    std::optional<std::string> transfer_encoding;   // First token only

    std::unique_ptr<IBodyStream> body;  // null when the request has no body

    [[nodiscard]] bool has_body() const { return body != nullptr; }
};

/**
 * @brief Project a cpp-httplib request into a RequestView
 * @return CONVERSION_ERROR when the request line is incomplete or malformed
 */
[[nodiscard]] Result<RequestView> build_request_view(const httplib::Request& req);

} // namespace wafgate
