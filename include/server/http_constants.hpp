#pragma once

#include <string>
#include <string_view>

namespace wafgate::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kBlockedHeader = "X-WAF-Blocked";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr int kInternalServerError = 500;

inline constexpr std::string_view kMsgInitFailed = "WAF initialization failed";
inline constexpr std::string_view kMsgNotInitialized = "WAF instance not initialized";
inline constexpr std::string_view kMsgConversionFailed = "Failed to convert request";
inline constexpr std::string_view kMsgProcessingFailed = "WAF request processing failed";

} // namespace wafgate::http
