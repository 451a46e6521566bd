#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace wafgate {

/**
 * @brief Error categories for the gateway
 */
enum class ErrorCategory {
    NONE,
    CONVERSION_ERROR,
    INITIALIZATION_ERROR,
    ENGINE_IO_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::CONVERSION_ERROR:     return "conversion_error";
        case ErrorCategory::INITIALIZATION_ERROR: return "initialization_error";
        case ErrorCategory::ENGINE_IO_ERROR:      return "engine_io_error";
        case ErrorCategory::CONFIG_ERROR:         return "config_error";
        case ErrorCategory::INTERNAL_ERROR:       return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief A configured rule source is missing or unreadable.
 *
 * Thrown once by the first initialization attempt. Starting with a partial
 * rule set is not allowed, so callers are expected to abort startup.
 */
class RuleSourceError : public std::runtime_error {
public:
    explicit RuleSourceError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace wafgate
