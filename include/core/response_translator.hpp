#pragma once

#include "engine/inspection_engine.hpp"

namespace wafgate {

inline constexpr int kDefaultBlockStatus = 403;

/**
 * @brief Map an engine interruption to an HTTP status code
 *
 * - deny with explicit status -> that status
 * - deny without status       -> 403
 * - any other action          -> default_status
 */
[[nodiscard]] int translate(const Interruption& interruption, int default_status) noexcept;

} // namespace wafgate
