#pragma once

/** \file duration.hpp
 *  \brief Parse "<N><unit>" duration literals ("30m", "24h", "7d") into seconds.
 *
 * Grammar: optional surrounding whitespace, one or more decimal digits, one
 * unit letter s|m|h|d|w (case-insensitive). Anything else is malformed.
 */

#include <cstdint>
#include <expected>
#include <string_view>

#include "cdl/error.hpp"

namespace cdl {

inline constexpr std::int64_t kSecondsPerMinute = 60;
inline constexpr std::int64_t kSecondsPerHour = 3600;
inline constexpr std::int64_t kSecondsPerDay = 86400;
inline constexpr std::int64_t kSecondsPerWeek = 604800;

/** \brief Duration in whole seconds, or error_code::malformed_duration. */
[[nodiscard]] auto parse_duration(std::string_view text)
    -> std::expected<std::int64_t, core::error>;

} // namespace cdl
