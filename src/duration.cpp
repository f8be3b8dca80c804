#include "cdl/duration.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>

namespace cdl {

namespace {

auto malformed(std::string_view text) -> std::unexpected<core::error> {
  return std::unexpected(core::error{
      core::error_code::malformed_duration,
      "Invalid duration format: '" + std::string(text) + "'. Use format: 24h, 30m, 7d, etc.",
      "cdl.duration"});
}

auto unit_multiplier(char unit) -> std::int64_t {
  switch (std::tolower(static_cast<unsigned char>(unit))) {
    case 's': return 1;
    case 'm': return kSecondsPerMinute;
    case 'h': return kSecondsPerHour;
    case 'd': return kSecondsPerDay;
    case 'w': return kSecondsPerWeek;
    default: return 0;
  }
}

} // namespace

auto parse_duration(std::string_view text) -> std::expected<std::int64_t, core::error> {
  std::string_view s = text;
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  if (s.size() < 2) return malformed(text);

  const auto mult = unit_multiplier(s.back());
  if (mult == 0) return malformed(text);

  const auto digits = s.substr(0, s.size() - 1);
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return malformed(text);
  }

  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 10);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) return malformed(text);
  if (value > std::numeric_limits<std::int64_t>::max() / mult) return malformed(text);
  return value * mult;
}

} // namespace cdl
