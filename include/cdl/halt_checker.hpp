#pragma once

/** \file halt_checker.hpp
 *  \brief Static admissibility check bounding the work of evaluating a constraint tree.
 *
 * A tree is admissible when:
 * - nesting depth through conditional/composite nodes is <= max_depth (root is depth 0),
 * - every composite has <= max_children children,
 * - every aggregation rule has a well-formed window of <= max_window_seconds.
 *
 * Rejection is a value, not an error: check() never fails for a well-formed
 * tree. The parser turns a rejection into error_code::non_terminating.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "cdl/constraint.hpp"
#include "cdl/error.hpp"

namespace cdl {

/** \brief Hard nesting ceiling for parsing and evaluation, halt check or not.
 *  Tree walks are recursive; HaltLimits::max_depth may not exceed it.
 */
inline constexpr std::size_t kMaxNestingDepth = 1000;

/** \brief Bounds enforced by HaltChecker. */
struct HaltLimits {
  std::size_t max_depth{100};                  /**< deepest allowed nesting level */
  std::size_t max_children{1000};              /**< composite fan-out */
  std::int64_t max_window_seconds{31536000};   /**< 365 days */
};

/** \brief config_invalid when any bound is zero or negative, or max_depth > kMaxNestingDepth. */
auto validate(const HaltLimits& limits) -> std::expected<void, core::error>;

enum class HaltViolation : std::uint8_t {
  none,
  depth_exceeded,
  unbounded_aggregation,
  too_many_children,
};

auto to_string(HaltViolation v) -> std::string_view;

struct HaltResult {
  bool halts{true};
  HaltViolation violation{HaltViolation::none};
  std::optional<std::string> reason;

  explicit operator bool() const noexcept { return halts; }
};

class HaltChecker {
public:
  explicit HaltChecker(HaltLimits limits = {});

  [[nodiscard]] auto check(const Constraint& constraint) const -> HaltResult;

  [[nodiscard]] auto limits() const noexcept -> const HaltLimits& { return limits_; }

private:
  auto check_node(const Constraint& c, std::size_t depth) const -> HaltResult;
  auto check_atomic(const AtomicConstraint& c) const -> HaltResult;
  auto check_conditional(const ConditionalConstraint& c, std::size_t depth) const -> HaltResult;
  auto check_composite(const CompositeConstraint& c, std::size_t depth) const -> HaltResult;

  HaltLimits limits_;
};

} // namespace cdl
