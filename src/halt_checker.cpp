#include "cdl/halt_checker.hpp"

#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "cdl/core/platform_utils.hpp"
#include "cdl/duration.hpp"

namespace cdl {

namespace {

auto reject(HaltViolation v, std::string reason) -> HaltResult {
  return HaltResult{false, v, std::move(reason)};
}

} // namespace

auto validate(const HaltLimits& limits) -> std::expected<void, core::error> {
  if (limits.max_depth == 0) {
    return std::unexpected(core::error{
        core::error_code::config_invalid, "max_depth must be positive", "cdl.halt"});
  }
  if (limits.max_depth > kMaxNestingDepth) {
    return std::unexpected(core::error{
        core::error_code::config_invalid,
        "max_depth must not exceed " + std::to_string(kMaxNestingDepth), "cdl.halt"});
  }
  if (limits.max_children == 0) {
    return std::unexpected(core::error{
        core::error_code::config_invalid, "max_children must be positive", "cdl.halt"});
  }
  if (limits.max_window_seconds <= 0) {
    return std::unexpected(core::error{
        core::error_code::config_invalid, "max_window_seconds must be positive", "cdl.halt"});
  }
  return {};
}

auto to_string(HaltViolation v) -> std::string_view {
  switch (v) {
    case HaltViolation::none: return "none";
    case HaltViolation::depth_exceeded: return "depth_exceeded";
    case HaltViolation::unbounded_aggregation: return "unbounded_aggregation";
    case HaltViolation::too_many_children: return "too_many_children";
  }
  return "none";
}

HaltChecker::HaltChecker(HaltLimits limits) : limits_(limits) {}

auto HaltChecker::check(const Constraint& constraint) const -> HaltResult {
  auto result = check_node(constraint, 0);
  if (!result.halts && core::debug_enabled()) {
    std::cerr << "[CDL][halt] rejected " << constraint.id() << ": "
              << result.reason.value_or("") << std::endl;
  }
  return result;
}

auto HaltChecker::check_node(const Constraint& c, std::size_t depth) const -> HaltResult {
  if (depth > limits_.max_depth) {
    return reject(HaltViolation::depth_exceeded,
                  "Constraint depth exceeds maximum (" + std::to_string(limits_.max_depth) + ")");
  }
  return std::visit([&](const auto& n) -> HaltResult {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, AtomicConstraint>) {
      return check_atomic(n);
    } else if constexpr (std::is_same_v<T, ConditionalConstraint>) {
      return check_conditional(n, depth);
    } else {
      return check_composite(n, depth);
    }
  }, c.node);
}

auto HaltChecker::check_atomic(const AtomicConstraint& c) const -> HaltResult {
  // Comparison and temporal rules are O(1) or O(field size).
  if (!is_aggregation(c.op())) return {};

  if (!c.window()) {
    return reject(HaltViolation::unbounded_aggregation, "Aggregation requires bounded window");
  }
  auto window = parse_duration(*c.window());
  if (!window) {
    return reject(HaltViolation::unbounded_aggregation, window.error().message);
  }
  if (*window > limits_.max_window_seconds) {
    return reject(HaltViolation::unbounded_aggregation,
                  "Aggregation window exceeds maximum (" +
                      std::to_string(limits_.max_window_seconds) + " seconds)");
  }
  return {};
}

auto HaltChecker::check_conditional(const ConditionalConstraint& c, std::size_t depth) const
    -> HaltResult {
  if (auto r = check_node(c.condition(), depth + 1); !r) return r;
  if (auto r = check_node(c.then_branch(), depth + 1); !r) return r;
  if (const auto* e = c.else_branch()) {
    if (auto r = check_node(*e, depth + 1); !r) return r;
  }
  return {};
}

auto HaltChecker::check_composite(const CompositeConstraint& c, std::size_t depth) const
    -> HaltResult {
  if (c.children().size() > limits_.max_children) {
    return reject(HaltViolation::too_many_children,
                  "Composite exceeds maximum constraints (" + std::to_string(limits_.max_children) + ")");
  }
  for (const auto& child : c.children()) {
    if (auto r = check_node(child, depth + 1); !r) return r;
  }
  return {};
}

} // namespace cdl
