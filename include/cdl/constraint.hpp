#pragma once

/** \file constraint.hpp
 *  \brief Constraint tree: atomic rules, if/then/else, and/or/not composition.
 *
 * The tree is built bottom-up from a literal or a parsed definition and is
 * immutable afterwards. Every node carries a content-derived id.
 * Ownership: value-semantic; conditional branches are shared immutable nodes.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cdl/value.hpp"

namespace cdl {

/** \brief Subject area of a rule. Informational only. */
enum class Domain : std::uint8_t {
  financial,
  communication,
  health,
  epistemic,
  temporal,
  identity,
  custom,
};

enum class Operator : std::uint8_t {
  // comparison
  eq, ne, lt, gt, le, ge, contains, matches, in, not_in, exists, empty,
  // temporal
  within, after, before,
  // aggregation over a trailing window
  sum_lt, sum_le, sum_gt, sum_ge,
  count_lt, count_le, count_gt, count_ge,
  avg_lt, avg_le, avg_gt, avg_ge,
};

/** \brief What a caller should do with a failing verdict. Carried, not enforced. */
enum class Action : std::uint8_t { reject, warn, log };

/** \brief Composite logic. not_ means "none of the children pass". */
enum class Logic : std::uint8_t { and_, or_, not_ };

enum class AggregateKind : std::uint8_t { sum, count, avg };
enum class Comparator : std::uint8_t { lt, le, gt, ge };

auto to_string(Domain d) -> std::string_view;
auto to_string(Operator op) -> std::string_view;
auto to_string(Action a) -> std::string_view;
auto to_string(Logic l) -> std::string_view;
auto to_string(AggregateKind k) -> std::string_view;

auto domain_from_string(std::string_view s) -> std::optional<Domain>;
auto operator_from_string(std::string_view s) -> std::optional<Operator>;
auto action_from_string(std::string_view s) -> std::optional<Action>;
/** \brief Case-insensitive ("AND" and "and" are the same logic). */
auto logic_from_string(std::string_view s) -> std::optional<Logic>;

constexpr bool is_temporal(Operator op) noexcept {
  return op == Operator::within || op == Operator::after || op == Operator::before;
}
constexpr bool is_aggregation(Operator op) noexcept {
  return op >= Operator::sum_lt && op <= Operator::avg_ge;
}
constexpr bool is_comparison(Operator op) noexcept {
  return op <= Operator::empty;
}

// Precondition for both: is_aggregation(op).
constexpr AggregateKind aggregate_kind(Operator op) noexcept {
  const auto i = static_cast<int>(op) - static_cast<int>(Operator::sum_lt);
  return static_cast<AggregateKind>(i / 4);
}
constexpr Comparator aggregate_comparator(Operator op) noexcept {
  const auto i = static_cast<int>(op) - static_cast<int>(Operator::sum_lt);
  return static_cast<Comparator>(i % 4);
}

/** \brief Optional attributes of an atomic rule. */
struct AtomicOptions {
  std::optional<std::string> message;   /**< reported when the rule fails */
  Action action{Action::reject};
  std::optional<std::string> window;    /**< aggregation window, e.g. "24h" */
  std::optional<std::string> group_by;  /**< aggregation partition field */
  std::optional<std::string> reference; /**< temporal reference field (default: now) */
};

/** \brief One field, one operator, one value.
 *
 * id() is "C_" + 8 hex chars of SHA-256 over domain:field:operator:value,
 * stable across identical definitions. Values that render identically
 * ("1" and 1) share an id.
 */
class AtomicConstraint {
public:
  AtomicConstraint(Domain domain, std::string field, Operator op, Value value,
                   AtomicOptions options = {});

  [[nodiscard]] auto domain() const noexcept -> Domain { return domain_; }
  [[nodiscard]] auto field() const noexcept -> const std::string& { return field_; }
  [[nodiscard]] auto op() const noexcept -> Operator { return op_; }
  [[nodiscard]] auto value() const noexcept -> const Value& { return value_; }
  [[nodiscard]] auto message() const noexcept -> const std::optional<std::string>& { return options_.message; }
  [[nodiscard]] auto action() const noexcept -> Action { return options_.action; }
  [[nodiscard]] auto window() const noexcept -> const std::optional<std::string>& { return options_.window; }
  [[nodiscard]] auto group_by() const noexcept -> const std::optional<std::string>& { return options_.group_by; }
  [[nodiscard]] auto reference() const noexcept -> const std::optional<std::string>& { return options_.reference; }
  [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }

private:
  Domain domain_;
  std::string field_;
  Operator op_;
  Value value_;
  AtomicOptions options_;
  std::string id_;
};

struct Constraint;

/** \brief if condition then A else B. Without else, a false condition passes. */
class ConditionalConstraint {
public:
  ConditionalConstraint(Constraint condition, Constraint then_branch);
  ConditionalConstraint(Constraint condition, Constraint then_branch, Constraint else_branch);

  [[nodiscard]] auto condition() const noexcept -> const Constraint& { return *condition_; }
  [[nodiscard]] auto then_branch() const noexcept -> const Constraint& { return *then_; }
  /** \brief nullptr when the conditional has no else branch. */
  [[nodiscard]] auto else_branch() const noexcept -> const Constraint* { return else_.get(); }
  [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }

private:
  std::shared_ptr<const Constraint> condition_;
  std::shared_ptr<const Constraint> then_;
  std::shared_ptr<const Constraint> else_;
  std::string id_;
};

/** \brief and/or/not over any number of children. */
class CompositeConstraint {
public:
  CompositeConstraint(Logic logic, std::vector<Constraint> children);

  [[nodiscard]] auto logic() const noexcept -> Logic { return logic_; }
  [[nodiscard]] auto children() const noexcept -> const std::vector<Constraint>& { return children_; }
  [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }

private:
  Logic logic_;
  std::vector<Constraint> children_;
  std::string id_;
};

/** \brief Recursive constraint tree. */
struct Constraint {
  std::variant<AtomicConstraint, ConditionalConstraint, CompositeConstraint> node; /**< root node */

  [[nodiscard]] auto id() const -> const std::string&;
};

} // namespace cdl
