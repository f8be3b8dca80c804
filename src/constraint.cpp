#include "cdl/constraint.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "cdl/core/digest.hpp"

namespace cdl {

namespace {

constexpr std::array<std::pair<Domain, std::string_view>, 7> kDomains{{
    {Domain::financial, "financial"},
    {Domain::communication, "communication"},
    {Domain::health, "health"},
    {Domain::epistemic, "epistemic"},
    {Domain::temporal, "temporal"},
    {Domain::identity, "identity"},
    {Domain::custom, "custom"},
}};

constexpr std::array<std::pair<Operator, std::string_view>, 27> kOperators{{
    {Operator::eq, "eq"},
    {Operator::ne, "ne"},
    {Operator::lt, "lt"},
    {Operator::gt, "gt"},
    {Operator::le, "le"},
    {Operator::ge, "ge"},
    {Operator::contains, "contains"},
    {Operator::matches, "matches"},
    {Operator::in, "in"},
    {Operator::not_in, "not_in"},
    {Operator::exists, "exists"},
    {Operator::empty, "empty"},
    {Operator::within, "within"},
    {Operator::after, "after"},
    {Operator::before, "before"},
    {Operator::sum_lt, "sum_lt"},
    {Operator::sum_le, "sum_le"},
    {Operator::sum_gt, "sum_gt"},
    {Operator::sum_ge, "sum_ge"},
    {Operator::count_lt, "count_lt"},
    {Operator::count_le, "count_le"},
    {Operator::count_gt, "count_gt"},
    {Operator::count_ge, "count_ge"},
    {Operator::avg_lt, "avg_lt"},
    {Operator::avg_le, "avg_le"},
    {Operator::avg_gt, "avg_gt"},
    {Operator::avg_ge, "avg_ge"},
}};

template <typename E, std::size_t N>
auto name_of(const std::array<std::pair<E, std::string_view>, N>& table, E e) -> std::string_view {
  for (const auto& [k, name] : table) {
    if (k == e) return name;
  }
  return "unknown";
}

template <typename E, std::size_t N>
auto lookup_name(const std::array<std::pair<E, std::string_view>, N>& table, std::string_view s)
    -> std::optional<E> {
  for (const auto& [k, name] : table) {
    if (name == s) return k;
  }
  return std::nullopt;
}

} // namespace

auto to_string(Domain d) -> std::string_view { return name_of(kDomains, d); }
auto to_string(Operator op) -> std::string_view { return name_of(kOperators, op); }

auto to_string(Action a) -> std::string_view {
  switch (a) {
    case Action::reject: return "reject";
    case Action::warn: return "warn";
    case Action::log: return "log";
  }
  return "reject";
}

auto to_string(Logic l) -> std::string_view {
  switch (l) {
    case Logic::and_: return "and";
    case Logic::or_: return "or";
    case Logic::not_: return "not";
  }
  return "and";
}

auto to_string(AggregateKind k) -> std::string_view {
  switch (k) {
    case AggregateKind::sum: return "sum";
    case AggregateKind::count: return "count";
    case AggregateKind::avg: return "avg";
  }
  return "sum";
}

auto domain_from_string(std::string_view s) -> std::optional<Domain> { return lookup_name(kDomains, s); }
auto operator_from_string(std::string_view s) -> std::optional<Operator> { return lookup_name(kOperators, s); }

auto action_from_string(std::string_view s) -> std::optional<Action> {
  if (s == "reject") return Action::reject;
  if (s == "warn") return Action::warn;
  if (s == "log") return Action::log;
  return std::nullopt;
}

auto logic_from_string(std::string_view s) -> std::optional<Logic> {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "and") return Logic::and_;
  if (lower == "or") return Logic::or_;
  if (lower == "not") return Logic::not_;
  return std::nullopt;
}

AtomicConstraint::AtomicConstraint(Domain domain, std::string field, Operator op, Value value,
                                   AtomicOptions options)
    : domain_(domain)
    , field_(std::move(field))
    , op_(op)
    , value_(std::move(value))
    , options_(std::move(options)) {
  std::string data;
  data.append(to_string(domain_)).append(":");
  data.append(field_).append(":");
  data.append(to_string(op_)).append(":");
  data.append(value_.to_display_string());
  id_ = "C_" + core::short_digest(data, 8);
}

ConditionalConstraint::ConditionalConstraint(Constraint condition, Constraint then_branch)
    : condition_(std::make_shared<const Constraint>(std::move(condition)))
    , then_(std::make_shared<const Constraint>(std::move(then_branch))) {
  id_ = "COND_" + core::short_digest("if:" + condition_->id() + "|then:" + then_->id(), 8);
}

ConditionalConstraint::ConditionalConstraint(Constraint condition, Constraint then_branch,
                                             Constraint else_branch)
    : condition_(std::make_shared<const Constraint>(std::move(condition)))
    , then_(std::make_shared<const Constraint>(std::move(then_branch)))
    , else_(std::make_shared<const Constraint>(std::move(else_branch))) {
  id_ = "COND_" + core::short_digest(
      "if:" + condition_->id() + "|then:" + then_->id() + "|else:" + else_->id(), 8);
}

CompositeConstraint::CompositeConstraint(Logic logic, std::vector<Constraint> children)
    : logic_(logic)
    , children_(std::move(children)) {
  std::string data(to_string(logic_));
  data.push_back(':');
  for (std::size_t i = 0; i < children_.size(); ++i) {
    if (i) data.push_back(',');
    data += children_[i].id();
  }
  id_ = "COMP_" + core::short_digest(data, 8);
}

auto Constraint::id() const -> const std::string& {
  return std::visit([](const auto& n) -> const std::string& { return n.id(); }, node);
}

} // namespace cdl
