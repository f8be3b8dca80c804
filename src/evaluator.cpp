#include "cdl/evaluator.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "cdl/core/digest.hpp"
#include "cdl/core/platform_utils.hpp"
#include "cdl/operators.hpp"

namespace cdl {

namespace {

const Value kNull{};

auto default_message(const AtomicConstraint& c, const Value& actual) -> std::string {
  return c.field() + " " + std::string(to_string(c.op())) + " " + c.value().to_display_string() +
         " failed (actual: " + actual.to_display_string() + ")";
}

auto compare_aggregate(Comparator cmp, double aggregate, double limit) -> bool {
  switch (cmp) {
    case Comparator::lt: return aggregate < limit;
    case Comparator::le: return aggregate <= limit;
    case Comparator::gt: return aggregate > limit;
    case Comparator::ge: return aggregate >= limit;
  }
  return false;
}

} // namespace

auto fingerprint_of(bool passed, std::string_view constraint_id, std::int64_t timestamp_ms) -> std::string {
  std::string data(passed ? "true" : "false");
  data.push_back(':');
  data.append(constraint_id);
  data.push_back(':');
  data.append(std::to_string(timestamp_ms));
  return core::short_digest(data, 16);
}

auto make_result(bool passed, std::string constraint_id, std::optional<std::string> message,
                 std::int64_t timestamp_ms) -> EvaluationResult {
  EvaluationResult r;
  r.passed = passed;
  r.fingerprint = fingerprint_of(passed, constraint_id, timestamp_ms);
  r.constraint_id = std::move(constraint_id);
  r.message = std::move(message);
  r.timestamp = timestamp_ms;
  return r;
}

auto to_json(const EvaluationResult& r) -> nlohmann::json {
  nlohmann::json j;
  j["passed"] = r.passed;
  j["constraint_id"] = r.constraint_id;
  j["message"] = r.message ? nlohmann::json(*r.message) : nlohmann::json(nullptr);
  j["timestamp"] = r.timestamp;
  j["fingerprint"] = r.fingerprint;
  return j;
}

Evaluator::Evaluator(std::shared_ptr<const Clock> clock, EvaluatorConfig config)
    : clock_(clock ? std::move(clock) : system_clock())
    , config_(config)
    , aggregation_(clock_)
    , debug_(core::debug_enabled()) {}

auto Evaluator::evaluate(const Constraint& constraint, const Value& record) -> EvaluationResult {
  std::lock_guard lock(mutex_);
  EvaluationResult result;
  try {
    result = evaluate_node(constraint, record);
  } catch (const std::exception& e) {
    result = fail(constraint.id(), "Evaluation error: " + std::string(e.what()));
  }
  if (debug_) {
    std::cerr << "[CDL][eval] " << result.constraint_id << (result.passed ? " PASS" : " FAIL");
    if (result.message) std::cerr << ": " << *result.message;
    std::cerr << std::endl;
  }
  return result;
}

void Evaluator::prune_aggregations() { prune_aggregations(config_.default_prune_age_seconds); }

void Evaluator::prune_aggregations(std::int64_t max_age_seconds) {
  std::lock_guard lock(mutex_);
  const auto before = aggregation_.entry_count();
  aggregation_.prune(max_age_seconds);
  if (debug_) {
    std::cerr << "[CDL][eval] pruned " << (before - aggregation_.entry_count())
              << " aggregation entries older than " << max_age_seconds << "s" << std::endl;
  }
}

auto Evaluator::pass(const std::string& id) const -> EvaluationResult {
  return make_result(true, id, std::nullopt, clock_->now_ms());
}

auto Evaluator::fail(const std::string& id, std::string message) const -> EvaluationResult {
  return make_result(false, id, std::move(message), clock_->now_ms());
}

auto Evaluator::evaluate_node(const Constraint& c, const Value& record) -> EvaluationResult {
  evaluation_count_.fetch_add(1, std::memory_order_relaxed);
  return std::visit([&](const auto& n) -> EvaluationResult {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, AtomicConstraint>) {
      return evaluate_atomic(n, record);
    } else if constexpr (std::is_same_v<T, ConditionalConstraint>) {
      return evaluate_conditional(n, record);
    } else {
      return evaluate_composite(n, record);
    }
  }, c.node);
}

auto Evaluator::evaluate_atomic(const AtomicConstraint& c, const Value& record) -> EvaluationResult {
  const Value* field_value = record.lookup(c.field());
  if (is_temporal(c.op())) return evaluate_temporal(c, record, field_value);
  if (is_aggregation(c.op())) return evaluate_aggregation(c, record, field_value);
  return evaluate_comparison(c, field_value ? *field_value : kNull);
}

auto Evaluator::evaluate_comparison(const AtomicConstraint& c, const Value& field_value)
    -> EvaluationResult {
  std::expected<bool, std::string> verdict;
  try {
    verdict = apply_comparison(c.op(), field_value, c.value(), config_.max_match_subject);
  } catch (const std::exception& e) {
    verdict = std::unexpected(std::string(e.what()));
  }
  if (!verdict) return fail(c.id(), "Evaluation error: " + verdict.error());
  if (*verdict) return pass(c.id());
  return fail(c.id(), c.message().value_or(default_message(c, field_value)));
}

auto Evaluator::evaluate_temporal(const AtomicConstraint& c, const Value& record, const Value* field_value)
    -> EvaluationResult {
  if (field_value == nullptr || field_value->is_null()) {
    return fail(c.id(), "Field not found: " + c.field());
  }

  std::optional<double> reference;
  if (c.reference()) {
    const Value* ref_value = record.lookup(*c.reference());
    if (ref_value == nullptr || ref_value->is_null()) {
      return fail(c.id(), "Reference field not found: " + *c.reference());
    }
    reference = ref_value->coerce_number();
    if (!reference) {
      return fail(c.id(), "Evaluation error: reference " + *c.reference() + " is not a timestamp");
    }
  } else {
    reference = static_cast<double>(clock_->now_ms()) / 1000.0;
  }

  const auto field_ts = field_value->coerce_number();
  if (!field_ts) {
    return fail(c.id(), "Evaluation error: field " + c.field() + " is not a timestamp");
  }

  bool passed = false;
  switch (c.op()) {
    case Operator::within: {
      // The duration travels in `value` for this family, not in `window`.
      if (!c.value().is_string()) {
        return fail(c.id(), "Evaluation error: within requires a duration string value");
      }
      auto window = parse_duration(c.value().as_string());
      if (!window) return fail(c.id(), window.error().message);
      passed = std::fabs(*field_ts - *reference) <= static_cast<double>(*window);
      break;
    }
    case Operator::after: passed = *field_ts > *reference; break;
    case Operator::before: passed = *field_ts < *reference; break;
    default: break;
  }

  if (passed) return pass(c.id());
  return fail(c.id(), c.message().value_or(default_message(c, *field_value)));
}

auto Evaluator::evaluate_aggregation(const AtomicConstraint& c, const Value& record, const Value* field_value)
    -> EvaluationResult {
  if (!c.window()) return fail(c.id(), "Window required for aggregation");
  auto window = parse_duration(*c.window());
  if (!window) return fail(c.id(), window.error().message);

  std::string group_key = "default";
  if (c.group_by()) {
    const Value* g = record.lookup(*c.group_by());
    if (g != nullptr && g->truthy()) group_key = g->to_display_string();
  }

  // Observe before deciding: the current record counts toward its own window.
  if (field_value != nullptr) {
    if (auto n = field_value->coerce_number()) aggregation_.append(group_key, *n);
  }

  const auto kind = aggregate_kind(c.op());
  Value aggregate;
  switch (kind) {
    case AggregateKind::sum: aggregate = aggregation_.sum(group_key, *window); break;
    case AggregateKind::count: aggregate = aggregation_.count(group_key, *window); break;
    case AggregateKind::avg: aggregate = aggregation_.avg(group_key, *window); break;
  }

  const auto limit = c.value().number();
  if (!limit) {
    return fail(c.id(), "Evaluation error: aggregation limit must be numeric, got " +
                            std::string(kind_name(c.value().kind())));
  }

  if (compare_aggregate(aggregate_comparator(c.op()), *aggregate.number(), *limit)) return pass(c.id());
  return fail(c.id(), std::string(to_string(c.op())) + "(" + c.field() + ") = " +
                          aggregate.to_display_string() + ", limit = " + c.value().to_display_string());
}

auto Evaluator::evaluate_conditional(const ConditionalConstraint& c, const Value& record) -> EvaluationResult {
  const auto condition = evaluate_node(c.condition(), record);
  if (condition.passed) return evaluate_node(c.then_branch(), record);
  if (const auto* else_branch = c.else_branch()) return evaluate_node(*else_branch, record);
  return pass(c.id());
}

auto Evaluator::evaluate_composite(const CompositeConstraint& c, const Value& record) -> EvaluationResult {
  std::vector<EvaluationResult> results;
  results.reserve(c.children().size());
  for (const auto& child : c.children()) results.push_back(evaluate_node(child, record));

  std::size_t passed_count = 0;
  for (const auto& r : results) passed_count += r.passed ? 1 : 0;

  switch (c.logic()) {
    case Logic::and_: {
      if (passed_count == results.size()) return pass(c.id());
      std::string message;
      for (const auto& r : results) {
        if (r.passed || !r.message || r.message->empty()) continue;
        if (!message.empty()) message += "; ";
        message += *r.message;
      }
      if (message.empty()) return make_result(false, c.id(), std::nullopt, clock_->now_ms());
      return fail(c.id(), std::move(message));
    }
    case Logic::or_:
      if (passed_count > 0) return pass(c.id());
      return fail(c.id(), "All constraints failed");
    case Logic::not_:
      if (passed_count == 0) return pass(c.id());
      return fail(c.id(), "NOT condition not satisfied");
  }
  return fail(c.id(), "Unknown logic");
}

} // namespace cdl
