#pragma once

/** \file evaluator.hpp
 *  \brief Walks a constraint tree against a record and returns a binary verdict.
 *
 * Every path returns an EvaluationResult; data problems (missing fields, type
 * mismatches, bad regexes) become failing results with a diagnostic message.
 * The only side effect is appending to the evaluator's AggregationState when
 * an aggregation rule sees a numeric field.
 *
 * Example usage:
 * ```cpp
 * Evaluator evaluator;
 * auto parsed = Parser{}.parse(nlohmann::json::parse(R"({"field":"amount","operator":"lt","value":1000})"));
 * auto result = evaluator.evaluate(*parsed, Value::Map{{"amount", 500}});
 * // result.passed == true
 * ```
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "cdl/aggregation_state.hpp"
#include "cdl/clock.hpp"
#include "cdl/constraint.hpp"
#include "cdl/duration.hpp"
#include "cdl/operators.hpp"
#include "cdl/value.hpp"

namespace cdl {

/** \brief Outcome of one evaluation. Produced fresh per call. */
struct EvaluationResult {
  bool passed{false};
  std::string constraint_id;
  std::optional<std::string> message;
  std::int64_t timestamp{0};   /**< milliseconds since epoch */
  std::string fingerprint;     /**< 16 hex chars over passed:constraint_id:timestamp */
};

/** \brief Build a result and compute its fingerprint. */
auto make_result(bool passed, std::string constraint_id, std::optional<std::string> message,
                 std::int64_t timestamp_ms) -> EvaluationResult;

/** \brief Fingerprint for (passed, constraint_id, timestamp). Time-dependent by construction. */
auto fingerprint_of(bool passed, std::string_view constraint_id, std::int64_t timestamp_ms) -> std::string;

/** \brief {"passed", "constraint_id", "message", "timestamp", "fingerprint"}. */
auto to_json(const EvaluationResult& r) -> nlohmann::json;

struct EvaluatorConfig {
  std::int64_t default_prune_age_seconds{kSecondsPerWeek};
  std::size_t max_match_subject{kDefaultMaxMatchSubject};  /**< `matches` subjects above this fail */
};

class Evaluator {
public:
  explicit Evaluator(std::shared_ptr<const Clock> clock = system_clock(), EvaluatorConfig config = {});

  Evaluator(const Evaluator&) = delete;
  Evaluator& operator=(const Evaluator&) = delete;

  /** \brief Evaluate a (halt-checked) constraint against a record.
   *
   * Never throws for data problems: anything that goes wrong while walking
   * the tree becomes a failing result for the root constraint.
   *
   * Composite children are all evaluated, without short-circuit, so their
   * aggregation side effects are applied consistently.
   *
   * Thread-safety: serialized on an internal mutex; the append-then-read of
   * an aggregation rule is atomic with respect to other calls.
   */
  auto evaluate(const Constraint& constraint, const Value& record) -> EvaluationResult;

  /** \brief Prune aggregation entries older than the configured default age. */
  void prune_aggregations();
  void prune_aggregations(std::int64_t max_age_seconds);

  /** \brief Number of node evaluations performed, nested nodes included. */
  [[nodiscard]] auto evaluation_count() const noexcept -> std::uint64_t {
    return evaluation_count_.load(std::memory_order_relaxed);
  }

  /** \brief Read access for inspection; not synchronized with concurrent evaluate(). */
  [[nodiscard]] auto aggregation_state() const noexcept -> const AggregationState& { return aggregation_; }

  [[nodiscard]] auto config() const noexcept -> const EvaluatorConfig& { return config_; }

private:
  auto evaluate_node(const Constraint& c, const Value& record) -> EvaluationResult;
  auto evaluate_atomic(const AtomicConstraint& c, const Value& record) -> EvaluationResult;
  auto evaluate_comparison(const AtomicConstraint& c, const Value& field_value) -> EvaluationResult;
  auto evaluate_temporal(const AtomicConstraint& c, const Value& record, const Value* field_value)
      -> EvaluationResult;
  auto evaluate_aggregation(const AtomicConstraint& c, const Value& record, const Value* field_value)
      -> EvaluationResult;
  auto evaluate_conditional(const ConditionalConstraint& c, const Value& record) -> EvaluationResult;
  auto evaluate_composite(const CompositeConstraint& c, const Value& record) -> EvaluationResult;

  auto pass(const std::string& id) const -> EvaluationResult;
  auto fail(const std::string& id, std::string message) const -> EvaluationResult;

  std::shared_ptr<const Clock> clock_;
  EvaluatorConfig config_;
  AggregationState aggregation_;
  std::atomic<std::uint64_t> evaluation_count_{0};
  std::mutex mutex_;
  bool debug_{false};
};

} // namespace cdl
