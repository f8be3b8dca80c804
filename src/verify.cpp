#include "cdl/verify.hpp"

#include <string>
#include <utility>

#include "cdl/parser.hpp"

namespace cdl {

namespace {

auto combined_id(std::string prefix, const std::vector<EvaluationResult>& results) -> std::string {
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (i) prefix.push_back('_');
    prefix += results[i].constraint_id.substr(0, 4);
  }
  return prefix;
}

} // namespace

auto verify(const ConstraintSource& constraint, const Value& record, std::shared_ptr<const Clock> clock)
    -> std::expected<EvaluationResult, core::error> {
  Evaluator evaluator(std::move(clock));
  if (const auto* built = std::get_if<Constraint>(&constraint)) {
    return evaluator.evaluate(*built, record);
  }
  auto parsed = Parser{}.parse(std::get<nlohmann::json>(constraint));
  if (!parsed) return std::unexpected(parsed.error());
  return evaluator.evaluate(*parsed, record);
}

auto verify_all(const std::vector<ConstraintSource>& constraints, const Value& record,
                std::shared_ptr<const Clock> clock)
    -> std::expected<std::vector<EvaluationResult>, core::error> {
  std::vector<EvaluationResult> results;
  results.reserve(constraints.size());
  for (const auto& c : constraints) {
    auto r = verify(c, record, clock);
    if (!r) return std::unexpected(r.error());
    results.push_back(std::move(*r));
  }
  return results;
}

auto verify_and(const std::vector<ConstraintSource>& constraints, const Value& record,
                std::shared_ptr<const Clock> clock)
    -> std::expected<EvaluationResult, core::error> {
  const auto now_ms = (clock ? clock : system_clock())->now_ms();
  auto results = verify_all(constraints, record, std::move(clock));
  if (!results) return std::unexpected(results.error());

  bool passed = true;
  std::string message;
  for (const auto& r : *results) {
    passed = passed && r.passed;
    if (!r.message || r.message->empty()) continue;
    if (!message.empty()) message += "; ";
    message += *r.message;
  }
  std::optional<std::string> out_message;
  if (!passed && !message.empty()) out_message = std::move(message);
  return make_result(passed, combined_id("AND_", *results), std::move(out_message), now_ms);
}

auto verify_or(const std::vector<ConstraintSource>& constraints, const Value& record,
               std::shared_ptr<const Clock> clock)
    -> std::expected<EvaluationResult, core::error> {
  const auto now_ms = (clock ? clock : system_clock())->now_ms();
  auto results = verify_all(constraints, record, std::move(clock));
  if (!results) return std::unexpected(results.error());

  bool passed = false;
  for (const auto& r : *results) passed = passed || r.passed;
  return make_result(passed, combined_id("OR_", *results),
                     passed ? std::nullopt : std::optional<std::string>("All constraints failed"), now_ms);
}

} // namespace cdl
