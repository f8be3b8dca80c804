#pragma once

/** \file verify.hpp
 *  \brief One-call verification helpers over Parser + Evaluator.
 *
 * Each helper builds a fresh Evaluator per constraint, so no aggregation
 * state is shared between calls. JSON definitions are parsed (and
 * halt-checked); already-built constraints are evaluated as given.
 */

#include <expected>
#include <memory>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "cdl/clock.hpp"
#include "cdl/constraint.hpp"
#include "cdl/error.hpp"
#include "cdl/evaluator.hpp"
#include "cdl/value.hpp"

namespace cdl {

/** \brief A built constraint or a JSON definition still to be parsed. */
using ConstraintSource = std::variant<Constraint, nlohmann::json>;

auto verify(const ConstraintSource& constraint, const Value& record,
            std::shared_ptr<const Clock> clock = system_clock())
    -> std::expected<EvaluationResult, core::error>;

/** \brief Results in input order; the first definition that fails to parse aborts. */
auto verify_all(const std::vector<ConstraintSource>& constraints, const Value& record,
                std::shared_ptr<const Clock> clock = system_clock())
    -> std::expected<std::vector<EvaluationResult>, core::error>;

/** \brief Passes iff every constraint passes. Id: "AND_" + 4-char prefixes joined by '_'. */
auto verify_and(const std::vector<ConstraintSource>& constraints, const Value& record,
                std::shared_ptr<const Clock> clock = system_clock())
    -> std::expected<EvaluationResult, core::error>;

/** \brief Passes iff any constraint passes. Id: "OR_" + 4-char prefixes joined by '_'. */
auto verify_or(const std::vector<ConstraintSource>& constraints, const Value& record,
               std::shared_ptr<const Clock> clock = system_clock())
    -> std::expected<EvaluationResult, core::error>;

} // namespace cdl
