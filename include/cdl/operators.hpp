#pragma once

/** \file operators.hpp
 *  \brief Comparison-family operators over dynamic values.
 *
 * Each operator either yields a verdict or a diagnostic describing why the
 * operands cannot be compared (type mismatch, invalid regex, non-iterable
 * right operand). Diagnostics become failing results in the evaluator.
 */

#include <compare>
#include <cstddef>
#include <expected>
#include <string>

#include "cdl/constraint.hpp"
#include "cdl/value.hpp"

namespace cdl {

/** \brief Longest subject `matches` will run a regex over; longer subjects fail.
 *  std::regex_search recurses once per subject character.
 */
inline constexpr std::size_t kDefaultMaxMatchSubject = 2048;

/** \brief Ordering for lt/gt/le/ge: number~number, string~string, list~list (lexicographic). */
auto order_values(const Value& a, const Value& b) -> std::expected<std::partial_ordering, std::string>;

/** \brief a in b: element of a list, substring of a string, or key of a map. */
auto contained_in(const Value& a, const Value& b) -> std::expected<bool, std::string>;

/** \brief Precondition: is_comparison(op). */
auto apply_comparison(Operator op, const Value& actual, const Value& expected,
                      std::size_t max_match_subject = kDefaultMaxMatchSubject)
    -> std::expected<bool, std::string>;

} // namespace cdl
