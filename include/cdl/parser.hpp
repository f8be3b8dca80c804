#pragma once

/** \file parser.hpp
 *  \brief Build constraint trees from JSON definitions and halt-check them.
 *
 * Wire shapes:
 * ```
 * Atomic:      {"domain": str, "field": str, "operator": str, "value": any,
 *               "message"?: str, "action"?: "reject"|"warn"|"log",
 *               "window"?: "<N><s|m|h|d|w>", "group_by"?: str, "reference"?: str}
 * Conditional: {"if": Constraint, "then": Constraint, "else"?: Constraint}
 * Composite:   {"logic": "and"|"or"|"not", "constraints": [Constraint, ...]}
 * ```
 * Dispatch: an "if" key makes a conditional, else a "logic" key makes a
 * composite, else the object is an atomic rule.
 */

#include <cstddef>
#include <expected>
#include <string_view>

#include <nlohmann/json.hpp>

#include "cdl/constraint.hpp"
#include "cdl/error.hpp"
#include "cdl/halt_checker.hpp"

namespace cdl {

class Parser {
public:
  Parser() = default;
  explicit Parser(HaltLimits limits);

  /** \brief Parser with validated limits (config_invalid otherwise). */
  static auto create(HaltLimits limits) -> std::expected<Parser, core::error>;

  /** \brief Parse a definition.
   *
   * \param definition JSON object in one of the wire shapes
   * \param check_halts run the halt checker on the finished tree
   * \return Constraint, or parse_error / malformed_duration / non_terminating
   */
  [[nodiscard]] auto parse(const nlohmann::json& definition, bool check_halts = true) const
      -> std::expected<Constraint, core::error>;

  /** \brief Parse JSON text, then parse(definition, check_halts). */
  [[nodiscard]] auto parse_text(std::string_view json_text, bool check_halts = true) const
      -> std::expected<Constraint, core::error>;

  [[nodiscard]] auto halt_checker() const noexcept -> const HaltChecker& { return checker_; }

private:
  auto parse_node(const nlohmann::json& d, std::size_t depth, bool check_halts) const
      -> std::expected<Constraint, core::error>;
  auto parse_conditional(const nlohmann::json& d, std::size_t depth, bool check_halts) const
      -> std::expected<Constraint, core::error>;
  auto parse_composite(const nlohmann::json& d, std::size_t depth, bool check_halts) const
      -> std::expected<Constraint, core::error>;
  auto parse_atomic(const nlohmann::json& d) const -> std::expected<Constraint, core::error>;

  HaltChecker checker_;
};

/** \brief Serialize back to the wire shape; parse(to_json(c)) reproduces c's ids. */
auto to_json(const Constraint& c) -> nlohmann::json;

} // namespace cdl
