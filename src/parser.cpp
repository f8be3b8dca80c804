#include "cdl/parser.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "cdl/core/platform_utils.hpp"
#include "cdl/duration.hpp"

namespace cdl {

namespace {

auto parse_failure(std::string message) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::parse_error, std::move(message), "cdl.parser"});
}

// Optional string attribute: absent or null -> nullopt, non-string -> parse_error.
auto optional_string(const nlohmann::json& d, const char* key)
    -> std::expected<std::optional<std::string>, core::error> {
  auto it = d.find(key);
  if (it == d.end() || it->is_null()) return std::optional<std::string>{};
  if (!it->is_string()) return parse_failure(std::string("'") + key + "' must be a string");
  return std::optional<std::string>{it->get<std::string>()};
}

auto required_string(const nlohmann::json& d, const char* key) -> std::expected<std::string, core::error> {
  auto it = d.find(key);
  if (it == d.end()) return parse_failure(std::string("Atomic constraint requires '") + key + "'");
  if (!it->is_string()) return parse_failure(std::string("'") + key + "' must be a string");
  return it->get<std::string>();
}

} // namespace

Parser::Parser(HaltLimits limits) : checker_(limits) {}

auto Parser::create(HaltLimits limits) -> std::expected<Parser, core::error> {
  if (auto ok = validate(limits); !ok) return std::unexpected(ok.error());
  return Parser(limits);
}

auto Parser::parse_text(std::string_view json_text, bool check_halts) const
    -> std::expected<Constraint, core::error> {
  auto j = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return parse_failure("constraint definition is not valid JSON");
  return parse(j, check_halts);
}

auto Parser::parse(const nlohmann::json& definition, bool check_halts) const
    -> std::expected<Constraint, core::error> {
  const bool dbg = core::debug_enabled();
  auto constraint = parse_node(definition, 0, check_halts);
  if (!constraint) {
    if (dbg) std::cerr << "[CDL][parser] " << constraint.error().message << std::endl;
    return constraint;
  }

  if (check_halts) {
    auto verdict = checker_.check(*constraint);
    if (!verdict) {
      return std::unexpected(core::error{
          core::error_code::non_terminating,
          "Constraint may not terminate: " + verdict.reason.value_or(std::string(to_string(verdict.violation))),
          "cdl.parser"});
    }
  }

  if (dbg) std::cerr << "[CDL][parser] parsed " << constraint->id() << std::endl;
  return constraint;
}

auto Parser::parse_node(const nlohmann::json& d, std::size_t depth, bool check_halts) const
    -> std::expected<Constraint, core::error> {
  if (!d.is_object()) return parse_failure("constraint definition must be a JSON object");

  if (depth > kMaxNestingDepth) {
    return parse_failure("Constraint nesting exceeds maximum (" + std::to_string(kMaxNestingDepth) + ")");
  }
  // Stop descending once the tree is already too deep to pass the halt check.
  if (check_halts && depth > checker_.limits().max_depth) {
    return std::unexpected(core::error{
        core::error_code::non_terminating,
        "Constraint may not terminate: Constraint depth exceeds maximum (" +
            std::to_string(checker_.limits().max_depth) + ")",
        "cdl.parser"});
  }

  if (d.contains("if")) return parse_conditional(d, depth, check_halts);
  if (d.contains("logic")) return parse_composite(d, depth, check_halts);
  return parse_atomic(d);
}

auto Parser::parse_conditional(const nlohmann::json& d, std::size_t depth, bool check_halts) const
    -> std::expected<Constraint, core::error> {
  auto then_it = d.find("then");
  if (then_it == d.end()) return parse_failure("Conditional constraint requires 'then'");

  auto condition = parse_node(d.at("if"), depth + 1, check_halts);
  if (!condition) return condition;
  auto then_branch = parse_node(*then_it, depth + 1, check_halts);
  if (!then_branch) return then_branch;

  auto else_it = d.find("else");
  if (else_it == d.end() || else_it->is_null()) {
    return Constraint{ConditionalConstraint(std::move(*condition), std::move(*then_branch))};
  }
  auto else_branch = parse_node(*else_it, depth + 1, check_halts);
  if (!else_branch) return else_branch;
  return Constraint{ConditionalConstraint(std::move(*condition), std::move(*then_branch),
                                          std::move(*else_branch))};
}

auto Parser::parse_composite(const nlohmann::json& d, std::size_t depth, bool check_halts) const
    -> std::expected<Constraint, core::error> {
  const auto& logic_json = d.at("logic");
  if (!logic_json.is_string()) return parse_failure("'logic' must be a string");
  const auto logic = logic_from_string(logic_json.get<std::string>());
  if (!logic) return parse_failure("Unknown logic: " + logic_json.get<std::string>());

  auto children_it = d.find("constraints");
  if (children_it == d.end()) return parse_failure("Composite constraint requires 'constraints'");
  if (!children_it->is_array()) return parse_failure("'constraints' must be an array");

  std::vector<Constraint> children;
  children.reserve(children_it->size());
  for (const auto& child : *children_it) {
    auto parsed = parse_node(child, depth + 1, check_halts);
    if (!parsed) return parsed;
    children.push_back(std::move(*parsed));
  }
  return Constraint{CompositeConstraint(*logic, std::move(children))};
}

auto Parser::parse_atomic(const nlohmann::json& d) const -> std::expected<Constraint, core::error> {
  auto field = required_string(d, "field");
  if (!field) return std::unexpected(field.error());
  auto op_name = required_string(d, "operator");
  if (!op_name) return std::unexpected(op_name.error());
  const auto op = operator_from_string(*op_name);
  if (!op) return parse_failure("Unknown operator: " + *op_name);

  Domain domain = Domain::custom;
  if (auto it = d.find("domain"); it != d.end() && !it->is_null()) {
    if (!it->is_string()) return parse_failure("'domain' must be a string");
    auto parsed = domain_from_string(it->get<std::string>());
    if (!parsed) return parse_failure("Unknown domain: " + it->get<std::string>());
    domain = *parsed;
  }

  AtomicOptions options;
  if (auto it = d.find("action"); it != d.end() && !it->is_null()) {
    if (!it->is_string()) return parse_failure("'action' must be a string");
    auto parsed = action_from_string(it->get<std::string>());
    if (!parsed) return parse_failure("Unknown action: " + it->get<std::string>());
    options.action = *parsed;
  }

  auto message = optional_string(d, "message");
  if (!message) return std::unexpected(message.error());
  auto window = optional_string(d, "window");
  if (!window) return std::unexpected(window.error());
  auto group_by = optional_string(d, "group_by");
  if (!group_by) return std::unexpected(group_by.error());
  auto reference = optional_string(d, "reference");
  if (!reference) return std::unexpected(reference.error());
  options.message = std::move(*message);
  options.window = std::move(*window);
  options.group_by = std::move(*group_by);
  options.reference = std::move(*reference);

  Value value;
  if (auto it = d.find("value"); it != d.end()) value = from_json(*it);

  // Duration literals are structural: reject them before any record is seen.
  if (options.window) {
    if (auto w = parse_duration(*options.window); !w) return std::unexpected(w.error());
  }
  if (*op == Operator::within) {
    if (!value.is_string()) {
      return std::unexpected(core::error{
          core::error_code::malformed_duration,
          "Operator 'within' requires a duration string value", "cdl.parser"});
    }
    if (auto w = parse_duration(value.as_string()); !w) return std::unexpected(w.error());
  }

  return Constraint{AtomicConstraint(domain, std::move(*field), *op, std::move(value), std::move(options))};
}

auto to_json(const Constraint& c) -> nlohmann::json {
  return std::visit([](const auto& n) -> nlohmann::json {
    using T = std::decay_t<decltype(n)>;
    nlohmann::json j;
    if constexpr (std::is_same_v<T, AtomicConstraint>) {
      j["domain"] = std::string(to_string(n.domain()));
      j["field"] = n.field();
      j["operator"] = std::string(to_string(n.op()));
      j["value"] = to_json(n.value());
      j["action"] = std::string(to_string(n.action()));
      if (n.message()) j["message"] = *n.message();
      if (n.window()) j["window"] = *n.window();
      if (n.group_by()) j["group_by"] = *n.group_by();
      if (n.reference()) j["reference"] = *n.reference();
    } else if constexpr (std::is_same_v<T, ConditionalConstraint>) {
      j["if"] = to_json(n.condition());
      j["then"] = to_json(n.then_branch());
      if (const auto* e = n.else_branch()) j["else"] = to_json(*e);
    } else {
      j["logic"] = std::string(to_string(n.logic()));
      j["constraints"] = nlohmann::json::array();
      for (const auto& child : n.children()) j["constraints"].push_back(to_json(child));
    }
    return j;
  }, c.node);
}

} // namespace cdl
