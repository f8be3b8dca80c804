#include "cdl/operators.hpp"

#include <algorithm>
#include <regex>

namespace cdl {

namespace {

auto type_mismatch(std::string_view what, const Value& a, const Value& b) -> std::unexpected<std::string> {
  return std::unexpected(std::string(what) + " not supported between " +
                         std::string(kind_name(a.kind())) + " and " + std::string(kind_name(b.kind())));
}

auto is_empty(const Value& v) -> bool {
  switch (v.kind()) {
    case Value::Kind::null: return true;
    case Value::Kind::string: return v.as_string().empty();
    case Value::Kind::list: return v.as_list().empty();
    case Value::Kind::map: return v.as_map().empty();
    default: return false;
  }
}

auto contains(const Value& actual, const Value& needle) -> std::expected<bool, std::string> {
  if (!needle.is_string()) {
    return std::unexpected("contains requires a string operand, got " + std::string(kind_name(needle.kind())));
  }
  if (actual.is_null()) return false;
  if (actual.is_list()) {
    const auto& l = actual.as_list();
    return std::find(l.begin(), l.end(), needle) != l.end();
  }
  return actual.to_display_string().find(needle.as_string()) != std::string::npos;
}

auto matches(const Value& actual, const Value& pattern, std::size_t max_subject)
    -> std::expected<bool, std::string> {
  if (!pattern.is_string()) {
    return std::unexpected("matches requires a string pattern, got " + std::string(kind_name(pattern.kind())));
  }
  try {
    const std::regex re(pattern.as_string(), std::regex::ECMAScript);
    if (actual.is_null()) return false;
    const auto subject = actual.to_display_string();
    if (subject.size() > max_subject) {
      return std::unexpected("matches subject of " + std::to_string(subject.size()) +
                             " characters exceeds limit of " + std::to_string(max_subject));
    }
    return std::regex_search(subject, re);
  } catch (const std::regex_error& e) {
    return std::unexpected("invalid regular expression '" + pattern.as_string() + "': " + e.what());
  }
}

} // namespace

auto order_values(const Value& a, const Value& b) -> std::expected<std::partial_ordering, std::string> {
  if (a.kind() == Value::Kind::integer && b.kind() == Value::Kind::integer) {
    return a.as_int() <=> b.as_int();
  }
  if (a.is_number() && b.is_number()) {
    return *a.number() <=> *b.number();
  }
  if (a.is_string() && b.is_string()) {
    const int c = a.as_string().compare(b.as_string());
    return c < 0 ? std::partial_ordering::less
                 : (c > 0 ? std::partial_ordering::greater : std::partial_ordering::equivalent);
  }
  if (a.is_list() && b.is_list()) {
    const auto& la = a.as_list();
    const auto& lb = b.as_list();
    const auto n = std::min(la.size(), lb.size());
    for (std::size_t i = 0; i < n; ++i) {
      if (la[i] == lb[i]) continue;
      return order_values(la[i], lb[i]);
    }
    return la.size() <=> lb.size();
  }
  return type_mismatch("ordering", a, b);
}

auto contained_in(const Value& a, const Value& b) -> std::expected<bool, std::string> {
  switch (b.kind()) {
    case Value::Kind::list: {
      const auto& l = b.as_list();
      return std::find(l.begin(), l.end(), a) != l.end();
    }
    case Value::Kind::string:
      if (!a.is_string()) {
        return std::unexpected("'in <string>' requires a string left operand, got " +
                               std::string(kind_name(a.kind())));
      }
      return b.as_string().find(a.as_string()) != std::string::npos;
    case Value::Kind::map:
      if (!a.is_string()) return false;
      return b.as_map().find(a.as_string()) != b.as_map().end();
    default:
      return std::unexpected("argument of type " + std::string(kind_name(b.kind())) + " is not iterable");
  }
}

auto apply_comparison(Operator op, const Value& actual, const Value& expected,
                      std::size_t max_match_subject) -> std::expected<bool, std::string> {
  switch (op) {
    case Operator::eq: return actual == expected;
    case Operator::ne: return !(actual == expected);
    case Operator::lt:
    case Operator::gt:
    case Operator::le:
    case Operator::ge: {
      auto ord = order_values(actual, expected);
      if (!ord) return std::unexpected(ord.error());
      if (op == Operator::lt) return *ord < 0;
      if (op == Operator::gt) return *ord > 0;
      if (op == Operator::le) return *ord <= 0;
      return *ord >= 0;
    }
    case Operator::contains: return contains(actual, expected);
    case Operator::matches: return matches(actual, expected, max_match_subject);
    case Operator::in: return contained_in(actual, expected);
    case Operator::not_in: {
      auto r = contained_in(actual, expected);
      if (!r) return r;
      return !*r;
    }
    case Operator::exists: return !actual.is_null();
    case Operator::empty: return is_empty(actual);
    default:
      return std::unexpected("operator " + std::string(to_string(op)) + " is not a comparison");
  }
}

} // namespace cdl
