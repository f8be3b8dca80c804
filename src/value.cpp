#include "cdl/value.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace cdl {

auto Value::number() const noexcept -> std::optional<double> {
  switch (kind()) {
    case Kind::integer: return static_cast<double>(as_int());
    case Kind::real: return as_double();
    default: return std::nullopt;
  }
}

auto Value::coerce_number() const -> std::optional<double> {
  if (auto n = number()) return n;
  if (!is_string()) return std::nullopt;

  std::string_view s = as_string();
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') s.remove_prefix(1);

  double out = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

auto Value::truthy() const noexcept -> bool {
  switch (kind()) {
    case Kind::null: return false;
    case Kind::boolean: return as_bool();
    case Kind::integer: return as_int() != 0;
    case Kind::real: return as_double() != 0.0;
    case Kind::string: return !as_string().empty();
    case Kind::list: return !as_list().empty();
    case Kind::map: return !as_map().empty();
  }
  return false;
}

auto Value::lookup(std::string_view dot_path) const -> const Value* {
  const Value* cur = this;
  std::size_t start = 0;
  while (true) {
    const auto dot = dot_path.find('.', start);
    const auto part = dot_path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (!cur->is_map()) return nullptr;
    const auto& m = cur->as_map();
    auto it = m.find(part);
    if (it == m.end()) return nullptr;
    cur = &it->second;
    if (dot == std::string_view::npos) return cur;
    start = dot + 1;
  }
}

static auto format_double(double d) -> std::string {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  std::array<char, 64> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
  std::string out(buf.data(), ec == std::errc() ? ptr : buf.data());
  if (out.find_first_of(".e") == std::string::npos) out += ".0";
  return out;
}

auto Value::to_display_string() const -> std::string {
  switch (kind()) {
    case Kind::null: return "null";
    case Kind::boolean: return as_bool() ? "true" : "false";
    case Kind::integer: return std::to_string(as_int());
    case Kind::real: return format_double(as_double());
    case Kind::string: return as_string();
    case Kind::list:
    case Kind::map: return to_json(*this).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  return {};
}

auto Value::parse(std::string_view json_text) -> std::expected<Value, core::error> {
  auto j = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return std::unexpected(core::error{
        core::error_code::parse_error, "invalid JSON text", "cdl.value"});
  }
  return from_json(j);
}

bool operator==(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.kind() == Value::Kind::integer && b.kind() == Value::Kind::integer) return a.as_int() == b.as_int();
    return *a.number() == *b.number();
  }
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case Value::Kind::null: return true;
    case Value::Kind::boolean: return a.as_bool() == b.as_bool();
    case Value::Kind::string: return a.as_string() == b.as_string();
    case Value::Kind::list: return a.as_list() == b.as_list();
    case Value::Kind::map: return a.as_map() == b.as_map();
    default: return false;
  }
}

auto kind_name(Value::Kind k) -> std::string_view {
  switch (k) {
    case Value::Kind::null: return "null";
    case Value::Kind::boolean: return "bool";
    case Value::Kind::integer: return "int";
    case Value::Kind::real: return "float";
    case Value::Kind::string: return "string";
    case Value::Kind::list: return "list";
    case Value::Kind::map: return "map";
  }
  return "unknown";
}

auto from_json(const nlohmann::json& j) -> Value {
  switch (j.type()) {
    case nlohmann::json::value_t::boolean: return Value(j.get<bool>());
    case nlohmann::json::value_t::number_integer: return Value(j.get<std::int64_t>());
    case nlohmann::json::value_t::number_unsigned: {
      const auto u = j.get<std::uint64_t>();
      if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Value(static_cast<std::int64_t>(u));
      }
      return Value(static_cast<double>(u));
    }
    case nlohmann::json::value_t::number_float: return Value(j.get<double>());
    case nlohmann::json::value_t::string: return Value(j.get<std::string>());
    case nlohmann::json::value_t::array: {
      Value::List l;
      l.reserve(j.size());
      for (const auto& e : j) l.push_back(from_json(e));
      return Value(std::move(l));
    }
    case nlohmann::json::value_t::object: {
      Value::Map m;
      for (auto it = j.begin(); it != j.end(); ++it) m.emplace(it.key(), from_json(it.value()));
      return Value(std::move(m));
    }
    default: return Value();  // null, binary, discarded
  }
}

auto to_json(const Value& v) -> nlohmann::json {
  switch (v.kind()) {
    case Value::Kind::null: return nullptr;
    case Value::Kind::boolean: return v.as_bool();
    case Value::Kind::integer: return v.as_int();
    case Value::Kind::real: return v.as_double();
    case Value::Kind::string: return v.as_string();
    case Value::Kind::list: {
      auto arr = nlohmann::json::array();
      for (const auto& e : v.as_list()) arr.push_back(to_json(e));
      return arr;
    }
    case Value::Kind::map: {
      auto obj = nlohmann::json::object();
      for (const auto& [k, e] : v.as_map()) obj[k] = to_json(e);
      return obj;
    }
  }
  return nullptr;
}

} // namespace cdl
