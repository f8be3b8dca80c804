#pragma once

/** \file value.hpp
 *  \brief Dynamic value carried by constraint literals and input records.
 *
 * A closed tagged union (null, bool, int64, double, string, list, map).
 * Records are maps addressed with dot-paths ("user.address.country").
 * Ownership: value-semantic; copies are deep.
 */

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "cdl/error.hpp"

namespace cdl {

class Value {
public:
  using List = std::vector<Value>;
  using Map = std::map<std::string, Value, std::less<>>;

  enum class Kind : std::uint8_t { null, boolean, integer, real, string, list, map };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T i) : data_(static_cast<std::int64_t>(i)) {}
  Value(double d) : data_(d) {}
  Value(const char* s) : data_(std::string(s)) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(List l) : data_(std::move(l)) {}
  Value(Map m) : data_(std::move(m)) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(data_.index()); }

  [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::null; }
  [[nodiscard]] bool is_bool() const noexcept { return kind() == Kind::boolean; }
  [[nodiscard]] bool is_number() const noexcept {
    return kind() == Kind::integer || kind() == Kind::real;
  }
  [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::string; }
  [[nodiscard]] bool is_list() const noexcept { return kind() == Kind::list; }
  [[nodiscard]] bool is_map() const noexcept { return kind() == Kind::map; }

  // Checked accessors; callers test the kind first.
  [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(data_); }
  [[nodiscard]] auto as_int() const -> std::int64_t { return std::get<std::int64_t>(data_); }
  [[nodiscard]] auto as_double() const -> double { return std::get<double>(data_); }
  [[nodiscard]] auto as_string() const -> const std::string& { return std::get<std::string>(data_); }
  [[nodiscard]] auto as_list() const -> const List& { return std::get<List>(data_); }
  [[nodiscard]] auto as_map() const -> const Map& { return std::get<Map>(data_); }

  /** \brief Numeric view of int/double values; nullopt for every other kind. */
  [[nodiscard]] auto number() const noexcept -> std::optional<double>;

  /** \brief Numeric view that also accepts decimal strings (" 12.5 "). */
  [[nodiscard]] auto coerce_number() const -> std::optional<double>;

  /** \brief null, false, 0, 0.0, "", [] and {} are falsy. */
  [[nodiscard]] auto truthy() const noexcept -> bool;

  /** \brief Resolve a dot-path through nested maps; nullptr when any hop is missing. */
  [[nodiscard]] auto lookup(std::string_view dot_path) const -> const Value*;

  /** \brief Text used in ids, messages and group keys.
   *
   * Strings render raw, integers in decimal, doubles as the shortest
   * round-trip decimal (integral doubles keep a trailing ".0"), booleans as
   * true/false, null as "null", containers as compact JSON. Invalid UTF-8
   * inside containers is rendered as U+FFFD.
   */
  [[nodiscard]] auto to_display_string() const -> std::string;

  /** \brief Parse JSON text into a Value. */
  static auto parse(std::string_view json_text) -> std::expected<Value, core::error>;

  /** \brief Structural equality; int and double compare by numeric value.
   *
   * bool is its own kind: true != 1 and false != 0. Ordering (order_values)
   * likewise rejects bool against numbers.
   */
  friend bool operator==(const Value& a, const Value& b);

private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string, List, Map> data_;
};

/** \brief Name of a value kind for diagnostics ("int", "string", ...). */
auto kind_name(Value::Kind k) -> std::string_view;

auto from_json(const nlohmann::json& j) -> Value;
auto to_json(const Value& v) -> nlohmann::json;

} // namespace cdl
