/** \file value_test.cpp
 *  \brief Unit tests for the dynamic Value type.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdint>
#include <limits>
#include <string>

#include "cdl/value.hpp"

using cdl::Value;
using Catch::Matchers::WithinAbs;

TEST_CASE("Value kinds and accessors", "[value]") {
  REQUIRE(Value().is_null());
  REQUIRE(Value(nullptr).is_null());
  REQUIRE(Value(true).is_bool());
  REQUIRE(Value(42).kind() == Value::Kind::integer);
  REQUIRE(Value(std::int64_t{7}).as_int() == 7);
  REQUIRE(Value(2.5).kind() == Value::Kind::real);
  REQUIRE(Value("abc").is_string());
  REQUIRE(Value(Value::List{1, "a"}).as_list().size() == 2);
  REQUIRE(Value(Value::Map{{"k", 1}}).as_map().count("k") == 1);
}

TEST_CASE("Value dot-path lookup", "[value]") {
  auto v = Value::parse(R"({"user": {"address": {"country": "NZ"}, "age": 30}, "tags": ["a"]})");
  REQUIRE(v.has_value());

  const Value* country = v->lookup("user.address.country");
  REQUIRE(country != nullptr);
  REQUIRE(country->as_string() == "NZ");
  REQUIRE(v->lookup("user.age")->as_int() == 30);

  REQUIRE(v->lookup("user.missing") == nullptr);
  REQUIRE(v->lookup("user.age.deeper") == nullptr);
  REQUIRE(v->lookup("tags.0") == nullptr);
  REQUIRE(Value(5).lookup("anything") == nullptr);
}

TEST_CASE("Value truthiness", "[value]") {
  REQUIRE_FALSE(Value().truthy());
  REQUIRE_FALSE(Value(false).truthy());
  REQUIRE_FALSE(Value(0).truthy());
  REQUIRE_FALSE(Value(0.0).truthy());
  REQUIRE_FALSE(Value("").truthy());
  REQUIRE_FALSE(Value(Value::List{}).truthy());
  REQUIRE_FALSE(Value(Value::Map{}).truthy());
  REQUIRE(Value("x").truthy());
  REQUIRE(Value(-1).truthy());
  REQUIRE(Value(Value::List{Value()}).truthy());
}

TEST_CASE("Value display strings", "[value]") {
  REQUIRE(Value().to_display_string() == "null");
  REQUIRE(Value(true).to_display_string() == "true");
  REQUIRE(Value(5).to_display_string() == "5");
  REQUIRE(Value(5.0).to_display_string() == "5.0");
  REQUIRE(Value(1.5).to_display_string() == "1.5");
  REQUIRE(Value("blocked").to_display_string() == "blocked");
  REQUIRE(Value(Value::List{1, "a"}).to_display_string() == R"([1,"a"])");
}

TEST_CASE("Value display strings tolerate invalid UTF-8", "[value]") {
  const Value tags(Value::List{"caf\xE9"});
  std::string shown;
  REQUIRE_NOTHROW(shown = tags.to_display_string());
  REQUIRE(shown == "[\"caf\xEF\xBF\xBD\"]");

  const Value nested(Value::Map{{"who", Value::List{"\xFF\xFE"}}});
  REQUIRE_NOTHROW((void)nested.to_display_string());

  // raw strings are shown as-is
  REQUIRE(Value("caf\xE9").to_display_string() == "caf\xE9");
}

TEST_CASE("Value equality", "[value]") {
  REQUIRE(Value(1) == Value(1.0));
  REQUIRE_FALSE(Value(true) == Value(1));
  REQUIRE_FALSE(Value("1") == Value(1));
  REQUIRE(Value() == Value(nullptr));
  REQUIRE(Value(Value::List{1, 2}) == Value(Value::List{1.0, 2}));
  REQUIRE_FALSE(Value(Value::Map{{"a", 1}}) == Value(Value::Map{{"a", 2}}));
}

TEST_CASE("Value numeric coercion", "[value]") {
  REQUIRE(Value(3).number() == 3.0);
  REQUIRE_FALSE(Value("3").number().has_value());
  REQUIRE_THAT(*Value(" 12.5 ").coerce_number(), WithinAbs(12.5, 1e-12));
  REQUIRE_THAT(*Value("+4").coerce_number(), WithinAbs(4.0, 1e-12));
  REQUIRE_FALSE(Value("abc").coerce_number().has_value());
  REQUIRE_FALSE(Value("").coerce_number().has_value());
  REQUIRE_FALSE(Value(true).coerce_number().has_value());
}

TEST_CASE("Value JSON conversion", "[value]") {
  const auto j = nlohmann::json::parse(R"({"a": [1, 2.5, "x", null, true], "b": {}})");
  const Value v = cdl::from_json(j);
  REQUIRE(v.is_map());
  const auto& a = v.lookup("a")->as_list();
  REQUIRE(a[0].kind() == Value::Kind::integer);
  REQUIRE(a[1].kind() == Value::Kind::real);
  REQUIRE(a[3].is_null());
  REQUIRE(cdl::to_json(v) == j);

  const nlohmann::json big = std::numeric_limits<std::uint64_t>::max();
  REQUIRE(cdl::from_json(big).kind() == Value::Kind::real);

  auto bad = Value::parse("{not json");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == cdl::core::error_code::parse_error);
}
