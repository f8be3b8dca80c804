#include <catch2/catch_test_macros.hpp>

#include <string>

#include "cdl/operators.hpp"

using namespace cdl;

namespace {

bool ok(Operator op, const Value& a, const Value& b) {
  auto r = apply_comparison(op, a, b);
  REQUIRE(r.has_value());
  return *r;
}

std::string err(Operator op, const Value& a, const Value& b) {
  auto r = apply_comparison(op, a, b);
  REQUIRE_FALSE(r.has_value());
  return r.error();
}

Value list(Value::List l) { return Value(std::move(l)); }

} // namespace

TEST_CASE("equality operators", "[operators]") {
  REQUIRE(ok(Operator::eq, 5, 5.0));
  REQUIRE(ok(Operator::eq, "a", "a"));
  REQUIRE_FALSE(ok(Operator::eq, "5", 5));
  REQUIRE(ok(Operator::eq, Value(), Value()));
  REQUIRE(ok(Operator::ne, "blocked", "allowed"));
  REQUIRE_FALSE(ok(Operator::ne, true, true));
}

TEST_CASE("ordering operators", "[operators]") {
  REQUIRE(ok(Operator::lt, 500, 1000));
  REQUIRE_FALSE(ok(Operator::lt, 1500, 1000));
  REQUIRE(ok(Operator::le, 1000, 1000.0));
  REQUIRE(ok(Operator::gt, 2.5, 2));
  REQUIRE(ok(Operator::ge, "banana", "apple"));
  REQUIRE(ok(Operator::lt, list({1, 2}), list({1, 3})));
  REQUIRE(ok(Operator::lt, list({1}), list({1, 0})));

  REQUIRE(err(Operator::lt, Value(), 5).find("not supported between null and int") != std::string::npos);
  REQUIRE(err(Operator::gt, "10", 5).find("string and int") != std::string::npos);
}

TEST_CASE("contains and matches", "[operators]") {
  REQUIRE(ok(Operator::contains, "hello world", "world"));
  REQUIRE_FALSE(ok(Operator::contains, "hello", "bye"));
  REQUIRE(ok(Operator::contains, list({"a", "b"}), "b"));
  REQUIRE(ok(Operator::contains, 12345, "234"));
  REQUIRE_FALSE(ok(Operator::contains, Value(), "x"));
  REQUIRE(err(Operator::contains, "abc", 1).find("string operand") != std::string::npos);

  REQUIRE(ok(Operator::matches, "order-123", "\\d+$"));
  REQUIRE_FALSE(ok(Operator::matches, "order-abc", "^\\d+$"));
  REQUIRE(err(Operator::matches, "abc", "(").find("invalid regular expression") != std::string::npos);
}

TEST_CASE("membership operators", "[operators]") {
  REQUIRE(ok(Operator::in, "b", list({"a", "b"})));
  REQUIRE_FALSE(ok(Operator::in, 3, list({1, 2})));
  REQUIRE(ok(Operator::in, 2.0, list({1, 2})));
  REQUIRE(ok(Operator::in, "ell", "hello"));
  REQUIRE(ok(Operator::in, "k", Value(Value::Map{{"k", 1}})));
  REQUIRE(err(Operator::in, 1, "hello").find("string left operand") != std::string::npos);
  REQUIRE(err(Operator::in, 5, 7).find("not iterable") != std::string::npos);

  REQUIRE(ok(Operator::not_in, "c", list({"a", "b"})));
  REQUIRE_FALSE(ok(Operator::not_in, "a", list({"a", "b"})));
  REQUIRE(err(Operator::not_in, 5, Value()).find("not iterable") != std::string::npos);
}

TEST_CASE("exists and empty", "[operators]") {
  REQUIRE_FALSE(ok(Operator::exists, Value(), Value()));
  REQUIRE(ok(Operator::exists, 0, Value()));
  REQUIRE(ok(Operator::empty, Value(), Value()));
  REQUIRE(ok(Operator::empty, "", Value()));
  REQUIRE(ok(Operator::empty, list({}), Value()));
  REQUIRE(ok(Operator::empty, Value(Value::Map{}), Value()));
  REQUIRE_FALSE(ok(Operator::empty, 0, Value()));
  REQUIRE_FALSE(ok(Operator::empty, " ", Value()));
}

TEST_CASE("non-comparison operators are refused", "[operators]") {
  REQUIRE(err(Operator::sum_lt, 1, 2).find("not a comparison") != std::string::npos);
}

TEST_CASE("matches bounds the subject length", "[operators][regex]") {
  const std::string at_limit(kDefaultMaxMatchSubject, 'a');
  REQUIRE(ok(Operator::matches, at_limit, "^(a|b)*$"));

  const std::string huge(200000, 'a');
  const auto message = err(Operator::matches, huge, "^(a|b)*$");
  REQUIRE(message.find("exceeds limit of 2048") != std::string::npos);

  auto tight = apply_comparison(Operator::matches, "abcdef", "b", 3);
  REQUIRE_FALSE(tight.has_value());
  auto roomy = apply_comparison(Operator::matches, "abcdef", "b", 6);
  REQUIRE(roomy.has_value());
  REQUIRE(*roomy);
}

TEST_CASE("bool is not a number", "[operators]") {
  REQUIRE_FALSE(ok(Operator::eq, true, 1));
  REQUIRE_FALSE(ok(Operator::eq, false, 0));
  REQUIRE(err(Operator::lt, true, 2) == "ordering not supported between bool and int");
}
