/** \file verify_test.cpp
 *  \brief One-call verification helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <vector>

#include "cdl/parser.hpp"
#include "cdl/verify.hpp"

using namespace cdl;

namespace {

ConstraintSource src(const char* json_text) { return nlohmann::json::parse(json_text); }

Value rec(const char* json_text) {
  auto v = Value::parse(json_text);
  REQUIRE(v.has_value());
  return *v;
}

const char* kAmountLt = R"({"field": "amount", "operator": "lt", "value": 1000})";
const char* kBlocked = R"({"field": "category", "operator": "ne", "value": "blocked"})";

} // namespace

TEST_CASE("verify accepts definitions and built constraints", "[verify]") {
  auto clock = std::make_shared<ManualClock>(std::chrono::milliseconds{42});

  auto from_json = verify(src(kAmountLt), rec(R"({"amount": 5})"), clock);
  REQUIRE(from_json.has_value());
  REQUIRE(from_json->passed);
  REQUIRE(from_json->timestamp == 42);

  auto built = Parser{}.parse_text(kAmountLt);
  REQUIRE(built.has_value());
  auto from_built = verify(*built, rec(R"({"amount": 5000})"), clock);
  REQUIRE(from_built.has_value());
  REQUIRE_FALSE(from_built->passed);
  REQUIRE(from_built->constraint_id == from_json->constraint_id);
}

TEST_CASE("verify surfaces parse errors", "[verify][error]") {
  auto bad = verify(src(R"({"field": "amount", "operator": "nope"})"), Value::Map{});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::parse_error);

  auto unbounded = verify(src(R"({"field": "amount", "operator": "sum_lt", "value": 1})"), Value::Map{});
  REQUIRE_FALSE(unbounded.has_value());
  REQUIRE(unbounded.error().code == core::error_code::non_terminating);

  auto all = verify_all({src(kAmountLt), src(R"({"logic": "and"})")}, Value::Map{});
  REQUIRE_FALSE(all.has_value());
}

TEST_CASE("verify_all keeps input order", "[verify]") {
  auto results = verify_all({src(kAmountLt), src(kBlocked)}, rec(R"({"amount": 5000, "category": "ok"})"));
  REQUIRE(results.has_value());
  REQUIRE(results->size() == 2);
  REQUIRE_FALSE((*results)[0].passed);
  REQUIRE((*results)[1].passed);
}

TEST_CASE("each call starts from empty aggregation state", "[verify]") {
  const char* limit = R"({"field": "amount", "operator": "count_lt", "value": 2, "window": "1h"})";
  const auto r = rec(R"({"amount": 1})");
  for (int i = 0; i < 3; ++i) {
    auto result = verify(src(limit), r);
    REQUIRE(result.has_value());
    REQUIRE(result->passed);
  }
}

TEST_CASE("verify_and combines ids and messages", "[verify]") {
  auto clock = std::make_shared<ManualClock>(std::chrono::milliseconds{1000});
  const auto first = Parser{}.parse_text(kAmountLt)->id();
  const auto second = Parser{}.parse_text(kBlocked)->id();

  auto ok = verify_and({src(kAmountLt), src(kBlocked)}, rec(R"({"amount": 5, "category": "ok"})"), clock);
  REQUIRE(ok.has_value());
  REQUIRE(ok->passed);
  REQUIRE_FALSE(ok->message.has_value());
  REQUIRE(ok->constraint_id == "AND_" + first.substr(0, 4) + "_" + second.substr(0, 4));
  REQUIRE(ok->timestamp == 1000);

  auto bad = verify_and({src(kAmountLt), src(kBlocked)}, rec(R"({"amount": 5000, "category": "blocked"})"), clock);
  REQUIRE(bad.has_value());
  REQUIRE_FALSE(bad->passed);
  REQUIRE(bad->message == "amount lt 1000 failed (actual: 5000); category ne blocked failed (actual: blocked)");

  auto empty = verify_and({}, Value::Map{}, clock);
  REQUIRE(empty.has_value());
  REQUIRE(empty->passed);
  REQUIRE(empty->constraint_id == "AND_");
}

TEST_CASE("verify_or", "[verify]") {
  auto one = verify_or({src(kAmountLt), src(kBlocked)}, rec(R"({"amount": 5000, "category": "ok"})"));
  REQUIRE(one.has_value());
  REQUIRE(one->passed);
  REQUIRE(one->constraint_id.rfind("OR_", 0) == 0);

  auto none = verify_or({src(kAmountLt), src(kBlocked)}, rec(R"({"amount": 5000, "category": "blocked"})"));
  REQUIRE(none.has_value());
  REQUIRE_FALSE(none->passed);
  REQUIRE(none->message == "All constraints failed");

  auto empty = verify_or({}, Value::Map{});
  REQUIRE(empty.has_value());
  REQUIRE_FALSE(empty->passed);
}
