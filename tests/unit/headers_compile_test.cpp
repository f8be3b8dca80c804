#include <cdl/cdl.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  cdl::HaltLimits limits{};
  REQUIRE(limits.max_depth == 100);
  REQUIRE(limits.max_children == 1000);
  REQUIRE(limits.max_window_seconds == 31536000);
  cdl::EvaluatorConfig config{};
  REQUIRE(config.default_prune_age_seconds == cdl::kSecondsPerWeek);
}
