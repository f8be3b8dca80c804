#include <benchmark/benchmark.h>
#include <cdl/evaluator.hpp>
#include <cdl/parser.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

using namespace cdl;

static Constraint parse_or_die(const char* text){
  auto c = Parser{}.parse_text(text);
  if (!c) throw std::runtime_error(c.error().message);
  return *c;
}

static void BenchParse_Composite(benchmark::State& state){
  const std::string text = R"({"logic":"and","constraints":[
    {"field":"amount","operator":"lt","value":5000},
    {"field":"category","operator":"ne","value":"blocked"},
    {"field":"amount","operator":"sum_le","value":10000,"window":"24h","group_by":"user"}]})";
  const Parser parser;
  for (auto _ : state) { benchmark::DoNotOptimize(parser.parse_text(text)); }
}
BENCHMARK(BenchParse_Composite);

static void BenchEvaluate_Comparison(benchmark::State& state){
  const auto c = parse_or_die(R"({"field":"user.age","operator":"ge","value":18})");
  const Value record = Value::Map{{"user", Value::Map{{"age", 30}}}};
  Evaluator evaluator;
  for (auto _ : state) { benchmark::DoNotOptimize(evaluator.evaluate(c, record)); }
}
BENCHMARK(BenchEvaluate_Comparison);

static void BenchEvaluate_Regex(benchmark::State& state){
  const auto c = parse_or_die(R"({"field":"ref","operator":"matches","value":"^INV-[0-9]{6}$"})");
  const Value record = Value::Map{{"ref", "INV-123456"}};
  Evaluator evaluator;
  for (auto _ : state) { benchmark::DoNotOptimize(evaluator.evaluate(c, record)); }
}
BENCHMARK(BenchEvaluate_Regex);

// Window holds state.range(0) prior observations; the clock does not move.
static void BenchEvaluate_WindowedSum(benchmark::State& state){
  auto clock = std::make_shared<ManualClock>(std::chrono::milliseconds{1'700'000'000'000});
  const auto c = parse_or_die(R"({"field":"amount","operator":"sum_lt","value":1e12,"window":"1h","group_by":"user"})");
  const Value record = Value::Map{{"user", "u1"}, {"amount", 10}};
  for (auto _ : state) {
    state.PauseTiming();
    Evaluator evaluator(clock);
    for (std::int64_t i = 0; i < state.range(0); ++i) (void)evaluator.evaluate(c, record);
    state.ResumeTiming();
    benchmark::DoNotOptimize(evaluator.evaluate(c, record));
  }
}
BENCHMARK(BenchEvaluate_WindowedSum)->Arg(16)->Arg(256)->Arg(4096);

static void BenchEvaluate_WideComposite(benchmark::State& state){
  std::string text = R"({"logic":"or","constraints":[)";
  for (std::int64_t i = 0; i < state.range(0); ++i) {
    if (i) text += ",";
    text += R"({"field":"f)" + std::to_string(i) + R"(","operator":"exists"})";
  }
  text += "]}";
  const auto c = parse_or_die(text.c_str());
  const Value record = Value::Map{{"f0", 1}};
  Evaluator evaluator;
  for (auto _ : state) { benchmark::DoNotOptimize(evaluator.evaluate(c, record)); }
}
BENCHMARK(BenchEvaluate_WideComposite)->Arg(8)->Arg(64)->Arg(1000);

BENCHMARK_MAIN();
