#include "typeguesser.h"

#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <vector>

using namespace typeguesser;

// Deterministic column of formatted values for a given kind
static std::vector<std::string> make_column(const std::string& kind, size_t rows) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist(0, 999999);
  std::vector<std::string> column;
  column.reserve(rows);
  for (size_t i = 0; i < rows; ++i) {
    int v = dist(rng);
    if (kind == "int") {
      column.push_back(std::to_string(v));
    } else if (kind == "decimal") {
      column.push_back(std::to_string(v / 100) + "." + std::to_string(v % 100));
    } else if (kind == "date") {
      column.push_back("2024-" + std::to_string(1 + v % 12) + "-" + std::to_string(1 + v % 28));
    } else if (kind == "bool") {
      column.push_back(v % 2 ? "true" : "false");
    } else {
      column.push_back("value_" + std::to_string(v));
    }
  }
  return column;
}

static void BM_GuessStrings(benchmark::State& state, const std::string& kind) {
  auto rows = static_cast<size_t>(state.range(0));
  std::vector<std::string> column = make_column(kind, rows);
  size_t bytes = 0;
  for (const auto& s : column)
    bytes += s.size();

  Guesser guesser;
  for (auto _ : state) {
    guesser.reset();
    guesser.adjust_to_compensate_for_values(column);
    auto request = guesser.guess();
    benchmark::DoNotOptimize(request);
  }

  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.SetItemsProcessed(static_cast<int64_t>(rows * state.iterations()));
}

static void BM_GuessIntegerStrings(benchmark::State& state) {
  BM_GuessStrings(state, "int");
}
BENCHMARK(BM_GuessIntegerStrings)->Arg(1000)->Arg(100000);

static void BM_GuessDecimalStrings(benchmark::State& state) {
  BM_GuessStrings(state, "decimal");
}
BENCHMARK(BM_GuessDecimalStrings)->Arg(1000)->Arg(100000);

static void BM_GuessDateStrings(benchmark::State& state) {
  BM_GuessStrings(state, "date");
}
BENCHMARK(BM_GuessDateStrings)->Arg(1000)->Arg(100000);

static void BM_GuessBooleanStrings(benchmark::State& state) {
  BM_GuessStrings(state, "bool");
}
BENCHMARK(BM_GuessBooleanStrings)->Arg(1000)->Arg(100000);

// Every value falls through to the String decider
static void BM_GuessFreeText(benchmark::State& state) {
  BM_GuessStrings(state, "text");
}
BENCHMARK(BM_GuessFreeText)->Arg(1000)->Arg(100000);

static void BM_GuessTypedIntegers(benchmark::State& state) {
  auto rows = static_cast<size_t>(state.range(0));
  std::vector<int64_t> column(rows);
  for (size_t i = 0; i < rows; ++i)
    column[i] = static_cast<int64_t>(i * 2654435761u) - 1000000;

  Guesser guesser;
  for (auto _ : state) {
    guesser.reset();
    guesser.adjust_to_compensate_for_values(column);
    auto request = guesser.guess();
    benchmark::DoNotOptimize(request);
  }
  state.SetItemsProcessed(static_cast<int64_t>(rows * state.iterations()));
}
BENCHMARK(BM_GuessTypedIntegers)->Arg(1000)->Arg(100000);

static void BM_BulkIntegers(benchmark::State& state) {
  auto rows = static_cast<size_t>(state.range(0));
  std::vector<int64_t> column(rows);
  for (size_t i = 0; i < rows; ++i)
    column[i] = static_cast<int64_t>(i * 2654435761u) - 1000000;

  for (auto _ : state) {
    auto request = guess_integers(column);
    benchmark::DoNotOptimize(request);
  }
  state.SetItemsProcessed(static_cast<int64_t>(rows * state.iterations()));
}
BENCHMARK(BM_BulkIntegers)->Arg(1000)->Arg(100000);

// One pool shared by every benchmark thread
static void BM_PoolCheckout(benchmark::State& state) {
  static GuesserPool pool(8);
  for (auto _ : state) {
    PooledGuesser guesser = pool.acquire();
    guesser->adjust_to_compensate_for_value("12.5");
    auto request = guesser->guess();
    benchmark::DoNotOptimize(request);
  }
}
BENCHMARK(BM_PoolCheckout)->ThreadRange(1, 8);
