#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/selector.hpp"
#include "taskweave/graph/validator.hpp"

#include <benchmark/benchmark.h>

#include "test_utils.hpp"

#include <string>

using namespace taskweave;

namespace {
// Tasks with a few backward edges each and three subtasks per tenth task.
[[nodiscard]] auto make_graph(int num_tasks) -> TaskGraph {
  TaskGraph graph;
  for (int i = 1; i <= num_tasks; ++i) {
    auto status = i <= num_tasks / 3 ? Status::Done : Status::Pending;
    auto idx = graph.add_task(std::to_string(i), status,
                              static_cast<Priority>(i % 4))
                   .value();
    for (int d = 1; d <= 3 && i - d * 7 > 0; ++d) {
      graph.node(idx).dependencies.push_back(
          identity::normalize(std::to_string(i - d * 7)));
    }
    if (i % 10 == 0) {
      graph.node(idx).status = Status::InProgress;
      for (int s = 1; s <= 3; ++s) {
        auto sub = graph.add_subtask(idx, std::to_string(s)).value();
        if (s > 1) {
          graph.node(sub).dependencies.push_back(
              identity::normalize(std::to_string(i), std::to_string(s - 1)));
        }
      }
    }
  }
  return graph;
}
}

static void BM_Validate(benchmark::State& state) {
  const int num_tasks = state.range(0);
  auto graph = make_graph(num_tasks);

  for (auto _ : state) {
    benchmark::DoNotOptimize(GraphValidator::validate(graph));
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_ValidateAndFix(benchmark::State& state) {
  const int num_tasks = state.range(0);
  log::set_level(log::Level::Off);

  for (auto _ : state) {
    state.PauseTiming();
    auto graph = make_graph(num_tasks);
    taskweave::test::depends(graph, "5", {"5", "999999", "1", "1"});
    state.ResumeTiming();
    benchmark::DoNotOptimize(RepairEngine::validate_and_fix_dependencies(graph));
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_SelectNext(benchmark::State& state) {
  const int num_tasks = state.range(0);
  const int concurrency = state.range(1);
  auto graph = make_graph(num_tasks);
  ConcurrentSelector selector;

  for (auto _ : state) {
    benchmark::DoNotOptimize(selector.select_next(graph, concurrency));
  }

  state.SetItemsProcessed(num_tasks * state.iterations());
}

static void BM_Normalize(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(identity::normalize(" 012.0034 "));
  }
}

BENCHMARK(BM_Validate)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_ValidateAndFix)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_SelectNext)->Args({100, 1})->Args({100, 10})->Args({1000, 10});
BENCHMARK(BM_Normalize);
