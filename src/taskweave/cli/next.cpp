#include "taskweave/cli/commands.hpp"
#include "taskweave/graph/selector.hpp"
#include "taskweave/storage/json_format.hpp"
#include "taskweave/util/log.hpp"

#include <print>
#include <string>
#include <vector>

namespace taskweave::cli {

namespace {

[[nodiscard]] auto join_refs(const std::vector<TaskRef>& refs) -> std::string {
  std::string out;
  for (const auto& ref : refs) {
    if (!out.empty()) out += ", ";
    out += ref.str();
  }
  return out;
}

}  // namespace

auto cmd_next(const Context& ctx, const NextOptions& opts) -> int {
  int concurrency = ctx.config.selection.default_concurrency;
  if (opts.concurrency) {
    auto parsed = parse_concurrency(*opts.concurrency);
    if (!parsed) {
      std::println(stderr, "Error: Invalid concurrency '{}': {}",
                   *opts.concurrency, parsed.error().message());
      return 1;
    }
    concurrency = *parsed;
  }

  auto doc = load_tasks(ctx);
  if (!doc) {
    return 1;
  }
  const auto& graph = doc->graph;

  ConcurrentSelector selector(ctx.config.selection.options);
  auto selection = selector.select_next(graph, concurrency);
  if (!selection) {
    std::println(stderr, "Error: {}", selection.error().message());
    return 1;
  }

  if (selection->clamped()) {
    log::warn("Concurrency {} exceeds the maximum, using {}",
              selection->requested, selection->effective);
  }

  if (opts.json) {
    nlohmann::json out = *selection;
    for (std::size_t i = 0; i < selection->tasks.size(); ++i) {
      out["tasks"][i]["title"] = graph.node(selection->tasks[i].node).title;
    }
    std::println("{}", out.dump(2));
    return 0;
  }

  if (selection->tasks.empty()) {
    std::println("No ready tasks. All pending work is blocked or done.");
    return 0;
  }

  std::println("Next {} of {} requested:", selection->tasks.size(),
               selection->effective);
  for (const auto& c : selection->tasks) {
    const auto& node = graph.node(c.node);
    std::println("  {} [{}] {}", c.ref, priority_name(c.priority), node.title);
    if (!c.dependencies.empty()) {
      std::println("      depends on: {}", join_refs(c.dependencies));
    }
  }
  return 0;
}

}  // namespace taskweave::cli
