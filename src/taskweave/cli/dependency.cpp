#include "taskweave/cli/commands.hpp"
#include "taskweave/graph/identity.hpp"
#include "taskweave/graph/repair.hpp"

#include <print>
#include <string_view>

namespace taskweave::cli {

namespace {

// Shared by add-dep and remove-dep: load, mutate, and write back only when
// the graph actually changed.
template <typename Mutate>
[[nodiscard]] auto edit_dependency(const Context& ctx,
                                   const DependencyOptions& opts,
                                   Mutate&& mutate, std::string_view done)
    -> int {
  if (opts.id.empty() || opts.depends_on.empty()) {
    std::println(stderr, "Error: --id and --depends-on are required");
    return 1;
  }

  auto doc = load_tasks(ctx);
  if (!doc) {
    return 1;
  }

  auto subject = identity::normalize(opts.id);
  auto dependency = identity::normalize(opts.depends_on);

  auto stored = mutate(doc->graph, subject, dependency);
  if (!stored) {
    if (is_notice(stored.error())) {
      std::println("{}: {} -> {}", stored.error().message(), subject,
                   dependency);
      return 0;
    }
    std::println(stderr, "Error: {} -> {}: {}", subject, dependency,
                 stored.error().message());
    return 1;
  }

  if (auto r = TaskFile::save_to_file(*doc, ctx.config.tasks_file); !r) {
    std::println(stderr, "Error: Failed to save {}: {}", ctx.config.tasks_file,
                 r.error().message());
    return 1;
  }

  std::println("✓ {} dependency: {} -> {}", done, subject, *stored);
  return 0;
}

}  // namespace

auto cmd_add_dep(const Context& ctx, const DependencyOptions& opts) -> int {
  RepairEngine engine(ctx.config.repair);
  return edit_dependency(
      ctx, opts,
      [&](TaskGraph& graph, const TaskRef& subject, const TaskRef& dep) {
        return engine.add_dependency(graph, subject, dep);
      },
      "Added");
}

auto cmd_remove_dep(const Context& ctx, const DependencyOptions& opts) -> int {
  return edit_dependency(
      ctx, opts,
      [](TaskGraph& graph, const TaskRef& subject, const TaskRef& dep) {
        return RepairEngine::remove_dependency(graph, subject, dep);
      },
      "Removed");
}

}  // namespace taskweave::cli
