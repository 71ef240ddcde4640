#include "taskweave/cli/commands.hpp"
#include "taskweave/graph/repair.hpp"
#include "taskweave/storage/json_format.hpp"
#include "taskweave/util/log.hpp"

#include <print>

namespace taskweave::cli {

namespace {

auto print_mutation(const Mutation& m) -> void {
  if (m.dependency) {
    std::println("✓ {} {} -> {}", mutation_kind_name(m.kind), m.subject,
                 *m.dependency);
  } else {
    std::println("✓ {} {}", mutation_kind_name(m.kind), m.subject);
  }
}

}  // namespace

auto cmd_fix(const Context& ctx, const FixOptions& opts) -> int {
  auto doc = load_tasks(ctx);
  if (!doc) {
    return 1;
  }

  auto result = RepairEngine::validate_and_fix_dependencies(doc->graph);

  if (result.changed() && !opts.dry_run) {
    if (auto r = TaskFile::save_to_file(*doc, ctx.config.tasks_file); !r) {
      std::println(stderr, "Error: Failed to save {}: {}",
                   ctx.config.tasks_file, r.error().message());
      return 1;
    }
  }

  if (opts.json) {
    nlohmann::json out = result;
    out["dry_run"] = opts.dry_run;
    std::println("{}", out.dump(2));
    return 0;
  }

  for (const auto& m : result.report.mutations) {
    print_mutation(m);
  }
  for (const auto& issue : result.residual) {
    std::println("! [{}] {}", issue_kind_name(issue.kind), issue.reason);
  }

  if (!result.changed()) {
    std::println("No dependency issues found that can be fixed automatically");
  } else if (opts.dry_run) {
    std::println("\n{} fixes found (dry run, nothing written)",
                 result.report.mutations.size());
  } else {
    std::println("\n{} fixes written to {}", result.report.mutations.size(),
                 ctx.config.tasks_file);
  }

  if (!result.residual.empty()) {
    log::warn("{} issues need manual attention", result.residual.size());
  }
  return 0;
}

}  // namespace taskweave::cli
