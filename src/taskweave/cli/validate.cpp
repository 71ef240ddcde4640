#include "taskweave/cli/commands.hpp"
#include "taskweave/graph/validator.hpp"
#include "taskweave/storage/json_format.hpp"

#include <print>

namespace taskweave::cli {

auto cmd_validate(const Context& ctx, const ValidateOptions& opts) -> int {
  auto doc = load_tasks(ctx);
  if (!doc) {
    return 1;
  }

  auto issues = GraphValidator::validate(doc->graph);
  auto summary = GraphValidator::summarize(doc->graph);

  if (opts.json) {
    nlohmann::json out{
        {"valid", issues.empty()},
        {"summary", summary},
        {"issues", issues},
    };
    std::println("{}", out.dump(2));
    return issues.empty() ? 0 : 1;
  }

  std::println("Validating dependencies in {}...\n", ctx.config.tasks_file);

  for (const auto& issue : issues) {
    std::println("✗ [{}] {}", issue_kind_name(issue.kind), issue.reason);
  }
  if (issues.empty()) {
    std::println("✓ All dependencies are valid");
  }

  std::println(
      "\nSummary: {} tasks, {} subtasks, {} dependencies checked, {} issues",
      summary.tasks, summary.subtasks, summary.dependencies, issues.size());

  return issues.empty() ? 0 : 1;
}

}  // namespace taskweave::cli
