#include "taskweave/cli/commands.hpp"

#include <print>

namespace taskweave::cli {

auto load_tasks(const Context& ctx) -> std::optional<TaskDocument> {
  const auto& config = ctx.config;
  auto result = TaskFile::load_from_file(
      config.tasks_file, {.default_priority = config.graph.default_priority,
                          .tag = config.tag});
  if (!result) {
    std::println(stderr, "Error: Failed to load {}: {}", config.tasks_file,
                 result.error().message());
    return std::nullopt;
  }
  return std::move(*result);
}

}  // namespace taskweave::cli
