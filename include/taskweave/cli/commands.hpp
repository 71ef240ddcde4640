#pragma once

#include "taskweave/config/system_config.hpp"
#include "taskweave/storage/task_file.hpp"

#include <optional>
#include <string>

namespace taskweave::cli {

// Settings shared by every command: the loaded configuration, with
// command-line overrides already applied.
struct Context {
  SystemConfig config;
};

struct ValidateOptions {
  bool json{false};
};

struct FixOptions {
  bool dry_run{false};
  bool json{false};
};

struct NextOptions {
  // Raw -n value; unset means selection.default_concurrency.
  std::optional<std::string> concurrency;
  bool json{false};
};

struct DependencyOptions {
  std::string id;
  std::string depends_on;
};

[[nodiscard]] auto cmd_validate(const Context& ctx, const ValidateOptions& opts)
    -> int;
[[nodiscard]] auto cmd_fix(const Context& ctx, const FixOptions& opts) -> int;
[[nodiscard]] auto cmd_next(const Context& ctx, const NextOptions& opts) -> int;
[[nodiscard]] auto cmd_add_dep(const Context& ctx,
                               const DependencyOptions& opts) -> int;
[[nodiscard]] auto cmd_remove_dep(const Context& ctx,
                                  const DependencyOptions& opts) -> int;

// Loads the configured tasks file, printing the failure to stderr.
[[nodiscard]] auto load_tasks(const Context& ctx)
    -> std::optional<TaskDocument>;

}  // namespace taskweave::cli
