#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_graph.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/graph/validator.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace taskweave {

enum class MutationKind : std::uint8_t {
  DuplicateRemoved,
  MissingRemoved,
  SelfRemoved,
  DanglingRemoved,
  StartingPointCleared,
  Added,
  Removed,
};

[[nodiscard]] constexpr auto mutation_kind_name(MutationKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case MutationKind::DuplicateRemoved: return "duplicate-removed";
    case MutationKind::MissingRemoved: return "missing-removed";
    case MutationKind::SelfRemoved: return "self-removed";
    case MutationKind::DanglingRemoved: return "dangling-removed";
    case MutationKind::StartingPointCleared: return "starting-point-cleared";
    case MutationKind::Added: return "added";
    case MutationKind::Removed: return "removed";
  }
  return "unknown";
}

// One dependency edge touched by a repair: `subject` lost (or gained)
// `dependency`.
struct Mutation {
  MutationKind kind;
  TaskRef subject;
  std::optional<TaskRef> dependency;
};

struct RepairReport {
  std::vector<Mutation> mutations;

  [[nodiscard]] auto changed() const noexcept -> bool {
    return !mutations.empty();
  }
  [[nodiscard]] auto count(MutationKind kind) const -> std::size_t;
  auto merge(RepairReport other) -> void;
};

struct FixResult {
  RepairReport report;
  // Circular dependencies and status inversions are never auto-resolved;
  // they come back here after the single repair pass.
  std::vector<Issue> residual;

  [[nodiscard]] auto changed() const noexcept -> bool {
    return report.changed();
  }
};

struct RepairOptions {
  // Refuse add_dependency edges that would close a cycle.
  bool reject_cycles{false};
};

class RepairEngine {
public:
  explicit RepairEngine(RepairOptions options = {}) : options_(options) {}

  static auto remove_duplicate_dependencies(TaskGraph& graph) -> RepairReport;
  static auto cleanup_subtask_dependencies(TaskGraph& graph) -> RepairReport;
  static auto ensure_at_least_one_independent_subtask(TaskGraph& graph)
      -> RepairReport;

  // Returns the canonical reference that was stored, after sibling
  // shorthand. Fails with NotFound, SelfDependency, AlreadyExists (a notice)
  // or, when reject_cycles is set, CycleDetected.
  [[nodiscard]] auto add_dependency(TaskGraph& graph, const TaskRef& subject,
                                    const TaskRef& dependency) const
      -> Result<TaskRef>;
  // Returns the reference that was removed. Fails with NotFound for an
  // unknown subject or NotPresent (a notice).
  [[nodiscard]] static auto remove_dependency(TaskGraph& graph,
                                              const TaskRef& subject,
                                              const TaskRef& dependency)
      -> Result<TaskRef>;

  static auto validate_and_fix_dependencies(TaskGraph& graph) -> FixResult;

  [[nodiscard]] auto options() const noexcept -> const RepairOptions& {
    return options_;
  }

private:
  [[nodiscard]] static auto would_create_cycle(const TaskGraph& graph,
                                               NodeIndex subject,
                                               NodeIndex dependency) -> bool;

  RepairOptions options_;
};

}  // namespace taskweave
