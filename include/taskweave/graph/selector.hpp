#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task.hpp"
#include "taskweave/graph/task_graph.hpp"
#include "taskweave/graph/task_ref.hpp"

#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace taskweave {

inline constexpr int kMaxConcurrency = 10;

struct SelectionOptions {
  int max_concurrency{kMaxConcurrency};
  // Parents whose pending subtasks are offered before top-level tasks.
  std::vector<Status> eligible_parent_statuses{Status::InProgress};
};

// A ready unit of work. `dependencies` are canonical, with subtask sibling
// shorthand already expanded.
struct Candidate {
  NodeIndex node{kInvalidNode};
  TaskRef ref;
  Priority priority{Priority::Medium};
  std::vector<TaskRef> dependencies;

  [[nodiscard]] auto is_subtask() const noexcept -> bool {
    return ref.is_subtask();
  }
};

struct Selection {
  std::vector<Candidate> tasks;
  int requested{0};
  int effective{0};

  // True when the request exceeded max_concurrency; callers warn about it.
  [[nodiscard]] auto clamped() const noexcept -> bool {
    return requested != effective;
  }
};

// Parses a concurrency value from user input. Anything that is not a
// positive integer fails with InvalidConcurrency.
[[nodiscard]] auto parse_concurrency(std::string_view text) -> Result<int>;

class ConcurrentSelector {
public:
  explicit ConcurrentSelector(SelectionOptions options = {})
      : options_(std::move(options)) {}

  // Up to `concurrency` ready tasks that can all be started now, in parallel.
  // Never mutates the graph.
  [[nodiscard]] auto select_next(const TaskGraph& graph, int concurrency) const
      -> Result<Selection>;

  // The single best ready task: an eligible subtask first, else a top-level
  // task.
  [[nodiscard]] auto next_task(const TaskGraph& graph) const
      -> std::optional<Candidate>;

  [[nodiscard]] auto options() const noexcept -> const SelectionOptions& {
    return options_;
  }

private:
  using RefSet = std::unordered_set<TaskRef>;

  [[nodiscard]] static auto completed_set(const TaskGraph& graph) -> RefSet;
  [[nodiscard]] auto subtask_candidates(const TaskGraph& graph,
                                        const RefSet& completed) const
      -> std::vector<Candidate>;
  [[nodiscard]] auto task_candidates(const TaskGraph& graph,
                                     const RefSet& completed) const
      -> std::vector<Candidate>;
  [[nodiscard]] auto is_eligible_parent(const Node& node) const -> bool;

  static auto sort_candidates(std::vector<Candidate>& candidates) -> void;
  [[nodiscard]] static auto conflicts(const Candidate& candidate,
                                      const std::vector<Candidate>& selected)
      -> bool;

  SelectionOptions options_;
};

}  // namespace taskweave
