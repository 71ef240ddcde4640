#pragma once

#include "taskweave/graph/task_graph.hpp"
#include "taskweave/graph/task_ref.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

enum class IssueKind : std::uint8_t {
  MissingDependency,
  SelfDependency,
  StatusInversion,
  CircularDependency,
};

[[nodiscard]] constexpr auto issue_kind_name(IssueKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case IssueKind::MissingDependency: return "missing-dependency";
    case IssueKind::SelfDependency: return "self-dependency";
    case IssueKind::StatusInversion: return "status-inversion";
    case IssueKind::CircularDependency: return "circular-dependency";
  }
  return "unknown";
}

struct Issue {
  IssueKind kind;
  TaskRef subject;
  std::optional<TaskRef> dependency;
  // Members of the cycle in dependency order, starting at `subject`.
  std::vector<TaskRef> cycle;
  std::string reason;
};

struct GraphSummary {
  std::size_t tasks{0};
  std::size_t subtasks{0};
  std::size_t dependencies{0};
};

class GraphValidator {
public:
  // Read-only. An empty result means the dependency relation is healthy.
  [[nodiscard]] static auto validate(const TaskGraph& graph)
      -> std::vector<Issue>;

  [[nodiscard]] static auto summarize(const TaskGraph& graph) -> GraphSummary;

private:
  static auto check_edges(const TaskGraph& graph, std::vector<Issue>& issues)
      -> void;
  static auto check_cycles(const TaskGraph& graph, std::vector<Issue>& issues)
      -> void;
};

}  // namespace taskweave
