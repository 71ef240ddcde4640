#include "taskweave/graph/validator.hpp"

#include "taskweave/graph/identity.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

namespace taskweave {

namespace {

enum class Color : std::uint8_t { White, Gray, Black };

[[nodiscard]] auto describe(const Node& node) -> std::string_view {
  return node.is_subtask() ? "Subtask" : "Task";
}

[[nodiscard]] auto format_cycle(const std::vector<TaskRef>& cycle)
    -> std::string {
  std::string out;
  for (const auto& ref : cycle) {
    std::format_to(std::back_inserter(out), "{} -> ", ref);
  }
  out += cycle.front().str();
  return out;
}

}  // namespace

auto GraphValidator::validate(const TaskGraph& graph) -> std::vector<Issue> {
  std::vector<Issue> issues;
  check_edges(graph, issues);
  check_cycles(graph, issues);
  return issues;
}

auto GraphValidator::check_edges(const TaskGraph& graph,
                                 std::vector<Issue>& issues) -> void {
  for (auto idx : graph.all_nodes()) {
    const auto& node = graph.node(idx);
    for (const auto& dep : node.dependencies) {
      auto target = identity::resolve(graph, dep);
      if (!target) {
        issues.push_back({
            .kind = IssueKind::MissingDependency,
            .subject = node.ref,
            .dependency = dep,
            .cycle = {},
            .reason = std::format("{} {} depends on non-existent task {}",
                                  describe(node), node.ref, dep),
        });
        continue;
      }

      if (*target == idx) {
        issues.push_back({
            .kind = IssueKind::SelfDependency,
            .subject = node.ref,
            .dependency = dep,
            .cycle = {},
            .reason = std::format("{} {} depends on itself", describe(node),
                                  node.ref),
        });
        continue;
      }

      const auto& dep_node = graph.node(*target);
      if (is_done(node.status) && !is_done(dep_node.status)) {
        issues.push_back({
            .kind = IssueKind::StatusInversion,
            .subject = node.ref,
            .dependency = dep,
            .cycle = {},
            .reason = std::format(
                "{} {} is done but its dependency {} is still {}",
                describe(node), node.ref, dep, status_name(dep_node.status)),
        });
      }
    }
  }
}

auto GraphValidator::check_cycles(const TaskGraph& graph,
                                  std::vector<Issue>& issues) -> void {
  const auto order = graph.all_nodes();

  // Resolved, de-duplicated edges only; dangling and self edges were already
  // reported by check_edges.
  std::vector<std::vector<NodeIndex>> edges(graph.arena_size());
  for (auto idx : order) {
    auto& out = edges[idx];
    for (const auto& dep : graph.node(idx).dependencies) {
      auto target = identity::resolve(graph, dep);
      if (!target || *target == idx) {
        continue;
      }
      if (std::ranges::find(out, *target) == out.end()) {
        out.push_back(*target);
      }
    }
  }

  std::vector<Color> color(graph.arena_size(), Color::White);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;

  for (auto start : order) {
    if (color[start] != Color::White) {
      continue;
    }

    stack.push_back({start, 0});
    color[start] = Color::Gray;

    while (!stack.empty()) {
      auto& [current, next_edge] = stack.back();
      const auto& deps = edges[current];

      if (next_edge >= deps.size()) {
        color[current] = Color::Black;
        stack.pop_back();
        continue;
      }

      NodeIndex child = deps[next_edge++];
      if (color[child] == Color::White) {
        color[child] = Color::Gray;
        stack.push_back({child, 0});
        continue;
      }
      if (color[child] != Color::Gray) {
        continue;
      }

      // Back edge: the cycle is the stack suffix starting at `child`.
      auto entry = std::ranges::find(stack, child,
                                     &std::pair<NodeIndex, std::size_t>::first);
      std::vector<TaskRef> members;
      for (const auto& frame : std::ranges::subrange(entry, stack.end())) {
        members.push_back(graph.node(frame.first).ref);
      }

      const auto& head = graph.node(child);
      auto reason = std::format("{} {} is part of a circular dependency: {}",
                                describe(head), head.ref,
                                format_cycle(members));
      issues.push_back({
          .kind = IssueKind::CircularDependency,
          .subject = head.ref,
          .dependency = std::nullopt,
          .cycle = std::move(members),
          .reason = std::move(reason),
      });
    }
  }
}

auto GraphValidator::summarize(const TaskGraph& graph) -> GraphSummary {
  GraphSummary summary;
  summary.tasks = graph.task_count();
  summary.subtasks = graph.subtask_count();
  for (auto idx : graph.all_nodes()) {
    summary.dependencies += graph.node(idx).dependencies.size();
  }
  return summary;
}

}  // namespace taskweave
