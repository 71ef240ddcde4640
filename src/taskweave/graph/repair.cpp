#include "taskweave/graph/repair.hpp"

#include "taskweave/graph/identity.hpp"
#include "taskweave/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <unordered_set>

namespace taskweave {

namespace {

// Drops every dependency of `idx` matching `pred` and records one mutation
// per dropped reference.
template <typename Pred>
auto erase_dependencies(TaskGraph& graph, NodeIndex idx, MutationKind kind,
                        RepairReport& report, Pred pred) -> void {
  auto& node = graph.node(idx);
  std::vector<TaskRef> kept;
  kept.reserve(node.dependencies.size());
  for (auto& dep : node.dependencies) {
    if (pred(dep)) {
      log::debug("Removing dependency {} from {} ({})", dep, node.ref,
                 mutation_kind_name(kind));
      report.mutations.push_back({kind, node.ref, dep});
    } else {
      kept.push_back(std::move(dep));
    }
  }
  node.dependencies = std::move(kept);
}

[[nodiscard]] auto resolve_subject(const TaskGraph& graph, const TaskRef& ref)
    -> Result<NodeIndex> {
  auto idx = identity::resolve(graph, ref);
  if (!idx) {
    return fail(Error::NotFound);
  }
  return idx;
}

}  // namespace

auto RepairReport::count(MutationKind kind) const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count(mutations, kind, &Mutation::kind));
}

auto RepairReport::merge(RepairReport other) -> void {
  std::ranges::move(other.mutations, std::back_inserter(mutations));
}

auto RepairEngine::remove_duplicate_dependencies(TaskGraph& graph)
    -> RepairReport {
  RepairReport report;
  for (auto idx : graph.all_nodes()) {
    std::unordered_set<TaskRef> seen;
    erase_dependencies(graph, idx, MutationKind::DuplicateRemoved, report,
                       [&](const TaskRef& dep) {
                         return !seen.insert(dep).second;
                       });
  }
  return report;
}

auto RepairEngine::cleanup_subtask_dependencies(TaskGraph& graph)
    -> RepairReport {
  RepairReport report;
  for (auto idx : graph.all_nodes()) {
    bool owner_is_subtask = graph.node(idx).is_subtask();
    erase_dependencies(graph, idx, MutationKind::DanglingRemoved, report,
                       [&](const TaskRef& dep) {
                         if (!owner_is_subtask && !dep.is_subtask()) {
                           return false;
                         }
                         return !identity::exists(graph, dep);
                       });
  }
  return report;
}

auto RepairEngine::ensure_at_least_one_independent_subtask(TaskGraph& graph)
    -> RepairReport {
  RepairReport report;
  for (auto task : graph.tasks()) {
    const auto& subtasks = graph.node(task).subtasks;
    if (subtasks.empty()) {
      continue;
    }

    bool has_start = std::ranges::any_of(subtasks, [&](NodeIndex st) {
      return graph.node(st).dependencies.empty();
    });
    if (has_start) {
      continue;
    }

    auto first = subtasks.front();
    log::info("Clearing dependencies of subtask {} so task {} has a starting point",
              graph.node(first).ref, graph.node(task).ref);
    erase_dependencies(graph, first, MutationKind::StartingPointCleared,
                       report, [](const TaskRef&) { return true; });
  }
  return report;
}

auto RepairEngine::add_dependency(TaskGraph& graph, const TaskRef& subject,
                                  const TaskRef& dependency) const
    -> Result<TaskRef> {
  auto subject_idx = resolve_subject(graph, subject);
  if (!subject_idx) {
    log::error("Task {} not found", subject);
    return fail(subject_idx.error());
  }

  auto dep_ref = identity::qualify(graph, *subject_idx, dependency);
  auto dep_idx = identity::resolve(graph, dep_ref);
  if (!dep_idx) {
    log::error("Dependency target {} does not exist", dependency);
    return fail(Error::NotFound);
  }

  auto& node = graph.node(*subject_idx);
  const auto& canonical = graph.node(*dep_idx).ref;
  if (*dep_idx == *subject_idx) {
    log::error("{} cannot depend on itself", node.ref);
    return fail(Error::SelfDependency);
  }

  if (std::ranges::contains(node.dependencies, canonical)) {
    log::warn("Dependency {} already exists in {}", canonical, node.ref);
    return fail(Error::AlreadyExists);
  }

  if (options_.reject_cycles &&
      would_create_cycle(graph, *subject_idx, *dep_idx)) {
    log::error("Adding dependency {} to {} would create a circular dependency",
               canonical, node.ref);
    return fail(Error::CycleDetected);
  }

  node.dependencies.push_back(canonical);
  log::info("Added dependency {} to {}", canonical, node.ref);
  return canonical;
}

auto RepairEngine::remove_dependency(TaskGraph& graph, const TaskRef& subject,
                                     const TaskRef& dependency)
    -> Result<TaskRef> {
  auto subject_idx = resolve_subject(graph, subject);
  if (!subject_idx) {
    log::error("Task {} not found", subject);
    return fail(subject_idx.error());
  }

  auto& node = graph.node(*subject_idx);
  auto qualified = identity::qualify(graph, *subject_idx, dependency);
  auto it = std::ranges::find(node.dependencies, qualified);
  if (it == node.dependencies.end()) {
    it = std::ranges::find(node.dependencies, dependency);
  }
  if (it == node.dependencies.end()) {
    log::info("{} does not depend on {}, no changes made", node.ref,
              dependency);
    return fail(Error::NotPresent);
  }

  auto removed = std::move(*it);
  node.dependencies.erase(it);
  log::info("Removed dependency {} from {}", removed, node.ref);
  return removed;
}

auto RepairEngine::validate_and_fix_dependencies(TaskGraph& graph)
    -> FixResult {
  log::debug("Validating and fixing dependencies...");
  FixResult result;

  for (const auto& issue : GraphValidator::validate(graph)) {
    if (issue.kind != IssueKind::MissingDependency &&
        issue.kind != IssueKind::SelfDependency) {
      continue;
    }
    auto idx = graph.find(issue.subject);
    if (idx == kInvalidNode || !issue.dependency) {
      continue;
    }
    auto kind = issue.kind == IssueKind::MissingDependency
                    ? MutationKind::MissingRemoved
                    : MutationKind::SelfRemoved;
    erase_dependencies(graph, idx, kind, result.report,
                       [&](const TaskRef& dep) {
                         return dep == *issue.dependency;
                       });
  }

  result.report.merge(remove_duplicate_dependencies(graph));
  result.report.merge(cleanup_subtask_dependencies(graph));
  result.report.merge(ensure_at_least_one_independent_subtask(graph));

  result.residual = GraphValidator::validate(graph);

  if (result.changed()) {
    log::info("Fixed {} dependency issue(s)", result.report.mutations.size());
  } else {
    log::debug("No changes needed to fix dependencies");
  }
  if (!result.residual.empty()) {
    log::warn("{} dependency issue(s) need manual attention",
              result.residual.size());
  }
  return result;
}

auto RepairEngine::would_create_cycle(const TaskGraph& graph,
                                      NodeIndex subject, NodeIndex dependency)
    -> bool {
  std::vector<bool> visited(graph.arena_size(), false);
  std::vector<NodeIndex> stack{dependency};

  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();

    if (current == subject) {
      return true;
    }
    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (const auto& dep : graph.node(current).dependencies) {
      auto next = identity::resolve(graph, dep);
      if (next && !visited[*next]) {
        stack.push_back(*next);
      }
    }
  }
  return false;
}

}  // namespace taskweave
