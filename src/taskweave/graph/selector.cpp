#include "taskweave/graph/selector.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <ranges>
#include <utility>

namespace taskweave {

namespace {

[[nodiscard]] auto depends_on(const Candidate& c, const TaskRef& ref) -> bool {
  return std::ranges::contains(c.dependencies, ref);
}

// True when `c` depends on a subtask of task `parent`.
[[nodiscard]] auto depends_on_child_of(const Candidate& c,
                                       const TaskRef& parent) -> bool {
  if (!parent.is_task()) {
    return false;
  }
  return std::ranges::any_of(c.dependencies, [&](const TaskRef& dep) {
    return dep.is_subtask() && dep.task_id() == parent.task_id();
  });
}

}  // namespace

auto parse_concurrency(std::string_view text) -> Result<int> {
  while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
  while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
      value < 1) {
    return fail(Error::InvalidConcurrency);
  }
  return value;
}

auto ConcurrentSelector::select_next(const TaskGraph& graph,
                                     int concurrency) const
    -> Result<Selection> {
  if (concurrency < 1) {
    return fail(Error::InvalidConcurrency);
  }

  Selection selection;
  selection.requested = concurrency;
  selection.effective =
      std::min(concurrency, std::max(1, options_.max_concurrency));

  auto completed = completed_set(graph);
  auto candidates = subtask_candidates(graph, completed);
  std::ranges::move(task_candidates(graph, completed),
                    std::back_inserter(candidates));
  sort_candidates(candidates);

  for (auto& candidate : candidates) {
    if (std::cmp_greater_equal(selection.tasks.size(), selection.effective)) {
      break;
    }
    if (!conflicts(candidate, selection.tasks)) {
      selection.tasks.push_back(std::move(candidate));
    }
  }

  log::debug("Selected {} of {} ready candidate(s) (concurrency {})",
             selection.tasks.size(), candidates.size(), selection.effective);
  return selection;
}

auto ConcurrentSelector::next_task(const TaskGraph& graph) const
    -> std::optional<Candidate> {
  auto completed = completed_set(graph);

  auto subtasks = subtask_candidates(graph, completed);
  if (!subtasks.empty()) {
    sort_candidates(subtasks);
    return std::move(subtasks.front());
  }

  auto tasks = task_candidates(graph, completed);
  if (tasks.empty()) {
    return std::nullopt;
  }
  sort_candidates(tasks);
  return std::move(tasks.front());
}

auto ConcurrentSelector::completed_set(const TaskGraph& graph) -> RefSet {
  RefSet completed;
  for (auto idx : graph.all_nodes()) {
    const auto& node = graph.node(idx);
    if (is_done(node.status)) {
      completed.insert(node.ref);
    }
  }
  return completed;
}

auto ConcurrentSelector::is_eligible_parent(const Node& node) const -> bool {
  return std::ranges::contains(options_.eligible_parent_statuses, node.status);
}

auto ConcurrentSelector::subtask_candidates(const TaskGraph& graph,
                                            const RefSet& completed) const
    -> std::vector<Candidate> {
  std::vector<Candidate> out;
  for (auto task : graph.tasks()) {
    if (!is_eligible_parent(graph.node(task))) {
      continue;
    }
    for (auto st : graph.node(task).subtasks) {
      const auto& node = graph.node(st);
      if (node.status != Status::Pending) {
        continue;
      }
      bool ready = std::ranges::all_of(
          node.dependencies,
          [&](const TaskRef& dep) { return completed.contains(dep); });
      if (ready) {
        out.push_back({st, node.ref, graph.effective_priority(st),
                       node.dependencies});
      }
    }
  }
  return out;
}

auto ConcurrentSelector::task_candidates(const TaskGraph& graph,
                                         const RefSet& completed) const
    -> std::vector<Candidate> {
  std::vector<Candidate> out;
  for (auto task : graph.tasks()) {
    const auto& node = graph.node(task);
    if (!is_open(node.status)) {
      continue;
    }
    // Already offered through its subtasks.
    if (is_eligible_parent(node) && !node.subtasks.empty()) {
      continue;
    }
    bool ready = std::ranges::all_of(
        node.dependencies,
        [&](const TaskRef& dep) { return completed.contains(dep); });
    if (ready) {
      out.push_back({task, node.ref, graph.effective_priority(task),
                     node.dependencies});
    }
  }
  return out;
}

auto ConcurrentSelector::sort_candidates(std::vector<Candidate>& candidates)
    -> void {
  std::ranges::stable_sort(candidates, [](const Candidate& a,
                                          const Candidate& b) {
    auto pa = priority_rank(a.priority);
    auto pb = priority_rank(b.priority);
    if (pa != pb) {
      return pa > pb;
    }
    if (a.dependencies.size() != b.dependencies.size()) {
      return a.dependencies.size() < b.dependencies.size();
    }
    return a.ref < b.ref;
  });
}

auto ConcurrentSelector::conflicts(const Candidate& candidate,
                                   const std::vector<Candidate>& selected)
    -> bool {
  return std::ranges::any_of(selected, [&](const Candidate& chosen) {
    if (depends_on(candidate, chosen.ref) || depends_on(chosen, candidate.ref)) {
      return true;
    }
    // A subtask conflicts with work that depends on its parent, and a task
    // conflicts with work that depends on one of its subtasks.
    if (candidate.is_subtask() && depends_on(chosen, candidate.ref.parent())) {
      return true;
    }
    if (chosen.is_subtask() && depends_on(candidate, chosen.ref.parent())) {
      return true;
    }
    return depends_on_child_of(candidate, chosen.ref) ||
           depends_on_child_of(chosen, candidate.ref);
  });
}

}  // namespace taskweave
