#include "taskweave/graph/task_graph.hpp"

#include "taskweave/graph/identity.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace taskweave {

namespace {

[[nodiscard]] auto valid_segment(std::string_view id) -> bool {
  return !id.empty() && id.find('.') == std::string_view::npos;
}

}  // namespace

auto TaskGraph::add_task(std::string_view id, Status status,
                         std::optional<Priority> priority, std::string title)
    -> Result<NodeIndex> {
  auto segment = identity::normalize_segment(id);
  if (!valid_segment(segment)) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  auto ref = TaskRef::task(std::move(segment));
  if (key_to_idx_.contains(ref)) {
    return fail(Error::AlreadyExists);
  }

  Node node;
  node.ref = std::move(ref);
  node.kind = NodeKind::Task;
  node.title = std::move(title);
  node.status = status;
  node.priority = priority;
  auto idx = insert(std::move(node));
  tasks_.push_back(idx);
  return idx;
}

auto TaskGraph::add_subtask(NodeIndex parent, std::string_view id,
                            Status status, std::optional<Priority> priority,
                            std::string title) -> Result<NodeIndex> {
  if (parent >= nodes_.size() || nodes_[parent].removed ||
      nodes_[parent].is_subtask()) [[unlikely]] {
    return fail(Error::NotFound);
  }

  auto segment = identity::normalize_segment(id);
  if (!valid_segment(segment)) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  auto ref = TaskRef::subtask(std::string(nodes_[parent].ref.task_id()),
                              std::move(segment));
  if (key_to_idx_.contains(ref)) {
    return fail(Error::AlreadyExists);
  }

  Node node;
  node.ref = std::move(ref);
  node.kind = NodeKind::Subtask;
  node.parent = parent;
  node.title = std::move(title);
  node.status = status;
  node.priority = priority;
  auto idx = insert(std::move(node));
  nodes_[parent].subtasks.push_back(idx);
  return idx;
}

auto TaskGraph::insert(Node node) -> NodeIndex {
  auto idx = static_cast<NodeIndex>(nodes_.size());
  key_to_idx_.emplace(node.ref, idx);
  nodes_.push_back(std::move(node));
  return idx;
}

auto TaskGraph::remove(const TaskRef& ref) -> Result<void> {
  auto idx = find(ref);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }

  auto& target = nodes_[idx];
  if (target.is_subtask()) {
    std::erase(nodes_[target.parent].subtasks, idx);
  } else {
    for (auto child : target.subtasks) {
      tombstone(child);
    }
    target.subtasks.clear();
    std::erase(tasks_, idx);
  }
  tombstone(idx);
  return ok();
}

auto TaskGraph::tombstone(NodeIndex idx) -> void {
  nodes_[idx].removed = true;
  key_to_idx_.erase(nodes_[idx].ref);
}

auto TaskGraph::find(const TaskRef& ref) const -> NodeIndex {
  auto it = key_to_idx_.find(ref);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto TaskGraph::all_nodes() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> result;
  result.reserve(key_to_idx_.size());
  for (auto task : tasks_) {
    result.push_back(task);
    std::ranges::copy(nodes_[task].subtasks, std::back_inserter(result));
  }
  return result;
}

auto TaskGraph::effective_priority(NodeIndex idx) const -> Priority {
  const auto& n = nodes_[idx];
  if (n.priority) {
    return *n.priority;
  }
  if (n.is_subtask() && nodes_[n.parent].priority) {
    return *nodes_[n.parent].priority;
  }
  return default_priority_;
}

auto TaskGraph::subtask_count() const -> std::size_t {
  std::size_t count = 0;
  for (auto task : tasks_) {
    count += nodes_[task].subtasks.size();
  }
  return count;
}

}  // namespace taskweave
