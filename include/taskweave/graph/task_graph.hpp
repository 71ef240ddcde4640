#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task.hpp"
#include "taskweave/graph/task_ref.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskweave {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex kInvalidNode = UINT32_MAX;

enum class NodeKind : std::uint8_t { Task, Subtask };

struct Node {
  TaskRef ref;
  NodeKind kind{NodeKind::Task};
  NodeIndex parent{kInvalidNode};
  std::string title;
  Status status{Status::Pending};
  std::optional<Priority> priority;
  std::vector<TaskRef> dependencies;
  std::vector<NodeIndex> subtasks;
  bool removed{false};

  [[nodiscard]] auto is_subtask() const noexcept -> bool {
    return kind == NodeKind::Subtask;
  }
};

// Arena of tasks and subtasks keyed by canonical reference. Indices stay
// stable for the lifetime of the graph; removed nodes are tombstoned and
// dropped from the key index, so references to them stop resolving.
class TaskGraph {
public:
  explicit TaskGraph(Priority default_priority = Priority::Medium)
      : default_priority_(default_priority) {}

  [[nodiscard]] auto add_task(std::string_view id,
                              Status status = Status::Pending,
                              std::optional<Priority> priority = std::nullopt,
                              std::string title = {}) -> Result<NodeIndex>;
  [[nodiscard]] auto add_subtask(NodeIndex parent, std::string_view id,
                                 Status status = Status::Pending,
                                 std::optional<Priority> priority = std::nullopt,
                                 std::string title = {}) -> Result<NodeIndex>;

  // Removes a task (with all of its subtasks) or a single subtask.
  // Dependencies pointing at the removed nodes are left dangling.
  [[nodiscard]] auto remove(const TaskRef& ref) -> Result<void>;

  [[nodiscard]] auto find(const TaskRef& ref) const -> NodeIndex;
  [[nodiscard]] auto contains(const TaskRef& ref) const -> bool {
    return find(ref) != kInvalidNode;
  }

  [[nodiscard]] auto node(NodeIndex idx) const -> const Node& {
    return nodes_[idx];
  }
  [[nodiscard]] auto node(NodeIndex idx) -> Node& { return nodes_[idx]; }

  // Top-level tasks in declaration order.
  [[nodiscard]] auto tasks() const noexcept -> std::span<const NodeIndex> {
    return tasks_;
  }
  // Every live node: each task followed by its subtasks.
  [[nodiscard]] auto all_nodes() const -> std::vector<NodeIndex>;

  // Explicit priority, else the parent's (for subtasks), else the default.
  [[nodiscard]] auto effective_priority(NodeIndex idx) const -> Priority;
  [[nodiscard]] auto default_priority() const noexcept -> Priority {
    return default_priority_;
  }

  [[nodiscard]] auto task_count() const noexcept -> std::size_t {
    return tasks_.size();
  }
  [[nodiscard]] auto subtask_count() const -> std::size_t;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return key_to_idx_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return key_to_idx_.empty();
  }
  [[nodiscard]] auto arena_size() const noexcept -> std::size_t {
    return nodes_.size();
  }

private:
  auto insert(Node node) -> NodeIndex;
  auto tombstone(NodeIndex idx) -> void;

  std::vector<Node> nodes_;
  std::vector<NodeIndex> tasks_;
  std::unordered_map<TaskRef, NodeIndex> key_to_idx_;
  Priority default_priority_;
};

}  // namespace taskweave
