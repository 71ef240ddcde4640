#pragma once

#include "taskweave/util/natural_order.hpp"

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace taskweave {

enum class RefKind : std::uint8_t { Task, Subtask, Malformed };

// Canonical reference to a task ("3") or a subtask ("3.2"). Values are built
// by the identity resolver (graph/identity.hpp), which normalizes the id
// segments; equality and ordering only ever look at the canonical form.
class TaskRef {
public:
  TaskRef() = default;

  [[nodiscard]] static auto task(std::string id) -> TaskRef {
    TaskRef ref;
    ref.kind_ = RefKind::Task;
    ref.text_ = id;
    ref.task_ = std::move(id);
    return ref;
  }

  [[nodiscard]] static auto subtask(std::string parent, std::string child)
      -> TaskRef {
    TaskRef ref;
    ref.kind_ = RefKind::Subtask;
    ref.text_ = std::format("{}.{}", parent, child);
    ref.task_ = std::move(parent);
    ref.sub_ = std::move(child);
    return ref;
  }

  // Keeps unparseable text around so it can be reported and removed.
  [[nodiscard]] static auto malformed(std::string text) -> TaskRef {
    TaskRef ref;
    ref.kind_ = RefKind::Malformed;
    ref.text_ = std::move(text);
    return ref;
  }

  [[nodiscard]] auto kind() const noexcept -> RefKind { return kind_; }
  [[nodiscard]] auto is_task() const noexcept -> bool {
    return kind_ == RefKind::Task;
  }
  [[nodiscard]] auto is_subtask() const noexcept -> bool {
    return kind_ == RefKind::Subtask;
  }
  [[nodiscard]] auto is_malformed() const noexcept -> bool {
    return kind_ == RefKind::Malformed;
  }

  // Id of the task itself, or of the parent for a subtask reference.
  [[nodiscard]] auto task_id() const noexcept -> std::string_view {
    return task_;
  }
  [[nodiscard]] auto subtask_id() const noexcept -> std::string_view {
    return sub_;
  }

  // The owning task reference; a task reference is its own parent.
  [[nodiscard]] auto parent() const -> TaskRef {
    return is_subtask() ? task(task_) : *this;
  }

  [[nodiscard]] auto str() const noexcept -> const std::string& {
    return text_;
  }

  [[nodiscard]] friend auto operator==(const TaskRef& lhs, const TaskRef& rhs)
      -> bool {
    return lhs.kind_ == rhs.kind_ && lhs.text_ == rhs.text_;
  }

  // Natural order by task id, a task before its own subtasks, then by
  // subtask id. Malformed references sort last.
  [[nodiscard]] friend auto operator<=>(const TaskRef& lhs, const TaskRef& rhs)
      -> std::strong_ordering {
    bool lhs_bad = lhs.is_malformed();
    bool rhs_bad = rhs.is_malformed();
    if (lhs_bad || rhs_bad) {
      if (lhs_bad != rhs_bad) {
        return lhs_bad ? std::strong_ordering::greater
                       : std::strong_ordering::less;
      }
      return lhs.text_ <=> rhs.text_;
    }
    if (auto cmp = natural_compare(lhs.task_, rhs.task_); cmp != 0) {
      return cmp;
    }
    if (lhs.kind_ != rhs.kind_) {
      return lhs.is_task() ? std::strong_ordering::less
                           : std::strong_ordering::greater;
    }
    if (auto cmp = natural_compare(lhs.sub_, rhs.sub_); cmp != 0) {
      return cmp;
    }
    return lhs.text_ <=> rhs.text_;
  }

private:
  RefKind kind_{RefKind::Malformed};
  std::string task_;
  std::string sub_;
  std::string text_;
};

inline auto operator<<(std::ostream& os, const TaskRef& ref) -> std::ostream& {
  return os << ref.str();
}

}  // namespace taskweave

template <>
struct std::hash<taskweave::TaskRef> {
  auto operator()(const taskweave::TaskRef& ref) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(ref.str()) ^
           static_cast<std::size_t>(ref.kind());
  }
};

template <>
struct std::formatter<taskweave::TaskRef> : std::formatter<std::string_view> {
  auto format(const taskweave::TaskRef& ref, auto& ctx) const {
    return std::formatter<std::string_view>::format(ref.str(), ctx);
  }
};
