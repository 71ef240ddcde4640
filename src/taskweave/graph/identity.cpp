#include "taskweave/graph/identity.hpp"

#include <algorithm>
#include <format>

namespace taskweave::identity {

namespace {

[[nodiscard]] auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view kSpace = " \t\r\n";
  auto begin = s.find_first_not_of(kSpace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(kSpace);
  return s.substr(begin, end - begin + 1);
}

[[nodiscard]] auto all_digits(std::string_view s) -> bool {
  return !s.empty() &&
         std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

auto normalize_segment(std::string_view id) -> std::string {
  auto trimmed = trim(id);
  if (all_digits(trimmed)) {
    while (trimmed.size() > 1 && trimmed.front() == '0') {
      trimmed.remove_prefix(1);
    }
  }
  return std::string(trimmed);
}

auto normalize(std::string_view text) -> TaskRef {
  auto trimmed = trim(text);
  auto dot = trimmed.find('.');
  if (dot == std::string_view::npos) {
    auto segment = normalize_segment(trimmed);
    if (segment.empty()) {
      return TaskRef::malformed(std::string(text));
    }
    return TaskRef::task(std::move(segment));
  }

  if (trimmed.find('.', dot + 1) != std::string_view::npos) {
    return TaskRef::malformed(std::string(trimmed));
  }
  return normalize(trimmed.substr(0, dot), trimmed.substr(dot + 1));
}

auto normalize(std::int64_t id) -> TaskRef {
  return normalize(std::format("{}", id));
}

auto normalize(std::string_view parent, std::string_view child) -> TaskRef {
  auto head = normalize_segment(parent);
  auto tail = normalize_segment(child);
  if (head.empty() || tail.empty() || head.contains('.') ||
      tail.contains('.')) {
    return TaskRef::malformed(std::format("{}.{}", parent, child));
  }
  return TaskRef::subtask(std::move(head), std::move(tail));
}

auto qualify(const TaskGraph& graph, NodeIndex owner, const TaskRef& ref)
    -> TaskRef {
  if (!ref.is_task() || owner >= graph.arena_size()) {
    return ref;
  }
  const auto& node = graph.node(owner);
  if (!node.is_subtask()) {
    return ref;
  }
  auto sibling = TaskRef::subtask(std::string(node.ref.task_id()),
                                  std::string(ref.task_id()));
  if (graph.contains(sibling)) {
    return sibling;
  }
  return ref;
}

auto resolve(const TaskGraph& graph, const TaskRef& ref) -> Result<NodeIndex> {
  if (ref.is_malformed()) {
    return fail(Error::MalformedReference);
  }
  auto idx = graph.find(ref);
  if (idx == kInvalidNode) {
    return fail(Error::NotFound);
  }
  return idx;
}

auto resolve(const TaskGraph& graph, std::string_view text)
    -> Result<NodeIndex> {
  return resolve(graph, normalize(text));
}

auto exists(const TaskGraph& graph, const TaskRef& ref) -> bool {
  return resolve(graph, ref).has_value();
}

}  // namespace taskweave::identity
