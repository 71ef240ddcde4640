#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task_graph.hpp"
#include "taskweave/graph/task_ref.hpp"

#include <cstdint>
#include <string>
#include <string_view>

// Canonicalization and lookup of task references. Every place that compares
// ids goes through here; nothing else in the engine looks at raw id text.
namespace taskweave::identity {

// Trims surrounding whitespace and strips leading zeros from all-digit ids,
// so 3, "3" and " 03" produce the same segment.
[[nodiscard]] auto normalize_segment(std::string_view id) -> std::string;

// "3" -> task 3, "3.2" -> subtask 2 of task 3. Anything else (empty text,
// empty segments, more than one dot) yields a malformed reference.
[[nodiscard]] auto normalize(std::string_view text) -> TaskRef;
[[nodiscard]] auto normalize(std::int64_t id) -> TaskRef;
[[nodiscard]] auto normalize(std::string_view parent, std::string_view child)
    -> TaskRef;

// Applies sibling shorthand: within a subtask's dependency list a bare id
// names a sibling subtask when one exists, otherwise a top-level task.
[[nodiscard]] auto qualify(const TaskGraph& graph, NodeIndex owner,
                           const TaskRef& ref) -> TaskRef;

[[nodiscard]] auto resolve(const TaskGraph& graph, const TaskRef& ref)
    -> Result<NodeIndex>;
[[nodiscard]] auto resolve(const TaskGraph& graph, std::string_view text)
    -> Result<NodeIndex>;

[[nodiscard]] auto exists(const TaskGraph& graph, const TaskRef& ref) -> bool;

}  // namespace taskweave::identity
