#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/graph/task.hpp"
#include "taskweave/graph/task_graph.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace taskweave {

struct TaskFileOptions {
  Priority default_priority{Priority::Medium};
  // Tagged files keep each task list under {"<tag>": {"tasks": [...]}}.
  std::string tag{"master"};
};

// A tasks.json document together with the graph built from it. The JSON is
// kept so that fields the engine does not model survive a rewrite.
struct TaskDocument {
  nlohmann::json root;
  std::string tag;  // empty for an untagged {"tasks": [...]} file
  TaskGraph graph;
};

class TaskFile {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path,
                                           const TaskFileOptions& options = {})
      -> Result<TaskDocument>;
  [[nodiscard]] static auto load_from_string(std::string_view text,
                                             const TaskFileOptions& options = {})
      -> Result<TaskDocument>;

  // Copies dependency lists from the graph back into the JSON. Lists whose
  // canonical content did not change keep their original spelling. Entries
  // for tasks and subtasks removed from the graph are dropped.
  static auto sync(TaskDocument& doc) -> void;

  [[nodiscard]] static auto save_to_file(TaskDocument& doc,
                                         std::string_view path) -> Result<void>;
  [[nodiscard]] static auto dump(TaskDocument& doc) -> std::string;
};

}  // namespace taskweave
