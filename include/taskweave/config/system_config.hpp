#pragma once

#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/selector.hpp"
#include "taskweave/graph/task.hpp"

#include <string>

namespace taskweave {

struct LogConfig {
  std::string level{"info"};
  std::string file;
  bool color{true};
};

struct SelectionConfig {
  SelectionOptions options;
  int default_concurrency{1};
};

struct GraphConfig {
  Priority default_priority{Priority::Medium};
};

struct SystemConfig {
  LogConfig log;
  SelectionConfig selection;
  GraphConfig graph;
  RepairOptions repair{.reject_cycles = true};
  std::string tasks_file{"tasks/tasks.json"};
  // Tagged tasks files keep one task list per tag.
  std::string tag{"master"};
};

}  // namespace taskweave
