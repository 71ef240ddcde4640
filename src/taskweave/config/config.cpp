#include "taskweave/config/config.hpp"

#include "taskweave/config/yaml_utils.hpp"
#include "taskweave/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskweave::LogConfig> {
  static bool decode(const Node& node, taskweave::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = taskweave::yaml_get_or<std::string>(node, "level", "info");
    l.file = taskweave::yaml_get_or<std::string>(node, "file", "");
    l.color = taskweave::yaml_get_or(node, "color", true);
    return true;
  }
};

template <>
struct convert<taskweave::SelectionConfig> {
  static bool decode(const Node& node, taskweave::SelectionConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.options.max_concurrency =
        taskweave::yaml_get_or(node, "max_concurrency", taskweave::kMaxConcurrency);
    s.default_concurrency = taskweave::yaml_get_or(node, "default_concurrency", 1);
    if (auto statuses = node["eligible_parent_statuses"]) {
      s.options.eligible_parent_statuses =
          statuses.as<std::vector<taskweave::Status>>();
    }
    return true;
  }
};

template <>
struct convert<taskweave::GraphConfig> {
  static bool decode(const Node& node, taskweave::GraphConfig& g) {
    if (!node.IsMap()) {
      return false;
    }
    g.default_priority = taskweave::yaml_get_or(node, "default_priority",
                                                taskweave::Priority::Medium);
    return true;
  }
};

template <>
struct convert<taskweave::RepairOptions> {
  static bool decode(const Node& node, taskweave::RepairOptions& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.reject_cycles = taskweave::yaml_get_or(node, "reject_cycles", true);
    return true;
  }
};

template <>
struct convert<taskweave::SystemConfig> {
  static bool decode(const Node& node, taskweave::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto log = node["log"]) {
      c.log = log.as<taskweave::LogConfig>();
    }
    if (auto selection = node["selection"]) {
      c.selection = selection.as<taskweave::SelectionConfig>();
    }
    if (auto graph = node["graph"]) {
      c.graph = graph.as<taskweave::GraphConfig>();
    }
    if (auto repair = node["repair"]) {
      c.repair = repair.as<taskweave::RepairOptions>();
    }
    c.tasks_file = taskweave::yaml_get_or<std::string>(node, "tasks_file",
                                                       c.tasks_file);
    c.tag = taskweave::yaml_get_or<std::string>(node, "tag", c.tag);
    return true;
  }
};

}  // namespace YAML

namespace taskweave {

namespace {

[[nodiscard]] auto check(const SystemConfig& config) -> Result<void> {
  if (config.selection.options.max_concurrency < 1) {
    log::error("selection.max_concurrency must be at least 1, got {}",
               config.selection.options.max_concurrency);
    return fail(Error::InvalidArgument);
  }
  if (config.selection.default_concurrency < 1) {
    log::error("selection.default_concurrency must be at least 1, got {}",
               config.selection.default_concurrency);
    return fail(Error::InvalidArgument);
  }
  if (config.tasks_file.empty()) {
    log::error("tasks_file must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    if (auto r = check(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace taskweave
