#pragma once

#include "taskweave/graph/task.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace YAML {

template <>
struct convert<taskweave::Status> {
  static auto encode(const taskweave::Status& status) -> Node {
    return Node(std::string(taskweave::status_name(status)));
  }
  static auto decode(const Node& node, taskweave::Status& status) -> bool {
    if (!node.IsScalar()) return false;
    auto parsed = taskweave::parse_status(node.as<std::string>());
    if (!parsed) return false;
    status = *parsed;
    return true;
  }
};

template <>
struct convert<taskweave::Priority> {
  static auto encode(const taskweave::Priority& priority) -> Node {
    return Node(std::string(taskweave::priority_name(priority)));
  }
  static auto decode(const Node& node, taskweave::Priority& priority) -> bool {
    if (!node.IsScalar()) return false;
    auto parsed = taskweave::parse_priority(node.as<std::string>());
    if (!parsed) return false;
    priority = *parsed;
    return true;
  }
};

}  // namespace YAML

namespace taskweave {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

}  // namespace taskweave
