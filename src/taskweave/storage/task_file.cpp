#include "taskweave/storage/task_file.hpp"

#include "taskweave/graph/identity.hpp"
#include "taskweave/util/log.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <tuple>
#include <vector>

namespace taskweave {

using json = nlohmann::json;

namespace {

[[nodiscard]] auto id_text(const json& value) -> std::optional<std::string> {
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<std::uint64_t>());
  }
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return std::nullopt;
}

// A dotted reference written without quotes (`2.1`) reaches us as a JSON
// float. Its shortest decimal rendering is the "parent.child" text.
[[nodiscard]] auto parse_ref(const json& value) -> TaskRef {
  if (auto text = id_text(value)) {
    return identity::normalize(*text);
  }
  if (value.is_number_float()) {
    auto number = value.get<double>();
    if (number == std::trunc(number) && std::abs(number) < 1e15) {
      return identity::normalize(static_cast<std::int64_t>(number));
    }
    return identity::normalize(value.dump());
  }
  return TaskRef::malformed(value.dump());
}

// Numeric ids go back out as JSON numbers, matching how they are usually
// written by hand.
[[nodiscard]] auto segment_json(std::string_view segment) -> json {
  if (!segment.empty() && segment.size() < 19 &&
      segment.find_first_not_of("0123456789") == std::string_view::npos) {
    return std::stoll(std::string(segment));
  }
  return std::string(segment);
}

// Sibling shorthand is only written for siblings that exist. A bare id for a
// missing sibling would name the top-level task on the next load.
[[nodiscard]] auto ref_json(const TaskGraph& graph, const TaskRef& ref,
                            const Node& owner) -> json {
  if (ref.is_task()) {
    return segment_json(ref.task_id());
  }
  if (ref.is_subtask() && owner.is_subtask() &&
      ref.task_id() == owner.ref.task_id() &&
      segment_json(ref.subtask_id()).is_number() && graph.contains(ref)) {
    return segment_json(ref.subtask_id());
  }
  return ref.str();
}

[[nodiscard]] auto task_list(json& root, const std::string& tag) -> json* {
  if (tag.empty()) {
    return &root["tasks"];
  }
  return &root[tag]["tasks"];
}

[[nodiscard]] auto read_node_fields(const json& item, std::string_view what)
    -> Result<std::tuple<std::string, Status, std::optional<Priority>,
                         std::string>> {
  if (!item.is_object()) {
    log::error("{} entry is not an object", what);
    return fail(Error::ParseError);
  }

  auto id = item.contains("id") ? id_text(item["id"]) : std::nullopt;
  if (!id || id->empty()) {
    log::error("{} entry has a missing or invalid id", what);
    return fail(Error::ParseError);
  }

  Status status = Status::Pending;
  if (auto it = item.find("status"); it != item.end() && !it->is_null()) {
    auto parsed = it->is_string() ? parse_status(it->get<std::string>())
                                  : std::nullopt;
    if (!parsed) {
      log::error("{} {} has an unknown status {}", what, *id, it->dump());
      return fail(Error::ParseError);
    }
    status = *parsed;
  }

  std::optional<Priority> priority;
  if (auto it = item.find("priority"); it != item.end() && !it->is_null()) {
    priority = it->is_string() ? parse_priority(it->get<std::string>())
                               : std::nullopt;
    if (!priority) {
      log::error("{} {} has an unknown priority {}", what, *id, it->dump());
      return fail(Error::ParseError);
    }
  }

  std::string title;
  if (auto it = item.find("title"); it != item.end() && it->is_string()) {
    title = it->get<std::string>();
  }

  return std::tuple{std::move(*id), status, priority, std::move(title)};
}

[[nodiscard]] auto raw_dependencies(const json& item)
    -> Result<std::vector<TaskRef>> {
  std::vector<TaskRef> deps;
  auto it = item.find("dependencies");
  if (it == item.end() || it->is_null()) {
    return deps;
  }
  if (!it->is_array()) {
    log::error("dependencies must be an array, got {}", it->dump());
    return fail(Error::ParseError);
  }
  for (const auto& dep : *it) {
    deps.push_back(parse_ref(dep));
  }
  return deps;
}

[[nodiscard]] auto qualified(const TaskGraph& graph, NodeIndex owner,
                             const std::vector<TaskRef>& raw)
    -> std::vector<TaskRef> {
  std::vector<TaskRef> out;
  out.reserve(raw.size());
  for (const auto& ref : raw) {
    out.push_back(identity::qualify(graph, owner, ref));
  }
  return out;
}

auto sync_dependencies(json& item, const TaskGraph& graph, NodeIndex idx)
    -> void {
  const auto& node = graph.node(idx);
  auto current = raw_dependencies(item);
  if (current && qualified(graph, idx, *current) == node.dependencies) {
    return;
  }
  auto deps = json::array();
  for (const auto& dep : node.dependencies) {
    deps.push_back(ref_json(graph, dep, node));
  }
  item["dependencies"] = std::move(deps);
}

}  // namespace

auto TaskFile::load_from_file(std::string_view path,
                              const TaskFileOptions& options)
    -> Result<TaskDocument> {
  std::string path_str{path};
  if (!std::filesystem::exists(path_str)) {
    log::error("Tasks file not found: {}", path);
    return fail(Error::FileNotFound);
  }
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open tasks file: {}", path);
    return fail(Error::FileOpenFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str(), options);
}

auto TaskFile::load_from_string(std::string_view text,
                                const TaskFileOptions& options)
    -> Result<TaskDocument> {
  TaskDocument doc{
      .root = json::parse(text, nullptr, false),
      .tag = {},
      .graph = TaskGraph{options.default_priority},
  };
  if (doc.root.is_discarded() || !doc.root.is_object()) {
    log::error("Failed to parse tasks file: not a JSON object");
    return fail(Error::ParseError);
  }

  if (!doc.root.contains("tasks")) {
    if (!doc.root.contains(options.tag) ||
        !doc.root[options.tag].is_object() ||
        !doc.root[options.tag].contains("tasks")) {
      log::error("Tasks file has no task list for tag '{}'", options.tag);
      return fail(Error::ParseError);
    }
    doc.tag = options.tag;
  }

  const json& tasks = *task_list(doc.root, doc.tag);
  if (!tasks.is_array()) {
    log::error("\"tasks\" must be an array");
    return fail(Error::ParseError);
  }

  auto& graph = doc.graph;
  std::vector<std::pair<NodeIndex, std::vector<TaskRef>>> pending_deps;

  for (const auto& item : tasks) {
    auto fields = read_node_fields(item, "Task");
    if (!fields) {
      return fail(fields.error());
    }
    auto& [id, status, priority, title] = *fields;
    auto task = graph.add_task(id, status, priority, std::move(title));
    if (!task) {
      log::error("Task {} cannot be added: {}", id, task.error().message());
      return fail(Error::ParseError);
    }
    auto deps = raw_dependencies(item);
    if (!deps) {
      return fail(deps.error());
    }
    pending_deps.emplace_back(*task, std::move(*deps));

    auto subtasks = item.find("subtasks");
    if (subtasks == item.end() || subtasks->is_null()) {
      continue;
    }
    if (!subtasks->is_array()) {
      log::error("Task {} has a non-array \"subtasks\" field", id);
      return fail(Error::ParseError);
    }
    for (const auto& sub_item : *subtasks) {
      auto sub_fields = read_node_fields(sub_item, "Subtask");
      if (!sub_fields) {
        return fail(sub_fields.error());
      }
      auto& [sub_id, sub_status, sub_priority, sub_title] = *sub_fields;
      auto sub = graph.add_subtask(*task, sub_id, sub_status, sub_priority,
                                   std::move(sub_title));
      if (!sub) {
        log::error("Subtask {}.{} cannot be added: {}", id, sub_id,
                   sub.error().message());
        return fail(Error::ParseError);
      }
      auto sub_deps = raw_dependencies(sub_item);
      if (!sub_deps) {
        return fail(sub_deps.error());
      }
      pending_deps.emplace_back(*sub, std::move(*sub_deps));
    }
  }

  // Sibling shorthand can only be resolved once every subtask is known.
  for (auto& [idx, deps] : pending_deps) {
    graph.node(idx).dependencies = qualified(graph, idx, deps);
  }

  log::debug("Loaded {} tasks and {} subtasks", graph.task_count(),
             graph.subtask_count());
  return doc;
}

auto TaskFile::sync(TaskDocument& doc) -> void {
  auto& graph = doc.graph;
  auto& tasks = *task_list(doc.root, doc.tag);
  for (auto it = tasks.begin(); it != tasks.end();) {
    auto id = id_text((*it)["id"]);
    if (!id) {
      ++it;
      continue;
    }
    auto task = graph.find(identity::normalize(*id));
    if (task == kInvalidNode) {
      log::debug("Dropping removed task {} from the tasks file", *id);
      it = tasks.erase(it);
      continue;
    }
    sync_dependencies(*it, graph, task);

    auto subtasks = it->find("subtasks");
    if (subtasks != it->end() && subtasks->is_array()) {
      for (auto sub_it = subtasks->begin(); sub_it != subtasks->end();) {
        auto sub_id = id_text((*sub_it)["id"]);
        if (!sub_id) {
          ++sub_it;
          continue;
        }
        auto sub = graph.find(identity::normalize(*id, *sub_id));
        if (sub == kInvalidNode) {
          log::debug("Dropping removed subtask {}.{} from the tasks file", *id,
                     *sub_id);
          sub_it = subtasks->erase(sub_it);
          continue;
        }
        sync_dependencies(*sub_it, graph, sub);
        ++sub_it;
      }
    }
    ++it;
  }
}

auto TaskFile::dump(TaskDocument& doc) -> std::string {
  sync(doc);
  return doc.root.dump(2);
}

auto TaskFile::save_to_file(TaskDocument& doc, std::string_view path)
    -> Result<void> {
  auto text = dump(doc);

  // Write to a sibling temp file first so a failed write never truncates the
  // original.
  std::filesystem::path target{std::string(path)};
  auto temp = target;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out.is_open()) {
      log::error("Failed to open {} for writing", temp.string());
      return fail(Error::FileOpenFailed);
    }
    out << text << '\n';
    if (!out) {
      log::error("Failed to write {}", temp.string());
      return fail(Error::FileWriteFailed);
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    log::error("Failed to replace {}: {}", target.string(), ec.message());
    return fail(Error::FileWriteFailed);
  }
  log::debug("Saved tasks to {}", target.string());
  return ok();
}

}  // namespace taskweave
