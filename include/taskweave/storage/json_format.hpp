#pragma once

#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/selector.hpp"
#include "taskweave/graph/task.hpp"
#include "taskweave/graph/task_ref.hpp"
#include "taskweave/graph/validator.hpp"

#include <nlohmann/json.hpp>

#include <string>

// nlohmann::json serializers for the engine's report types, picked up by ADL
// (`nlohmann::json j = issues;`). Used by the CLI's --json output.
namespace taskweave {

inline auto to_json(nlohmann::json& j, const TaskRef& ref) -> void {
  j = ref.str();
}

inline auto to_json(nlohmann::json& j, const Issue& issue) -> void {
  j = nlohmann::json{
      {"kind", issue_kind_name(issue.kind)},
      {"subject", issue.subject},
      {"reason", issue.reason},
  };
  if (issue.dependency) {
    j["dependency"] = *issue.dependency;
  }
  if (!issue.cycle.empty()) {
    j["cycle"] = issue.cycle;
  }
}

inline auto to_json(nlohmann::json& j, const Mutation& mutation) -> void {
  j = nlohmann::json{
      {"kind", mutation_kind_name(mutation.kind)},
      {"subject", mutation.subject},
  };
  if (mutation.dependency) {
    j["dependency"] = *mutation.dependency;
  }
}

inline auto to_json(nlohmann::json& j, const RepairReport& report) -> void {
  j = nlohmann::json{
      {"changed", report.changed()},
      {"mutations", report.mutations},
  };
}

inline auto to_json(nlohmann::json& j, const FixResult& result) -> void {
  j = nlohmann::json{
      {"report", result.report},
      {"residual", result.residual},
  };
}

inline auto to_json(nlohmann::json& j, const GraphSummary& summary) -> void {
  j = nlohmann::json{
      {"tasks", summary.tasks},
      {"subtasks", summary.subtasks},
      {"dependencies", summary.dependencies},
  };
}

inline auto to_json(nlohmann::json& j, const Candidate& candidate) -> void {
  j = nlohmann::json{
      {"id", candidate.ref},
      {"kind", candidate.is_subtask() ? "subtask" : "task"},
      {"priority", priority_name(candidate.priority)},
      {"dependencies", candidate.dependencies},
  };
}

inline auto to_json(nlohmann::json& j, const Selection& selection) -> void {
  j = nlohmann::json{
      {"requested", selection.requested},
      {"effective", selection.effective},
      {"tasks", selection.tasks},
  };
}

}  // namespace taskweave
