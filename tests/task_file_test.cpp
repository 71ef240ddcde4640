#include "taskweave/graph/repair.hpp"
#include "taskweave/graph/validator.hpp"
#include "taskweave/storage/json_format.hpp"
#include "taskweave/storage/task_file.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace taskweave;
using namespace taskweave::test;

namespace {

constexpr auto kTasks = R"({
  "tasks": [
    {"id": 1, "title": "Set up repo", "status": "done", "dependencies": []},
    {"id": 2, "title": "Parser", "status": "in-progress", "priority": "high",
     "dependencies": [1],
     "subtasks": [
       {"id": 1, "title": "Lexer", "status": "done", "dependencies": []},
       {"id": 2, "title": "Grammar", "dependencies": [1]},
       {"id": 3, "title": "Errors", "dependencies": ["2.2", 3]}
     ]},
    {"id": "3", "title": "Docs", "status": "completed",
     "dependencies": ["2.1"], "details": "kept as-is"}
  ]
})";

}  // namespace

TEST(TaskFileTest, LoadsTasksAndSubtasks) {
  auto doc = TaskFile::load_from_string(kTasks);
  ASSERT_TRUE(doc.has_value()) << doc.error().message();
  const auto& graph = doc->graph;

  EXPECT_EQ(graph.task_count(), 3);
  EXPECT_EQ(graph.subtask_count(), 3);
  EXPECT_TRUE(doc->tag.empty());

  auto parser = graph.find(ref("2"));
  ASSERT_NE(parser, kInvalidNode);
  EXPECT_EQ(graph.node(parser).title, "Parser");
  EXPECT_EQ(graph.node(parser).status, Status::InProgress);
  EXPECT_EQ(graph.node(parser).priority, Priority::High);
  EXPECT_EQ(graph.node(graph.find(ref("3"))).status, Status::Done);
  EXPECT_EQ(graph.effective_priority(graph.find(ref("2.2"))), Priority::High);
}

TEST(TaskFileTest, SiblingShorthandQualifiedOnLoad) {
  auto doc = TaskFile::load_from_string(kTasks);
  ASSERT_TRUE(doc.has_value());

  EXPECT_EQ(deps_of(doc->graph, "2.2"), refs({"2.1"}));
  // A bare 3 inside subtask 2.3 names the subtask itself.
  EXPECT_EQ(deps_of(doc->graph, "2.3"), refs({"2.2", "2.3"}));
  EXPECT_EQ(deps_of(doc->graph, "2"), refs({"1"}));
}

TEST(TaskFileTest, TaggedFile) {
  auto text = R"({"master": {"tasks": [{"id": 1}]},
                  "feature": {"tasks": [{"id": 7}, {"id": 8}]}})";

  auto master = TaskFile::load_from_string(text);
  ASSERT_TRUE(master.has_value());
  EXPECT_EQ(master->tag, "master");
  EXPECT_EQ(master->graph.task_count(), 1);

  auto feature = TaskFile::load_from_string(text, {.tag = "feature"});
  ASSERT_TRUE(feature.has_value());
  EXPECT_EQ(feature->graph.task_count(), 2);
  EXPECT_TRUE(feature->graph.contains(ref("8")));

  auto missing = TaskFile::load_from_string(text, {.tag = "nope"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::ParseError);
}

TEST(TaskFileTest, StructuralErrorsAreParseErrors) {
  for (auto text : {
           "not json",
           "[]",
           R"({"tasks": {}})",
           R"({"tasks": [{"title": "no id"}]})",
           R"({"tasks": [{"id": 1, "status": "finished"}]})",
           R"({"tasks": [{"id": 1, "priority": "urgent"}]})",
           R"({"tasks": [{"id": 1, "dependencies": 2}]})",
           R"({"tasks": [{"id": 1}, {"id": "01"}]})",
           R"({"tasks": [{"id": 1, "subtasks": [{"id": 1}, {"id": 1}]}]})",
       }) {
    auto doc = TaskFile::load_from_string(text);
    ASSERT_FALSE(doc.has_value()) << text;
    EXPECT_EQ(doc.error(), Error::ParseError) << text;
  }
}

TEST(TaskFileTest, UnusualDependencyValuesBecomeMissing) {
  auto doc = TaskFile::load_from_string(
      R"({"tasks": [{"id": 1, "dependencies": [{"id": 2}, "1.2.3"]}]})");
  ASSERT_TRUE(doc.has_value());

  auto issues = GraphValidator::validate(doc->graph);
  ASSERT_EQ(issues.size(), 2);
  EXPECT_EQ(issues[0].kind, IssueKind::MissingDependency);
  EXPECT_EQ(issues[1].kind, IssueKind::MissingDependency);
}

TEST(TaskFileTest, UnquotedDottedIdNamesSubtask) {
  auto doc = TaskFile::load_from_string(
      R"({"tasks": [{"id": 2, "status": "done",
                     "subtasks": [{"id": 1, "status": "done"}]},
                    {"id": 3, "dependencies": [2.1, 2.0]}]})");
  ASSERT_TRUE(doc.has_value());

  EXPECT_EQ(deps_of(doc->graph, "3"), refs({"2.1", "2"}));
  EXPECT_TRUE(GraphValidator::validate(doc->graph).empty());
  EXPECT_FALSE(
      RepairEngine::validate_and_fix_dependencies(doc->graph).changed());
  EXPECT_EQ(deps_of(doc->graph, "3"), refs({"2.1", "2"}));
}

TEST(TaskFileTest, BareIdWithoutSiblingNamesTopLevelTask) {
  auto doc = TaskFile::load_from_string(
      R"({"tasks": [{"id": 1, "subtasks": [{"id": 1, "dependencies": [3]},
                                           {"id": 2, "dependencies": [1]}]},
                    {"id": 3}]})");
  ASSERT_TRUE(doc.has_value());

  EXPECT_EQ(deps_of(doc->graph, "1.1"), refs({"3"}));
  EXPECT_EQ(deps_of(doc->graph, "1.2"), refs({"1.1"}));
}

TEST(TaskFileTest, DefaultPriorityFromOptions) {
  auto doc = TaskFile::load_from_string(R"({"tasks": [{"id": 1}]})",
                                        {.default_priority = Priority::Low});
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->graph.effective_priority(doc->graph.find(ref("1"))),
            Priority::Low);
}

TEST(TaskFileTest, UnchangedListsKeepTheirSpelling) {
  auto doc = TaskFile::load_from_string(kTasks);
  ASSERT_TRUE(doc.has_value());

  auto out = nlohmann::json::parse(TaskFile::dump(*doc));
  EXPECT_EQ(out["tasks"][1]["subtasks"][1]["dependencies"],
            nlohmann::json::array({1}));
  EXPECT_EQ(out["tasks"][2]["details"], "kept as-is");
}

TEST(TaskFileTest, RepairsAreWrittenBack) {
  auto doc = TaskFile::load_from_string(kTasks);
  ASSERT_TRUE(doc.has_value());

  auto result = RepairEngine::validate_and_fix_dependencies(doc->graph);
  EXPECT_EQ(result.report.count(MutationKind::SelfRemoved), 1);

  auto out = nlohmann::json::parse(TaskFile::dump(*doc));
  // Siblings are written back in shorthand form.
  EXPECT_EQ(out["tasks"][1]["subtasks"][2]["dependencies"],
            nlohmann::json::array({2}));
  EXPECT_EQ(out["tasks"][0]["dependencies"], nlohmann::json::array());
}

TEST(TaskFileTest, NumericIdsWrittenAsNumbers) {
  auto doc = TaskFile::load_from_string(
      R"({"tasks": [{"id": 1}, {"id": 2, "subtasks": [{"id": 1}, {"id": 2}]},
                    {"id": 3}]})");
  ASSERT_TRUE(doc.has_value());

  RepairEngine engine;
  ASSERT_TRUE(engine.add_dependency(doc->graph, ref("3"), ref("1")).has_value());
  ASSERT_TRUE(
      engine.add_dependency(doc->graph, ref("3"), ref("2.1")).has_value());
  ASSERT_TRUE(
      engine.add_dependency(doc->graph, ref("2.2"), ref("2.1")).has_value());

  auto out = nlohmann::json::parse(TaskFile::dump(*doc));
  EXPECT_EQ(out["tasks"][2]["dependencies"], nlohmann::json::array({1, "2.1"}));
  EXPECT_EQ(out["tasks"][1]["subtasks"][1]["dependencies"],
            nlohmann::json::array({1}));
}

TEST(TaskFileTest, DanglingSiblingReferenceKeepsItsTarget) {
  auto doc = TaskFile::load_from_string(
      R"({"tasks": [{"id": 1, "subtasks": [{"id": 1, "dependencies": ["1.3"]}]},
                    {"id": 2}, {"id": 3}]})");
  ASSERT_TRUE(doc.has_value());

  RepairEngine engine;
  auto stored = engine.add_dependency(doc->graph, ref("1.1"), ref("2"));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, ref("2"));

  auto text = TaskFile::dump(*doc);
  auto out = nlohmann::json::parse(text);
  EXPECT_EQ(out["tasks"][0]["subtasks"][0]["dependencies"],
            nlohmann::json::array({"1.3", 2}));

  auto reloaded = TaskFile::load_from_string(text);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(deps_of(reloaded->graph, "1.1"), refs({"1.3", "2"}));
}

TEST(TaskFileTest, RemovedNodesAreDroppedOnSave) {
  auto doc = TaskFile::load_from_string(kTasks);
  ASSERT_TRUE(doc.has_value());
  ASSERT_TRUE(doc->graph.remove(ref("3")).has_value());
  ASSERT_TRUE(doc->graph.remove(ref("2.1")).has_value());

  auto text = TaskFile::dump(*doc);
  auto out = nlohmann::json::parse(text);
  ASSERT_EQ(out["tasks"].size(), 2);
  ASSERT_EQ(out["tasks"][1]["subtasks"].size(), 2);
  EXPECT_EQ(out["tasks"][1]["subtasks"][0]["id"], 2);

  auto reloaded = TaskFile::load_from_string(text);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->graph.task_count(), 2);
  EXPECT_EQ(reloaded->graph.subtask_count(), 2);
  EXPECT_FALSE(reloaded->graph.contains(ref("3")));
  EXPECT_FALSE(reloaded->graph.contains(ref("2.1")));
  // The reference to the removed sibling stays dangling instead of turning
  // into a reference to task 1.
  EXPECT_EQ(deps_of(reloaded->graph, "2.2"), refs({"2.1"}));
}

TEST(TaskFileTest, SaveAndReload) {
  std::string temp_path = "/tmp/taskweave_task_file_test.json";
  {
    std::ofstream out(temp_path);
    out << kTasks;
  }

  auto doc = TaskFile::load_from_file(temp_path);
  ASSERT_TRUE(doc.has_value());
  (void)RepairEngine::validate_and_fix_dependencies(doc->graph);
  ASSERT_TRUE(TaskFile::save_to_file(*doc, temp_path).has_value());

  auto reloaded = TaskFile::load_from_file(temp_path);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(deps_of(reloaded->graph, "2.3"), refs({"2.2"}));
  EXPECT_FALSE(
      RepairEngine::validate_and_fix_dependencies(reloaded->graph).changed());

  std::remove(temp_path.c_str());
}

TEST(TaskFileTest, MissingFile) {
  auto doc = TaskFile::load_from_file("/nonexistent/tasks.json");
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error(), Error::FileNotFound);
}

TEST(JsonFormatTest, IssueAndSelection) {
  TaskGraph graph;
  add_task(graph, "1");
  add_task(graph, "2");
  depends(graph, "1", {"2"});
  depends(graph, "2", {"1"});

  nlohmann::json issues = GraphValidator::validate(graph);
  ASSERT_EQ(issues.size(), 1);
  EXPECT_EQ(issues[0]["kind"], "circular-dependency");
  EXPECT_EQ(issues[0]["subject"], "1");
  EXPECT_EQ(issues[0]["cycle"], nlohmann::json::array({"1", "2"}));
  EXPECT_FALSE(issues[0].contains("dependency"));

  TaskGraph ready;
  add_task(ready, "4", Status::Pending, Priority::High);
  auto selection = ConcurrentSelector{}.select_next(ready, 2);
  ASSERT_TRUE(selection.has_value());
  nlohmann::json j = *selection;
  EXPECT_EQ(j["requested"], 2);
  EXPECT_EQ(j["tasks"][0]["id"], "4");
  EXPECT_EQ(j["tasks"][0]["priority"], "high");
  EXPECT_EQ(j["tasks"][0]["kind"], "task");
}
