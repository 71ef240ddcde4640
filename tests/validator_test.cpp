#include "taskweave/graph/validator.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

#include <algorithm>

using namespace taskweave;
using namespace taskweave::test;

namespace {

[[nodiscard]] auto count_kind(const std::vector<Issue>& issues, IssueKind kind)
    -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count(issues, kind, &Issue::kind));
}

}  // namespace

class ValidatorTest : public ::testing::Test {
protected:
  TaskGraph graph_;
};

TEST_F(ValidatorTest, EmptyGraphIsValid) {
  EXPECT_TRUE(GraphValidator::validate(graph_).empty());
}

TEST_F(ValidatorTest, HealthyGraphIsValid) {
  add_task(graph_, "1", Status::Done);
  add_task(graph_, "2");
  add_subtask(graph_, "2", "1");
  add_subtask(graph_, "2", "2");
  depends(graph_, "2", {"1"});
  depends(graph_, "2.2", {"1"});  // sibling 2.1

  EXPECT_TRUE(GraphValidator::validate(graph_).empty());
  EXPECT_EQ(deps_of(graph_, "2.2"), refs({"2.1"}));
}

TEST_F(ValidatorTest, MissingDependency) {
  add_task(graph_, "1");
  depends(graph_, "1", {"42"});

  auto issues = GraphValidator::validate(graph_);
  ASSERT_EQ(issues.size(), 1);
  EXPECT_EQ(issues[0].kind, IssueKind::MissingDependency);
  EXPECT_EQ(issues[0].subject, ref("1"));
  EXPECT_EQ(issues[0].dependency, ref("42"));
  EXPECT_FALSE(issues[0].reason.empty());
}

TEST_F(ValidatorTest, MalformedReferenceIsMissingDependency) {
  add_task(graph_, "1");
  depends(graph_, "1", {"1.2.3"});

  auto issues = GraphValidator::validate(graph_);
  ASSERT_EQ(issues.size(), 1);
  EXPECT_EQ(issues[0].kind, IssueKind::MissingDependency);
}

TEST_F(ValidatorTest, SelfDependency) {
  add_task(graph_, "1");
  add_subtask(graph_, "1", "1");
  depends(graph_, "1", {"1"});
  depends(graph_, "1.1", {"1.1"});

  auto issues = GraphValidator::validate(graph_);
  EXPECT_EQ(count_kind(issues, IssueKind::SelfDependency), 2);
  EXPECT_EQ(count_kind(issues, IssueKind::CircularDependency), 0);
}

TEST_F(ValidatorTest, StatusInversion) {
  add_task(graph_, "1", Status::Pending);
  add_task(graph_, "2", Status::Done);
  depends(graph_, "2", {"1"});

  auto issues = GraphValidator::validate(graph_);
  ASSERT_EQ(issues.size(), 1);
  EXPECT_EQ(issues[0].kind, IssueKind::StatusInversion);
  EXPECT_EQ(issues[0].subject, ref("2"));
}

TEST_F(ValidatorTest, ThreeNodeCycleReportedOnce) {
  add_task(graph_, "1");
  add_task(graph_, "2");
  add_task(graph_, "3");
  depends(graph_, "1", {"2"});
  depends(graph_, "2", {"3"});
  depends(graph_, "3", {"1"});

  auto issues = GraphValidator::validate(graph_);
  ASSERT_EQ(issues.size(), 1);
  EXPECT_EQ(issues[0].kind, IssueKind::CircularDependency);

  auto members = issues[0].cycle;
  std::ranges::sort(members);
  EXPECT_EQ(members, refs({"1", "2", "3"}));
  EXPECT_NE(issues[0].reason.find("1 -> 2 -> 3 -> 1"), std::string::npos);
}

TEST_F(ValidatorTest, CycleThroughSubtasks) {
  add_task(graph_, "1");
  add_subtask(graph_, "1", "1");
  add_subtask(graph_, "1", "2");
  depends(graph_, "1.1", {"2"});
  depends(graph_, "1.2", {"1"});

  auto issues = GraphValidator::validate(graph_);
  ASSERT_EQ(count_kind(issues, IssueKind::CircularDependency), 1);
  auto members = issues[0].cycle;
  std::ranges::sort(members);
  EXPECT_EQ(members, refs({"1.1", "1.2"}));
}

TEST_F(ValidatorTest, DisjointCyclesEachReported) {
  for (auto id : {"1", "2", "3", "4"}) add_task(graph_, id);
  depends(graph_, "1", {"2"});
  depends(graph_, "2", {"1"});
  depends(graph_, "3", {"4"});
  depends(graph_, "4", {"3"});

  auto issues = GraphValidator::validate(graph_);
  EXPECT_EQ(count_kind(issues, IssueKind::CircularDependency), 2);
}

TEST_F(ValidatorTest, DiamondIsNotACycle) {
  for (auto id : {"1", "2", "3", "4"}) add_task(graph_, id);
  depends(graph_, "4", {"2", "3"});
  depends(graph_, "2", {"1"});
  depends(graph_, "3", {"1"});

  EXPECT_TRUE(GraphValidator::validate(graph_).empty());
}

TEST_F(ValidatorTest, DuplicateEdgesDoNotProduceExtraCycleIssues) {
  add_task(graph_, "1");
  add_task(graph_, "2");
  depends(graph_, "1", {"2", "2"});
  depends(graph_, "2", {"1"});

  auto issues = GraphValidator::validate(graph_);
  EXPECT_EQ(count_kind(issues, IssueKind::CircularDependency), 1);
}

TEST_F(ValidatorTest, ValidateDoesNotMutate) {
  add_task(graph_, "1");
  depends(graph_, "1", {"9", "9"});
  auto before = deps_of(graph_, "1");
  (void)GraphValidator::validate(graph_);
  EXPECT_EQ(deps_of(graph_, "1"), before);
}

TEST_F(ValidatorTest, Summarize) {
  add_task(graph_, "1");
  add_task(graph_, "2");
  add_subtask(graph_, "2", "1");
  depends(graph_, "2", {"1"});
  depends(graph_, "2.1", {"1", "7"});

  auto summary = GraphValidator::summarize(graph_);
  EXPECT_EQ(summary.tasks, 2);
  EXPECT_EQ(summary.subtasks, 1);
  EXPECT_EQ(summary.dependencies, 3);
}
