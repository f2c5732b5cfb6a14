#include "workgraph/graph/bulk_operator.hpp"

#include <gtest/gtest.h>

#include "test_utils.hpp"

namespace workgraph {
namespace {

using test::item;
using test::S;
using test::subitem;
using test::T;
using test::with_subtasks;

auto add_request(std::string_view tasks, std::string_view deps,
                 bool dry_run = false) -> BulkRequest {
  return BulkRequest{.task_spec = tasks,
                     .dependency_spec = deps,
                     .kind = BulkKind::Add,
                     .dry_run = dry_run};
}

auto remove_request(std::string_view tasks, std::string_view deps)
    -> BulkRequest {
  return BulkRequest{
      .task_spec = tasks, .dependency_spec = deps, .kind = BulkKind::Remove};
}

TEST(BulkOperatorTest, MissingTargetErrorsEveryPair) {
  auto snapshot = make_snapshot({item(1), item(2)});

  auto report = apply_bulk(snapshot, add_request("1,2", "9"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->summary.errors, 2u);
  EXPECT_EQ(report->summary.valid_operations, 0u);
  EXPECT_EQ(report->summary.operations_performed, 0u);
  ASSERT_EQ(report->operations.size(), 2u);
  for (const auto& op : report->operations) {
    EXPECT_EQ(op.outcome, PairOutcome::Error);
    EXPECT_EQ(op.error, Error::NotFound);
  }
  EXPECT_TRUE(report->changes.empty());
}

TEST(BulkOperatorTest, AddsCrossProductTaskMajor) {
  auto snapshot = make_snapshot({item(1), item(2), item(3), item(4)});

  auto report = apply_bulk(snapshot, add_request("1-2", "3,4"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->summary.valid_operations, 4u);
  EXPECT_EQ(report->summary.errors, 0u);
  ASSERT_EQ(report->operations.size(), 4u);
  EXPECT_EQ(report->operations[0].task, T(1));
  EXPECT_EQ(report->operations[0].dependency, T(3));
  EXPECT_EQ(report->operations[1].dependency, T(4));
  EXPECT_EQ(report->operations[2].task, T(2));

  ASSERT_EQ(report->changes.size(), 2u);
  std::vector<Reference> expected{T(3), T(4)};
  EXPECT_EQ(report->changes[0].owner, T(1));
  EXPECT_EQ(report->changes[0].dependencies, expected);
  EXPECT_EQ(report->changes[1].owner, T(2));
  EXPECT_EQ(report->changes[1].dependencies, expected);
}

TEST(BulkOperatorTest, LaterPairsSeeEarlierChanges) {
  auto snapshot = make_snapshot({item(1), item(2)});

  auto report = apply_bulk(snapshot, add_request("1-2", "1-2"));

  ASSERT_TRUE(report.has_value());
  ASSERT_EQ(report->operations.size(), 4u);
  EXPECT_EQ(report->operations[0].error, Error::SelfDependency);
  EXPECT_EQ(report->operations[1].outcome, PairOutcome::Applied);
  EXPECT_EQ(report->operations[2].error, Error::CircularDependency);
  EXPECT_EQ(report->operations[3].error, Error::SelfDependency);
  EXPECT_EQ(report->summary.valid_operations, 1u);
  EXPECT_EQ(report->summary.errors, 3u);
}

TEST(BulkOperatorTest, ExistingDependencyIsSkipped) {
  auto snapshot = make_snapshot({item(1, {T(3)}), item(2), item(3)});

  auto report = apply_bulk(snapshot, add_request("1-2", "3"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->operations[0].outcome, PairOutcome::SkippedNoOp);
  EXPECT_FALSE(report->operations[0].error);
  EXPECT_EQ(report->operations[1].outcome, PairOutcome::Applied);
  EXPECT_EQ(report->summary.valid_operations, 1u);
  ASSERT_EQ(report->changes.size(), 1u);
  EXPECT_EQ(report->changes[0].owner, T(2));
}

TEST(BulkOperatorTest, SubtaskRanges) {
  auto snapshot = make_snapshot(
      {item(1), with_subtasks(item(4), {subitem(1), subitem(2), subitem(3)})});

  auto report = apply_bulk(snapshot, add_request("4.2-3", "1"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->summary.valid_operations, 2u);
  ASSERT_EQ(report->changes.size(), 2u);
  EXPECT_EQ(report->changes[0].owner, S(4, 2));
  EXPECT_EQ(report->changes[1].owner, S(4, 3));
}

TEST(BulkOperatorTest, MalformedSpecFailsWholeCall) {
  auto snapshot = make_snapshot({item(1), item(2)});

  auto bad_tasks = apply_bulk(snapshot, add_request("2-1", "1"));
  ASSERT_FALSE(bad_tasks.has_value());
  EXPECT_EQ(bad_tasks.error(), Error::MalformedRange);

  auto bad_deps = apply_bulk(snapshot, add_request("1", "x"));
  ASSERT_FALSE(bad_deps.has_value());
  EXPECT_EQ(bad_deps.error(), Error::MalformedRange);
}

TEST(BulkOperatorTest, RangeLimitComesFromRequest) {
  auto snapshot = make_snapshot({item(1)});
  auto request = add_request("1-20", "1");
  request.max_range_size = 10;

  auto report = apply_bulk(snapshot, request);

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), Error::MalformedRange);
}

TEST(BulkOperatorTest, DryRunComputesSameOutcomes) {
  auto snapshot = make_snapshot({item(1), item(2), item(3)});

  auto dry = apply_bulk(snapshot, add_request("1-2", "3", true));
  auto real = apply_bulk(snapshot, add_request("1-2", "3"));

  ASSERT_TRUE(dry.has_value());
  ASSERT_TRUE(real.has_value());
  EXPECT_TRUE(dry->dry_run);
  EXPECT_FALSE(real->dry_run);
  EXPECT_EQ(dry->summary.valid_operations, real->summary.valid_operations);
  EXPECT_EQ(dry->summary.operations_performed, 0u);
  EXPECT_TRUE(snapshot.dependencies_of(T(1))->empty());
}

TEST(BulkOperatorTest, RemoveRange) {
  auto snapshot =
      make_snapshot({item(1, {T(3), T(4)}), item(2, {T(3)}), item(3), item(4)});

  auto report = apply_bulk(snapshot, remove_request("1-2", "3"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->summary.valid_operations, 2u);
  ASSERT_EQ(report->changes.size(), 2u);
  EXPECT_EQ(report->changes[0].dependencies, (std::vector<Reference>{T(4)}));
  EXPECT_TRUE(report->changes[1].dependencies.empty());
}

TEST(BulkOperatorTest, RemoveFromMissingOwnerIsError) {
  auto snapshot = make_snapshot({item(1, {T(2)}), item(2)});

  auto report = apply_bulk(snapshot, remove_request("1,7", "2"));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->operations[0].outcome, PairOutcome::Applied);
  EXPECT_EQ(report->operations[1].outcome, PairOutcome::Error);
  EXPECT_EQ(report->operations[1].error, Error::NotFound);
  EXPECT_EQ(report->summary.errors, 1u);
}

}  // namespace
}  // namespace workgraph
