#include "workgraph/graph/reference.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

#include "test_utils.hpp"

namespace workgraph {
namespace {

using test::S;
using test::T;

TEST(ReferenceTest, ParseId_BareNumberIsTask) {
  auto ref = parse_id("7");
  ASSERT_TRUE(ref.has_value());
  EXPECT_TRUE(ref->is_task());
  EXPECT_EQ(ref->item_id(), 7u);
  EXPECT_FALSE(ref->sub_id().has_value());
}

TEST(ReferenceTest, ParseId_DottedIsSubtask) {
  auto ref = parse_id("7.2");
  ASSERT_TRUE(ref.has_value());
  EXPECT_TRUE(ref->is_subtask());
  EXPECT_EQ(ref->item_id(), 7u);
  EXPECT_EQ(ref->sub_id(), 2u);
}

TEST(ReferenceTest, ParseId_RejectsMalformedInput) {
  for (const char* raw : {"", "0", "abc", "7.", ".2", "-3", "7.0", "7.x",
                          "1.2.3", "12abc"}) {
    auto ref = parse_id(raw);
    ASSERT_FALSE(ref.has_value()) << raw;
    EXPECT_EQ(ref.error(), Error::InvalidArgument) << raw;
  }
}

TEST(ReferenceTest, Normalize_SmallIntegerInSubtaskContextIsSibling) {
  auto ref = normalize_reference(RawReference{std::int64_t{3}}, 5);
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(*ref, S(5, 3));
}

TEST(ReferenceTest, Normalize_LargeIntegerInSubtaskContextIsTask) {
  auto ref = normalize_reference(RawReference{std::int64_t{150}}, 5);
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(*ref, T(150));
}

TEST(ReferenceTest, Normalize_IntegerWithoutContextIsTask) {
  auto ref = normalize_reference(RawReference{std::int64_t{3}}, std::nullopt);
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(*ref, T(3));
}

TEST(ReferenceTest, Normalize_StringsIgnoreSiblingConvention) {
  auto task = normalize_reference(RawReference{std::string{"3"}}, 5);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(*task, T(3));

  auto other = normalize_reference(RawReference{std::string{"4.1"}}, 5);
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(*other, S(4, 1));
}

TEST(ReferenceTest, Normalize_RejectsNonPositiveIntegers) {
  EXPECT_FALSE(normalize_reference(RawReference{std::int64_t{0}}, 5));
  EXPECT_FALSE(normalize_reference(RawReference{std::int64_t{-1}}, std::nullopt));
  EXPECT_FALSE(
      normalize_reference(RawReference{std::int64_t{1} << 40}, std::nullopt));
}

TEST(ReferenceTest, ToString_IsCanonical) {
  EXPECT_EQ(T(7).to_string(), "7");
  EXPECT_EQ(S(7, 2).to_string(), "7.2");
  EXPECT_EQ(fmt::format("{}", S(12, 3)), "12.3");
}

TEST(ReferenceTest, Ordering_TasksBeforeSubtasks) {
  std::vector<Reference> refs{S(2, 1), T(5), T(1), S(1, 3), S(1, 2)};
  std::ranges::sort(refs);

  std::vector<Reference> expected{T(1), T(5), S(1, 2), S(1, 3), S(2, 1)};
  EXPECT_EQ(refs, expected);
  EXPECT_LT(T(1000), S(1, 1));
}

TEST(ReferenceTest, Equality_TaskNeverEqualsSubtask) {
  EXPECT_NE(T(1), S(1, 1));
  EXPECT_EQ(S(3, 4), S(3, 4));
}

TEST(ReferenceTest, Hash_DistinguishesTaskAndSubtask) {
  std::unordered_set<Reference> set{T(1), S(1, 1), T(1), S(1, 1), S(1, 2)};
  EXPECT_EQ(set.size(), 3u);
  EXPECT_TRUE(set.contains(S(1, 2)));
}

}  // namespace
}  // namespace workgraph
