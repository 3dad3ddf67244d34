// File: tests/model/numeric_event_list_test.cpp
#include <cmath>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/model/signal_chunk.hpp"

namespace ts::test {

namespace {

// [[t, 10t] for t in 0..100)
NumericEventList ramp_events() {
  std::vector<std::vector<double>> rows;
  for (int t = 0; t < 100; ++t) rows.push_back({static_cast<double>(t), 10.0 * t});
  return NumericEventList(rows);
}

}  // namespace

TEST(NumericEventListTest, RejectsRaggedRowsAndTooFewColumns) {
  EXPECT_THROW(NumericEventList(std::vector<std::vector<double>>{{0, 1}, {1, 2, 3}}), std::invalid_argument);
  EXPECT_THROW(NumericEventList(std::size_t{1}), std::invalid_argument);
}

TEST(NumericEventListTest, CountsAndAccessors) {
  const NumericEventList list({{0.0, 10.0, 100.0}, {1.0, 11.0, 101.0}});
  EXPECT_EQ(list.event_count(), 2u);
  EXPECT_EQ(list.values_per_event(), 2u);
  EXPECT_EQ(list.time_at(1), 1.0);
  EXPECT_EQ(list.value_at(1, 1), 101.0);
  EXPECT_EQ(list.get_times(), (std::vector<double>{0.0, 1.0}));
  EXPECT_EQ(list.get_end_time(), 1.0);
}

TEST(NumericEventListTest, EmptyListHasNoEndTime) {
  const NumericEventList list;
  EXPECT_TRUE(list.empty());
  EXPECT_FALSE(list.get_end_time().has_value());
}

TEST(NumericEventListTest, ValueIndexPastLastColumnThrows) {
  const NumericEventList list({{0.0, 10.0}});
  EXPECT_THROW((void)list.get_times_of(10.0, 1), std::out_of_range);
  EXPECT_THROW((void)list.get_values(std::nullopt, std::nullopt, 5), std::out_of_range);
  EXPECT_THROW((void)list.value_at(0, 1), std::out_of_range);
}

TEST(NumericEventListTest, CopyTimeRangeIsHalfOpen) {
  const NumericEventList list = ramp_events();
  const auto range = list.copy_time_range(10.0, 20.0);
  const auto* events = dynamic_cast<const NumericEventList*>(range.get());
  ASSERT_NE(events, nullptr);
  EXPECT_EQ(events->event_count(), 10u);
  EXPECT_EQ(events->time_at(0), 10.0);
  EXPECT_EQ(events->time_at(9), 19.0);
}

TEST(NumericEventListTest, CopyTimeRangePartitionsTheTimeline) {
  const NumericEventList list = ramp_events();
  for (double split : {-1.0, 0.0, 33.3, 50.0, 99.0, 150.0}) {
    const auto before = list.copy_time_range(std::nullopt, split);
    const auto after = list.copy_time_range(split, std::nullopt);
    auto joined = before->copy();
    ASSERT_TRUE(joined->append(*after).ok());
    EXPECT_TRUE(joined->equals(list)) << "split at " << split;
  }
}

TEST(NumericEventListTest, DiscardBeforeOnCopyLeavesOriginal) {
  const NumericEventList list = ramp_events();
  auto copy = list.copy();
  copy->discard_before(50.0);
  EXPECT_EQ(list.event_count(), 100u);
  EXPECT_EQ(dynamic_cast<NumericEventList&>(*copy).event_count(), 50u);
}

TEST(NumericEventListTest, DiscardBeforeIsIdempotent) {
  NumericEventList once = ramp_events();
  once.discard_before(42.5);
  NumericEventList twice = once;
  twice.discard_before(42.5);
  EXPECT_EQ(once, twice);
  EXPECT_EQ(once.time_at(0), 43.0);
}

TEST(NumericEventListTest, AppendChecksKindAndShape) {
  NumericEventList list({{0.0, 1.0}});
  EXPECT_TRUE(list.append(NumericEventList({{1.0, 2.0}})).ok());
  EXPECT_TRUE(list.append(NumericEventList(std::size_t{3})).ok()) << "empty other is always accepted";

  const Status shape = list.append(NumericEventList({{2.0, 3.0, 4.0}}));
  EXPECT_EQ(shape.code(), Status::Code::kInvalidArgument);

  const SignalChunk signal({1.0}, 10.0, 0.0, {ChannelId(std::int64_t{0})});
  EXPECT_EQ(list.append(signal).code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(list.event_count(), 2u);
}

TEST(NumericEventListTest, ShiftTimesMovesOnlyTimes) {
  NumericEventList list({{1.0, 5.0}, {2.0, 6.0}});
  list.shift_times(-1.5);
  EXPECT_EQ(list.get_times(), (std::vector<double>{-0.5, 0.5}));
  EXPECT_EQ(list.get_values(), (std::vector<double>{5.0, 6.0}));
}

TEST(NumericEventListTest, GetTimesOfMatchesValueInRange) {
  const NumericEventList list({{1.0, 1010.0}, {2.0, 42.0}, {3.0, 1010.0}, {4.0, 1010.0}});
  EXPECT_EQ(list.get_times_of(1010.0), (std::vector<double>{1.0, 3.0, 4.0}));
  EXPECT_EQ(list.get_times_of(1010.0, 0, 2.0, 4.0), (std::vector<double>{3.0}));
}

TEST(NumericEventListTest, CopyValueRangeKeepsHalfOpenValues) {
  const NumericEventList filtered = ramp_events().copy_value_range(250.0, 750.0);
  const std::vector<double> times = filtered.get_times();
  ASSERT_EQ(times.size(), 50u);
  EXPECT_EQ(times.front(), 25.0);
  EXPECT_EQ(times.back(), 74.0);
}

TEST(NumericEventListTest, ApplyOffsetThenGain) {
  NumericEventList list({{0.0, 10.0, 1.0}, {1.0, 20.0, 2.0}});
  list.apply_offset_then_gain(-10.0, 0.5, 0);
  EXPECT_EQ(list.get_values(std::nullopt, std::nullopt, 0), (std::vector<double>{0.0, 5.0}));
  EXPECT_EQ(list.get_values(std::nullopt, std::nullopt, 1), (std::vector<double>{1.0, 2.0}));
}

TEST(NumericEventListTest, EmptyListsCompareEqualRegardlessOfColumns) {
  EXPECT_EQ(NumericEventList(std::size_t{2}), NumericEventList(std::size_t{4}));
  EXPECT_FALSE(NumericEventList({{0.0, 1.0}}) == NumericEventList({{0.0, 2.0}}));
}

}  // namespace ts::test
