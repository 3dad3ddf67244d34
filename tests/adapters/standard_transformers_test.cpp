// File: tests/adapters/standard_transformers_test.cpp
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/adapters/transformers/standard_transformers.hpp"

namespace ts::test {

namespace {

std::unique_ptr<SignalChunk> two_channel_signal() {
  return std::make_unique<SignalChunk>(std::vector<double>{0.0, 1.0, 2.0, 3.0}, 10.0, 0.0,
                                       std::vector<ChannelId>{ChannelId("a"), ChannelId("b")});
}

std::unique_ptr<NumericEventList> ramp() {
  std::vector<std::vector<double>> rows;
  for (int i = 0; i < 100; ++i) rows.push_back({static_cast<double>(i), 10.0 * i});
  return events(rows);
}

}  // namespace

//-------------------------------------------------------------------------
// OffsetThenGain
//-------------------------------------------------------------------------

TEST(OffsetThenGainTest, EventValuesAreOffsetThenScaled) {
  const OffsetThenGain transformer(1.0, 2.0);
  auto out = transformer.transform(events({{0.0, 1.0}, {1.0, 2.0}}));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(**out), NumericEventList({{0.0, 4.0}, {1.0, 6.0}}));
}

TEST(OffsetThenGainTest, OnlyTheChosenValueColumnChanges) {
  const OffsetThenGain transformer(-10.0, 0.5, 1);
  auto out = transformer.transform(events({{0.0, 1.0, 30.0}}));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(**out), NumericEventList({{0.0, 1.0, 10.0}}));
}

TEST(OffsetThenGainTest, SignalsChangeOnEveryChannel) {
  const OffsetThenGain transformer(1.0, -1.0);
  auto out = transformer.transform(two_channel_signal());
  ASSERT_TRUE(out.ok());
  const auto& signal = dynamic_cast<const SignalChunk&>(**out);
  EXPECT_EQ(signal.raw(), (std::vector<double>{-1.0, -2.0, -3.0, -4.0}));
  EXPECT_EQ(signal.first_sample_time(), 0.0);
}

TEST(OffsetThenGainTest, NoDataIsAnError) {
  const OffsetThenGain transformer;
  EXPECT_EQ(transformer.transform(nullptr).status().code(), Status::Code::kInvalidArgument);
  EXPECT_EQ(transformer.name(), "OffsetThenGain");
}

//-------------------------------------------------------------------------
// FilterRange
//-------------------------------------------------------------------------

TEST(FilterRangeTest, KeepsValuesInHalfOpenRange) {
  const FilterRange transformer(250.0, 750.0);
  auto out = transformer.transform(ramp());
  ASSERT_TRUE(out.ok());
  const auto& kept = dynamic_cast<const NumericEventList&>(**out);
  ASSERT_EQ(kept.event_count(), 50u);
  EXPECT_EQ(kept.time_at(0), 25.0);
  EXPECT_EQ(kept.time_at(49), 74.0);
}

TEST(FilterRangeTest, OpenEndsAreUnbounded) {
  auto below = FilterRange(std::nullopt, 100.0).transform(ramp());
  ASSERT_TRUE(below.ok());
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(**below).event_count(), 10u);

  auto all = FilterRange().transform(ramp());
  ASSERT_TRUE(all.ok());
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(**all).event_count(), 100u);
}

TEST(FilterRangeTest, SignalsPassThroughWithWarning) {
  LogCapture capture;
  auto out = FilterRange(0.0, 1.0).transform(two_channel_signal());
  ASSERT_TRUE(out.ok());
  EXPECT_TRUE((*out)->equals(*two_channel_signal()));
  EXPECT_TRUE(capture.contains(log::Level::kWarn, "FilterRange doesn't know how to apply"));
}

}  // namespace ts::test
