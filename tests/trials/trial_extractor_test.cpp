// File: tests/trials/trial_extractor_test.cpp
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/trials/trial_extractor.hpp"

namespace ts::test {

namespace {

// Records what it saw, then adds one enhancement.
class RecordingEnhancer final : public TrialEnhancer {
 public:
  explicit RecordingEnhancer(std::string value_name) : value_name_(std::move(value_name)) {}

  Status enhance(Trial& trial, int trial_number, const ValueMap& experiment_info, const ValueMap& subject_info) override {
    trial_numbers.push_back(trial_number);
    trial.add_enhancement(value_name_, Value(static_cast<int>(experiment_info.size() + subject_info.size())));
    return Status::ok_status();
  }
  std::string name() const override { return "RecordingEnhancer"; }

  std::vector<int> trial_numbers;

 private:
  std::string value_name_;
};

class FailingEnhancer final : public TrialEnhancer {
 public:
  explicit FailingEnhancer(bool throws) : throws_(throws) {}

  Status enhance(Trial&, int, const ValueMap&, const ValueMap&) override {
    if (throws_) throw std::runtime_error("enhancer blew up");
    return Status::internal("enhancer said no");
  }
  std::string name() const override { return "FailingEnhancer"; }

 private:
  bool throws_;
};

}  // namespace

class TrialExtractorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    wrt_buffer = std::make_shared<Buffer>(events({{1.5, 42.0}, {2.5, 42.0}, {3.5, 42.0}}));
    foo_buffer = std::make_shared<Buffer>(events({{1.2, 0.0}, {1.3, 0.0}, {2.2, 0.0}}));
  }

  TrialExtractor make_extractor(std::vector<EnhancerEntry> enhancers = {}) {
    return TrialExtractor(wrt_buffer, 42.0, 0, {{"foo", foo_buffer}}, std::move(enhancers));
  }

  std::shared_ptr<Buffer> wrt_buffer;
  std::shared_ptr<Buffer> foo_buffer;
};

TEST_F(TrialExtractorTest, NeedsNumericWrtEvents) {
  EXPECT_THROW(TrialExtractor(nullptr, 42.0), std::invalid_argument);
}

TEST_F(TrialExtractorTest, AlignsDataToWrtTime) {
  const TrialExtractor extractor = make_extractor();
  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 1, {}, {});

  EXPECT_EQ(trial.wrt_time, 1.5);
  const std::vector<double> times = trial.numeric_events.at("foo").get_times();
  ASSERT_EQ(times.size(), 2u);
  EXPECT_NEAR(times[0], -0.3, 1e-12);
  EXPECT_NEAR(times[1], -0.2, 1e-12);
}

TEST_F(TrialExtractorTest, MissingWrtEventLeavesTimesAlone) {
  const TrialExtractor extractor = make_extractor();
  Trial trial(2.0, 2.4);
  extractor.populate_trial(trial, 0, {}, {});

  EXPECT_EQ(trial.wrt_time, 0.0);
  EXPECT_EQ(trial.numeric_events.at("foo").get_times(), (std::vector<double>{2.2}));
}

TEST_F(TrialExtractorTest, EarliestWrtEventWins) {
  const TrialExtractor extractor = make_extractor();
  Trial trial(0.0, std::nullopt);
  extractor.populate_trial(trial, 0, {}, {});
  EXPECT_EQ(trial.wrt_time, 1.5);
  EXPECT_EQ(trial.numeric_events.at("foo").event_count(), 3u);
}

TEST_F(TrialExtractorTest, EmptyRangeStillAddsEmptyData) {
  const TrialExtractor extractor = make_extractor();
  Trial trial(5.0, 6.0);
  extractor.populate_trial(trial, 0, {}, {});
  ASSERT_EQ(trial.numeric_events.count("foo"), 1u);
  EXPECT_TRUE(trial.numeric_events.at("foo").empty());
}

TEST_F(TrialExtractorTest, DriftIsAppliedPerBuffer) {
  foo_buffer->set_clock_drift(0.1);
  const TrialExtractor extractor = make_extractor();
  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 0, {}, {});

  // foo raw [1.1, 2.1) picks up 1.2 and 1.3; wrt 1.5 is raw 1.6 there.
  const std::vector<double> times = trial.numeric_events.at("foo").get_times();
  ASSERT_EQ(times.size(), 2u);
  EXPECT_NEAR(times[0], -0.4, 1e-12);
  EXPECT_NEAR(times[1], -0.3, 1e-12);
}

TEST_F(TrialExtractorTest, SignalsAreCutAndAligned) {
  std::vector<double> samples;
  for (int i = 0; i < 40; ++i) samples.push_back(i);
  auto lfp = std::make_shared<Buffer>(
      std::make_unique<SignalChunk>(samples, 10.0, 0.0, std::vector<ChannelId>{ChannelId(std::int64_t{0})}));
  TrialExtractor extractor(wrt_buffer, 42.0, 0, {{"lfp", lfp}});

  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 0, {}, {});
  const SignalChunk& cut = trial.signals.at("lfp");
  EXPECT_EQ(cut.sample_count(), 10u);
  ASSERT_TRUE(cut.first_sample_time().has_value());
  EXPECT_DOUBLE_EQ(*cut.first_sample_time(), -0.5);
}

//-------------------------------------------------------------------------
// Enhancers
//-------------------------------------------------------------------------

TEST_F(TrialExtractorTest, EnhancersRunInOrderWithInfo) {
  auto first = std::make_shared<RecordingEnhancer>("first");
  auto second = std::make_shared<RecordingEnhancer>("second");
  const TrialExtractor extractor = make_extractor({{first, std::nullopt}, {second, std::nullopt}});

  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 7, {{"lab", Value("x")}}, {{"id", Value(1)}, {"age", Value(3)}});

  EXPECT_EQ(first->trial_numbers, (std::vector<int>{7}));
  EXPECT_EQ(trial.get_enhancement("first"), Value(3));
  EXPECT_EQ(trial.enhancement_categories.at("value"), (std::vector<std::string>{"first", "second"}));
}

TEST_F(TrialExtractorTest, FailingEnhancersAreSkipped) {
  LogCapture capture;
  auto after = std::make_shared<RecordingEnhancer>("after");
  const TrialExtractor extractor = make_extractor({{std::make_shared<FailingEnhancer>(true), std::nullopt},
                                                   {std::make_shared<FailingEnhancer>(false), std::nullopt},
                                                   {after, std::nullopt}});

  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 3, {}, {});

  EXPECT_EQ(after->trial_numbers, (std::vector<int>{3}));
  EXPECT_TRUE(capture.contains(log::Level::kError, "enhancer blew up"));
  EXPECT_TRUE(capture.contains(log::Level::kError, "enhancer said no"));
}

TEST_F(TrialExtractorTest, WhenExpressionGatesEnhancers) {
  auto marker = std::make_shared<RecordingEnhancer>("marker");
  auto gated = std::make_shared<RecordingEnhancer>("gated");
  auto skipped = std::make_shared<RecordingEnhancer>("skipped");

  auto when_marker = TrialExpression::parse("marker == 0", Value(false));
  auto when_never = TrialExpression::parse("missing > 1", Value(false));
  ASSERT_TRUE(when_marker.ok());
  ASSERT_TRUE(when_never.ok());

  const TrialExtractor extractor = make_extractor(
      {{marker, std::nullopt}, {gated, when_marker.take_value()}, {skipped, when_never.take_value()}});

  LogCapture capture;
  Trial trial(1.0, 2.0);
  extractor.populate_trial(trial, 0, {}, {});

  EXPECT_EQ(gated->trial_numbers.size(), 1u);
  EXPECT_TRUE(skipped->trial_numbers.empty());
  EXPECT_TRUE(trial.get_enhancement("skipped").is_null());
}

TEST_F(TrialExtractorTest, DiscardBeforeTrimsEveryBuffer) {
  TrialExtractor extractor = make_extractor();
  extractor.discard_before(2.0);
  EXPECT_EQ(wrt_buffer->data_as<NumericEventList>()->get_times(), (std::vector<double>{2.5, 3.5}));
  EXPECT_EQ(foo_buffer->data_as<NumericEventList>()->get_times(), (std::vector<double>{2.2}));
}

}  // namespace ts::test
