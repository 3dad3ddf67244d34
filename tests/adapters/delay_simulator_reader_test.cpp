// File: tests/adapters/delay_simulator_reader_test.cpp
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/adapters/delay/delay_simulator_reader.hpp"

namespace ts::test {

class DelaySimulatorReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    inner = std::make_shared<ScriptedReader>(results("events", events({})));
  }

  DelaySimulatorReader make_reader() {
    return DelaySimulatorReader(inner, [this] { return now; });
  }

  std::shared_ptr<ScriptedReader> inner;
  double now{10.0};
};

TEST_F(DelaySimulatorReaderTest, HoldsResultsUntilTheirEndTime) {
  inner->then_data(results("events", events({{0.25, 1.0}, {1.0, 2.0}})));
  DelaySimulatorReader reader = make_reader();
  ASSERT_TRUE(reader.open().ok());

  auto early = reader.read_next();
  ASSERT_TRUE(early.ok());
  EXPECT_TRUE(early->empty());

  now = 10.5;
  auto still_early = reader.read_next();
  ASSERT_TRUE(still_early.ok());
  EXPECT_TRUE(still_early->empty());
  EXPECT_EQ(inner->read_count(), 1);

  now = 11.0;
  auto due = reader.read_next();
  ASSERT_TRUE(due.ok());
  ASSERT_EQ(due->count("events"), 1u);
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(*due->at("events")).event_count(), 2u);
}

TEST_F(DelaySimulatorReaderTest, ReleasesImmediatelyWhenAlreadyDue) {
  inner->then_data(results("events", events({{0.5, 1.0}})));
  DelaySimulatorReader reader = make_reader();
  ASSERT_TRUE(reader.open().ok());

  now = 20.0;
  auto due = reader.read_next();
  ASSERT_TRUE(due.ok());
  EXPECT_EQ(due->count("events"), 1u);
}

TEST_F(DelaySimulatorReaderTest, EmptyReadsAndErrorsPassThrough) {
  inner->then_empty().then_error(Status::io_error("disk"));
  DelaySimulatorReader reader = make_reader();
  ASSERT_TRUE(reader.open().ok());

  auto empty = reader.read_next();
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty->empty());

  EXPECT_EQ(reader.read_next().status().code(), Status::Code::kIoError);
  EXPECT_TRUE(reader.read_next().status().is_eof());
}

TEST_F(DelaySimulatorReaderTest, ForwardsLifecycleToTheWrappedReader) {
  DelaySimulatorReader reader = make_reader();
  ASSERT_TRUE(reader.open().ok());
  reader.close();
  EXPECT_EQ(inner->open_count(), 1);
  EXPECT_EQ(inner->close_count(), 1);

  auto initial = reader.get_initial();
  ASSERT_TRUE(initial.ok());
  EXPECT_EQ(initial->count("events"), 1u);
  EXPECT_EQ(reader.name(), "DelaySimulatorReader(ScriptedReader)");
  EXPECT_EQ(&reader.wrapped(), inner.get());
}

TEST_F(DelaySimulatorReaderTest, OpenRestartsTheClockAndDropsTheStash) {
  inner->then_data(results("events", events({{1.0, 1.0}}))).then_data(results("events", events({{0.5, 2.0}})));
  DelaySimulatorReader reader = make_reader();
  ASSERT_TRUE(reader.open().ok());
  ASSERT_TRUE(reader.read_next().ok());

  now = 100.0;
  ASSERT_TRUE(reader.open().ok());
  auto held = reader.read_next();
  ASSERT_TRUE(held.ok());
  EXPECT_TRUE(held->empty());

  now = 100.5;
  auto due = reader.read_next();
  ASSERT_TRUE(due.ok());
  EXPECT_EQ(dynamic_cast<const NumericEventList&>(*due->at("events")), NumericEventList({{0.5, 2.0}}));
  EXPECT_EQ(inner->read_count(), 2);
}

TEST(DelaySimulatorReaderCtorTest, NeedsAReader) {
  EXPECT_THROW(DelaySimulatorReader(nullptr), std::invalid_argument);
}

}  // namespace ts::test
