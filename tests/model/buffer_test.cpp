// File: tests/model/buffer_test.cpp
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/model/buffer.hpp"

namespace ts::test {

class BufferTest : public ::testing::Test {
 protected:
  void SetUp() override {
    buffer = std::make_unique<Buffer>(events({{1.0, 10.0}, {2.0, 20.0}, {3.0, 30.0}}), 0.25);
  }

  std::unique_ptr<Buffer> buffer;
};

TEST_F(BufferTest, NeedsData) {
  EXPECT_THROW(Buffer(nullptr), std::invalid_argument);
}

TEST_F(BufferTest, ConvertsBetweenClocks) {
  EXPECT_DOUBLE_EQ(buffer->raw_to_reference(2.25), 2.0);
  EXPECT_DOUBLE_EQ(buffer->reference_to_raw(2.0), 2.25);
  EXPECT_FALSE(buffer->raw_to_reference(OptionalTime{}).has_value());
  EXPECT_FALSE(buffer->reference_to_raw(OptionalTime{}).has_value());
}

TEST_F(BufferTest, DriftIsReplacedNotAccumulated) {
  buffer->set_clock_drift(-0.5);
  buffer->set_clock_drift(0.1);
  EXPECT_DOUBLE_EQ(buffer->clock_drift(), 0.1);
  EXPECT_DOUBLE_EQ(buffer->reference_to_raw(1.0), 1.1);
}

TEST_F(BufferTest, TypedAccess) {
  ASSERT_NE(buffer->data_as<NumericEventList>(), nullptr);
  EXPECT_EQ(buffer->data_as<SignalChunk>(), nullptr);
  EXPECT_EQ(buffer->data_as<NumericEventList>()->event_count(), 3u);
}

TEST_F(BufferTest, CopyTimeRangeNeverMutates) {
  const auto before = buffer->data().copy();
  (void)buffer->data().copy_time_range(1.5, 2.5);
  (void)buffer->data().copy_time_range(std::nullopt, std::nullopt);
  EXPECT_TRUE(buffer->data().equals(*before));
}

}  // namespace ts::test
