// File: tests/io/reader_router_test.cpp
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/io/reader_router.hpp"

namespace ts::test {

namespace {

class ThrowingTransformer final : public Transformer {
 public:
  Result<std::unique_ptr<BufferData>> transform(std::unique_ptr<BufferData>) const override {
    throw std::runtime_error("no way");
  }
  std::string name() const override { return "ThrowingTransformer"; }
};

class ShiftTransformer final : public Transformer {
 public:
  explicit ShiftTransformer(double shift) : shift_(shift) {}
  Result<std::unique_ptr<BufferData>> transform(std::unique_ptr<BufferData> data) const override {
    data->shift_times(shift_);
    return Result<std::unique_ptr<BufferData>>::ok(std::move(data));
  }
  std::string name() const override { return "ShiftTransformer"; }

 private:
  double shift_;
};

}  // namespace

class ReaderRouterTest : public ::testing::Test {
 protected:
  std::shared_ptr<ScriptedReader> make_reader() {
    return std::make_shared<ScriptedReader>(results("events", events({})));
  }

  std::shared_ptr<ReaderRouter> make_router(std::shared_ptr<ScriptedReader> reader,
                                            std::vector<std::shared_ptr<const Transformer>> transformers = {},
                                            std::optional<ReaderSyncConfig> sync = std::nullopt) {
    buffer = std::make_shared<Buffer>(events({}));
    std::vector<ReaderRoute> routes{ReaderRoute{"events", "events", std::move(transformers)}};
    return std::make_shared<ReaderRouter>("test", std::move(reader), std::move(routes),
                                          std::map<BufferName, std::shared_ptr<Buffer>>{{"events", buffer}}, 3,
                                          std::move(sync), registry);
  }

  [[nodiscard]] std::size_t buffered_events() const {
    return buffer->data_as<NumericEventList>()->event_count();
  }

  std::shared_ptr<ReaderSyncRegistry> registry = std::make_shared<ReaderSyncRegistry>("ref");
  std::shared_ptr<Buffer> buffer;
};

//-------------------------------------------------------------------------
// Routing
//-------------------------------------------------------------------------

TEST_F(ReaderRouterTest, NeedsAReader) {
  EXPECT_THROW(ReaderRouter("test", nullptr, {}, {}), std::invalid_argument);
}

TEST_F(ReaderRouterTest, RoutesResultsIntoBuffers) {
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0}}))).then_data(results("events", events({{2.0, 20.0}})));
  auto router = make_router(reader);

  EXPECT_TRUE(router->route_next());
  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffered_events(), 2u);
  EXPECT_EQ(router->max_buffer_time(), 2.0);
}

TEST_F(ReaderRouterTest, EmptyReadIsNotAnError) {
  auto reader = make_reader();
  reader->then_empty();
  auto router = make_router(reader);

  EXPECT_FALSE(router->route_next());
  EXPECT_TRUE(router->still_going());
}

TEST_F(ReaderRouterTest, UnknownResultNamesAreIgnored) {
  auto reader = make_reader();
  reader->then_data(results("other", events({{1.0, 10.0}})));
  auto router = make_router(reader);

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffered_events(), 0u);
}

TEST_F(ReaderRouterTest, TransformersRunInOrder) {
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0}})));
  auto router = make_router(reader, {std::make_shared<ShiftTransformer>(1.0), std::make_shared<ShiftTransformer>(0.5)});

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffer->data_as<NumericEventList>()->time_at(0), 2.5);
}

TEST_F(ReaderRouterTest, TransformerFailureDropsOnlyThatData) {
  LogCapture capture;
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0}})));
  auto router = make_router(reader, {std::make_shared<ThrowingTransformer>()});

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffered_events(), 0u);
  EXPECT_TRUE(router->still_going());
  EXPECT_TRUE(capture.contains(log::Level::kError, "ThrowingTransformer"));
}

TEST_F(ReaderRouterTest, AppendMismatchIsLoggedAndSkipped) {
  LogCapture capture;
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0, 100.0}}))).then_data(results("events", events({{2.0, 20.0}})));
  auto router = make_router(reader);

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffered_events(), 0u);
  EXPECT_TRUE(capture.contains(log::Level::kError, "can't append"));

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(buffered_events(), 1u);
}

TEST_F(ReaderRouterTest, ResultsAreCopiedNotShared) {
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0}})));

  auto second = std::make_shared<Buffer>(events({}));
  std::vector<ReaderRoute> routes{ReaderRoute{"events", "a", {}}, ReaderRoute{"events", "b", {}}};
  auto first = std::make_shared<Buffer>(events({}));
  ReaderRouter router("test", reader, std::move(routes),
                      std::map<BufferName, std::shared_ptr<Buffer>>{{"a", first}, {"b", second}});

  EXPECT_TRUE(router.route_next());
  first->data().discard_before(5.0);
  EXPECT_EQ(second->data_as<NumericEventList>()->event_count(), 1u);
}

//-------------------------------------------------------------------------
// Circuit breaker
//-------------------------------------------------------------------------

TEST_F(ReaderRouterTest, ErrorDisablesReaderAndKeepsEarlierData) {
  LogCapture capture;
  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 10.0}})))
      .then_data(results("events", events({{2.0, 20.0}})))
      .then_error(Status::io_error("device unplugged"))
      .then_data(results("events", events({{3.0, 30.0}})));
  auto router = make_router(reader);

  EXPECT_TRUE(router->route_next());
  EXPECT_TRUE(router->route_next());
  EXPECT_FALSE(router->route_next());

  EXPECT_FALSE(router->still_going());
  EXPECT_EQ(router->state().code, RouterState::Code::kFaulted);
  EXPECT_NE(router->state().reason.find("device unplugged"), std::string::npos);
  EXPECT_EQ(buffered_events(), 2u);
  EXPECT_TRUE(capture.contains(log::Level::kWarn, "disabled"));

  EXPECT_FALSE(router->route_next());
  EXPECT_EQ(reader->read_count(), 3);
  EXPECT_EQ(buffered_events(), 2u);
}

TEST_F(ReaderRouterTest, ThrowingReaderIsDisabled) {
  auto reader = make_reader();
  reader->then_throw("segfault averted");
  auto router = make_router(reader);

  EXPECT_FALSE(router->route_next());
  EXPECT_EQ(router->state().code, RouterState::Code::kFaulted);
  EXPECT_EQ(router->state().reason, "segfault averted");
}

TEST_F(ReaderRouterTest, EofExhaustsReader) {
  auto reader = make_reader();
  auto router = make_router(reader);

  EXPECT_FALSE(router->route_next());
  EXPECT_EQ(router->state().code, RouterState::Code::kExhausted);
  EXPECT_STREQ(router_state_name(router->state().code), "exhausted");
  EXPECT_EQ(router->route_until(100.0), 0.0);
  EXPECT_EQ(reader->read_count(), 1);
}

TEST_F(ReaderRouterTest, FaultStaysWithItsRouter) {
  auto bad = make_reader();
  bad->then_error(Status::corrupt_data("garbage"));
  auto bad_router = make_router(bad);

  auto good = make_reader();
  good->then_data(results("events", events({{1.0, 10.0}})));
  auto good_router = make_router(good);

  EXPECT_FALSE(bad_router->route_next());
  EXPECT_TRUE(good_router->route_next());
  EXPECT_TRUE(good_router->still_going());
  EXPECT_FALSE(bad_router->still_going());
}

//-------------------------------------------------------------------------
// route_until
//-------------------------------------------------------------------------

TEST_F(ReaderRouterTest, RouteUntilStopsOnceTargetIsCovered) {
  auto reader = make_reader();
  for (double t : {1.0, 2.0, 3.0, 4.0}) reader->then_data(results("events", events({{t, 0.0}})));
  auto router = make_router(reader);

  EXPECT_EQ(router->route_until(2.5), 3.0);
  EXPECT_EQ(reader->read_count(), 3);
  EXPECT_EQ(router->route_until(2.5), 3.0);
  EXPECT_EQ(reader->read_count(), 3);
}

TEST_F(ReaderRouterTest, RouteUntilGivesUpAfterTooManyEmptyReads) {
  auto reader = make_reader();
  for (int i = 0; i < 10; ++i) reader->then_empty();
  auto router = make_router(reader);

  EXPECT_EQ(router->route_until(10.0), 0.0);
  EXPECT_EQ(reader->read_count(), router->empty_reads_allowed() + 1);
  EXPECT_TRUE(router->still_going());
}

TEST_F(ReaderRouterTest, RouteUntilResetsEmptyCountOnData) {
  auto reader = make_reader();
  reader->then_empty().then_empty().then_empty();
  reader->then_data(results("events", events({{1.0, 0.0}})));
  reader->then_empty().then_empty().then_empty();
  reader->then_data(results("events", events({{5.0, 0.0}})));
  auto router = make_router(reader);

  EXPECT_EQ(router->route_until(5.0), 5.0);
  EXPECT_EQ(reader->read_count(), 8);
}

//-------------------------------------------------------------------------
// Clock sync
//-------------------------------------------------------------------------

TEST_F(ReaderRouterTest, RecordsSyncEventsAndUpdatesDrift) {
  registry->record_event("ref", 1.0);
  registry->record_event("ref", 2.0);

  ReaderSyncConfig sync;
  sync.reader_result_name = "events";
  sync.event_value = 1010.0;
  sync.reader_name = "other";

  auto reader = make_reader();
  reader->then_data(results("events", events({{1.1, 1010.0}, {1.5, 7.0}, {2.1, 1010.0}})));
  auto router = make_router(reader, {}, sync);

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(registry->event_times("other"), (std::vector<double>{1.1, 2.1}));

  EXPECT_NEAR(router->update_drift_estimate(), 0.1, 1e-9);
  EXPECT_NEAR(router->clock_drift(), 0.1, 1e-9);
  EXPECT_NEAR(buffer->clock_drift(), 0.1, 1e-9);
}

TEST_F(ReaderRouterTest, DriftIsBoundedByEndTime) {
  registry->record_event("ref", 1.0);
  registry->record_event("ref", 2.0);

  ReaderSyncConfig sync;
  sync.reader_result_name = "events";
  sync.event_value = 1010.0;
  sync.reader_name = "other";

  auto reader = make_reader();
  reader->then_data(results("events", events({{0.91, 1010.0}, {1.93, 1010.0}})));
  auto router = make_router(reader, {}, sync);
  ASSERT_TRUE(router->route_next());

  EXPECT_NEAR(router->update_drift_estimate(1.5), -0.09, 1e-9);
  EXPECT_NEAR(router->update_drift_estimate(), -0.07, 1e-9);
}

TEST_F(ReaderRouterTest, BorrowedSyncRecordsNothing) {
  registry->record_event("ref", 1.0);
  registry->record_event("upstream", 1.2);

  ReaderSyncConfig sync;
  sync.reader_name = "upstream";

  auto reader = make_reader();
  reader->then_data(results("events", events({{1.0, 1010.0}})));
  auto router = make_router(reader, {}, sync);

  EXPECT_TRUE(router->route_next());
  EXPECT_EQ(registry->event_times("upstream").size(), 1u);
  EXPECT_NEAR(router->update_drift_estimate(), 0.2, 1e-9);
}

TEST_F(ReaderRouterTest, NoSyncMeansNoDrift) {
  auto router = make_router(make_reader());
  EXPECT_EQ(router->update_drift_estimate(10.0), 0.0);
  EXPECT_EQ(buffer->clock_drift(), 0.0);
}

TEST_F(ReaderRouterTest, RouteUntilConvertsTargetToReaderClock) {
  registry->record_event("ref", 1.0);

  ReaderSyncConfig sync;
  sync.reader_result_name = "events";
  sync.event_value = 1010.0;
  sync.reader_name = "other";

  auto reader = make_reader();
  reader->then_data(results("events", events({{1.5, 1010.0}})));
  for (double t : {2.0, 2.4, 2.6}) reader->then_data(results("events", events({{t, 0.0}})));
  auto router = make_router(reader, {}, sync);

  ASSERT_TRUE(router->route_next());
  EXPECT_NEAR(router->update_drift_estimate(), 0.5, 1e-9);

  // Reference time 2.0 is reader time 2.5.
  EXPECT_EQ(router->route_until(2.0), 2.6);
  EXPECT_EQ(reader->read_count(), 4);
}

//-------------------------------------------------------------------------
// ScopedReaders
//-------------------------------------------------------------------------

namespace {

class FailingOpenReader final : public Reader {
 public:
  Status open() override { return Status::io_error("no such device"); }
  void close() override { ++closed; }
  Result<BufferDataMap> get_initial() override { return Result<BufferDataMap>::ok(BufferDataMap{}); }
  Result<BufferDataMap> read_next() override { return Result<BufferDataMap>::err(Status::eof()); }
  std::string name() const override { return "FailingOpenReader"; }

  int closed{0};
};

}  // namespace

TEST(ScopedReadersTest, ClosesEverythingItOpened) {
  ScriptedReader a{BufferDataMap{}};
  ScriptedReader b{BufferDataMap{}};
  FailingOpenReader broken;
  {
    ScopedReaders readers;
    ASSERT_TRUE(readers.open(a).ok());
    ASSERT_TRUE(readers.open(b).ok());
    EXPECT_EQ(readers.open(broken).code(), Status::Code::kIoError);
    EXPECT_EQ(readers.size(), 2u);
  }
  EXPECT_EQ(a.close_count(), 1);
  EXPECT_EQ(b.close_count(), 1);
  EXPECT_EQ(broken.closed, 0);
}

TEST(ScopedReadersTest, CloseAllIsRepeatable) {
  ScriptedReader a{BufferDataMap{}};
  ScopedReaders readers;
  ASSERT_TRUE(readers.open(a).ok());
  readers.close_all();
  readers.close_all();
  EXPECT_EQ(a.close_count(), 1);
  EXPECT_EQ(readers.size(), 0u);
}

}  // namespace ts::test
