// File: tests/trials/jsonl_trial_file_test.cpp
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/trials/jsonl_trial_file.hpp"
#include "ts/core/trials/trial_file.hpp"

namespace ts::test {

namespace {

Trial sample_trial() {
  Trial trial(1.0, 2.0, 1.5);
  trial.add_buffer_data("spikes", events({{-0.25, 1.0, 3.0}, {0.125, 2.0, 4.0}}));
  trial.add_buffer_data("lfp", std::make_unique<SignalChunk>(std::vector<double>{0.5, -0.5, 1.5, -1.5}, 1000.0, -0.5,
                                                             std::vector<ChannelId>{ChannelId("AD01"), ChannelId(std::int64_t{2})}));
  trial.add_enhancement("duration", 1.0, "value");
  trial.add_enhancement("code", 5061, "id");
  trial.add_enhancement("label", "has \"quotes\"\nand a newline");
  trial.add_enhancement("numeric_text", "42");
  trial.add_enhancement("flags", Value::List{Value(true), Value(), Value(0.5)});
  trial.add_enhancement("nested", Value::Map{{"a", Value(1)}, {"b", Value::List{Value("x")}}});
  return trial;
}

}  // namespace

class JsonlTrialFileTest : public ::testing::Test {
 protected:
  TempDir dir;
};

TEST_F(JsonlTrialFileTest, TrialsReadBackEqual) {
  const std::string path = (dir.path() / "trials.jsonl").string();
  JsonlTrialFile file(path, true);
  ASSERT_TRUE(file.open().ok());

  const Trial first = sample_trial();
  const Trial last(2.0, std::nullopt, 0.0);
  ASSERT_TRUE(file.append_trial(first).ok());
  ASSERT_TRUE(file.append_trial(last).ok());

  auto trials = file.read_trials();
  ASSERT_TRUE(trials.ok()) << trials.status().to_string();
  ASSERT_EQ(trials->size(), 2u);
  EXPECT_EQ((*trials)[0], first);
  EXPECT_EQ((*trials)[1], last);
  file.close();
}

TEST_F(JsonlTrialFileTest, DumpLeavesOutEmptySections) {
  const std::string line = JsonlTrialFile::dump_trial(Trial(1.0, std::nullopt, 0.0));
  EXPECT_EQ(line, "{\"start_time\": 1.0, \"end_time\": null, \"wrt_time\": 0.0}");
}

TEST_F(JsonlTrialFileTest, QuotedNumbersStayStrings) {
  auto trial = JsonlTrialFile::load_trial(JsonlTrialFile::dump_trial(sample_trial()));
  ASSERT_TRUE(trial.ok());
  EXPECT_TRUE(trial->get_enhancement("numeric_text").is_string());
  EXPECT_TRUE(trial->get_enhancement("code").is_int());
}

TEST_F(JsonlTrialFileTest, AppendWithoutOpenFails) {
  JsonlTrialFile file((dir.path() / "never.jsonl").string());
  EXPECT_EQ(file.append_trial(Trial()).code(), Status::Code::kInvalidArgument);
}

TEST_F(JsonlTrialFileTest, CreateEmptyTruncatesOtherwiseAppends) {
  const std::string path = (dir.path() / "out" / "trials.json").string();
  {
    JsonlTrialFile file(path, true);
    ASSERT_TRUE(file.open().ok());
    ASSERT_TRUE(file.append_trial(Trial(0.0, 1.0)).ok());
  }
  {
    JsonlTrialFile file(path, false);
    ASSERT_TRUE(file.open().ok());
    ASSERT_TRUE(file.append_trial(Trial(1.0, 2.0)).ok());
    auto trials = file.read_trials();
    ASSERT_TRUE(trials.ok());
    EXPECT_EQ(trials->size(), 2u);
  }
  {
    JsonlTrialFile file(path, true);
    ASSERT_TRUE(file.open().ok());
    auto trials = file.read_trials();
    ASSERT_TRUE(trials.ok());
    EXPECT_TRUE(trials->empty());
  }
}

TEST_F(JsonlTrialFileTest, ReadErrorsNameTheLine) {
  const std::string path = dir.write("bad.jsonl", "{\"start_time\": 0.0}\n\n{\"end_time\": 1.0}\n");
  JsonlTrialFile file(path);
  auto trials = file.read_trials();
  ASSERT_FALSE(trials.ok());
  EXPECT_EQ(trials.status().code(), Status::Code::kCorruptData);
  EXPECT_NE(trials.status().message().find(":3:"), std::string::npos);

  EXPECT_EQ(JsonlTrialFile((dir.path() / "missing.jsonl").string()).read_trials().status().code(),
            Status::Code::kNotFound);
  EXPECT_EQ(JsonlTrialFile::load_trial("{not json").status().code(), Status::Code::kParseError);
}

TEST(TrialFileTest, PicksImplementationFromSuffix) {
  for (const char* path : {"a.json", "b.jsonl", "dir/C.JSON", "d.json.bak"}) {
    auto file = TrialFile::for_file_suffix(path);
    ASSERT_TRUE(file.ok()) << path;
    EXPECT_EQ((*file)->path(), path);
  }
  for (const char* path : {"trials.hdf5", "trials.mat", "json", "trials"}) {
    EXPECT_EQ(TrialFile::for_file_suffix(path).status().code(), Status::Code::kUnsupported) << path;
  }
}

}  // namespace ts::test
