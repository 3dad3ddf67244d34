// File: tests/util/file_finder_test.cpp
#include <cstdlib>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "../test_support.hpp"
#include "ts/core/util/file_finder.hpp"

namespace ts::test {

class FileFinderTest : public ::testing::Test {
 protected:
  TempDir first;
  TempDir second;
};

TEST_F(FileFinderTest, FirstPrefixWithTheFileWins) {
  second.write("data/spikes.csv", "1,2\n");
  const FileFinder finder({first.path().string(), second.path().string()});
  EXPECT_EQ(finder.find("data/spikes.csv"), (second.path() / "data/spikes.csv").generic_string());

  first.write("data/spikes.csv", "1,2\n");
  EXPECT_EQ(finder.find("data/spikes.csv"), (first.path() / "data/spikes.csv").generic_string());
}

TEST_F(FileFinderTest, UnfoundFilesComeBackUnchanged) {
  const FileFinder finder({first.path().string()});
  EXPECT_EQ(finder.find("nowhere.csv"), "nowhere.csv");
  EXPECT_EQ(FileFinder().find("nowhere.csv"), "nowhere.csv");
}

TEST_F(FileFinderTest, AbsolutePathsAreNotSearched) {
  second.write("x.csv", "");
  const FileFinder finder({second.path().string()});
  const std::string absolute = (first.path() / "x.csv").generic_string();
  EXPECT_EQ(finder.find(absolute), absolute);
}

TEST_F(FileFinderTest, ExpandsHome) {
  const char* home = std::getenv("HOME");
  if (!home) GTEST_SKIP() << "HOME is not set";
  const FileFinder finder;
  EXPECT_EQ(finder.find("~/data.csv"), (std::filesystem::path(home) / "data.csv").generic_string());
  EXPECT_EQ(finder.find("~other/data.csv"), "~other/data.csv");
}

}  // namespace ts::test
