// File: tests/test_support.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "ts/core/io/reader.hpp"
#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/model/signal_chunk.hpp"
#include "ts/core/value.hpp"

namespace ts {

// Readable gtest failure messages.
inline void PrintTo(const Value& v, std::ostream* os) { *os << v.to_string(); }

}  // namespace ts

namespace ts::test {

inline std::unique_ptr<NumericEventList> events(const std::vector<std::vector<double>>& rows,
                                                std::size_t columns_if_empty = 2) {
  return std::make_unique<NumericEventList>(rows, columns_if_empty);
}

inline BufferDataMap results(const std::string& name, std::unique_ptr<BufferData> data) {
  BufferDataMap out;
  out.emplace(name, std::move(data));
  return out;
}

//-------------------------------------------------------------------------
// Scripted reader: plays back a fixed sequence of reads, then eof
//-------------------------------------------------------------------------

class ScriptedReader final : public Reader {
 public:
  explicit ScriptedReader(BufferDataMap initial) : initial_(std::move(initial)) {}

  ScriptedReader& then_data(BufferDataMap data) {
    auto shared = std::make_shared<BufferDataMap>(std::move(data));
    steps_.push_back([shared] { return Result<BufferDataMap>::ok(copy_all(*shared)); });
    return *this;
  }

  ScriptedReader& then_empty() {
    steps_.push_back([] { return Result<BufferDataMap>::ok(BufferDataMap{}); });
    return *this;
  }

  ScriptedReader& then_error(Status status) {
    steps_.push_back([status] { return Result<BufferDataMap>::err(status); });
    return *this;
  }

  ScriptedReader& then_throw(std::string message) {
    steps_.push_back([message]() -> Result<BufferDataMap> { throw std::runtime_error(message); });
    return *this;
  }

  Status open() override {
    ++open_count_;
    return Status::ok_status();
  }
  void close() override { ++close_count_; }

  Result<BufferDataMap> get_initial() override { return Result<BufferDataMap>::ok(copy_all(initial_)); }

  Result<BufferDataMap> read_next() override {
    ++read_count_;
    if (next_ >= steps_.size()) return Result<BufferDataMap>::err(Status::eof());
    return steps_[next_++]();
  }

  std::string name() const override { return "ScriptedReader"; }

  [[nodiscard]] int open_count() const noexcept { return open_count_; }
  [[nodiscard]] int close_count() const noexcept { return close_count_; }
  [[nodiscard]] int read_count() const noexcept { return read_count_; }

 private:
  BufferDataMap initial_;
  std::vector<std::function<Result<BufferDataMap>()>> steps_;
  std::size_t next_{0};
  int open_count_{0};
  int close_count_{0};
  int read_count_{0};
};

//-------------------------------------------------------------------------
// Scratch files
//-------------------------------------------------------------------------

class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const std::string test_name = info ? std::string(info->test_suite_name()) + "_" + info->name() : "trialsync";
    path_ = std::filesystem::temp_directory_path() / ("trialsync_" + test_name + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  std::string write(const std::string& name, const std::string& contents) const {
    const std::filesystem::path p = path_ / name;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p);
    out << contents;
    return p.string();
  }

 private:
  std::filesystem::path path_;
};

//-------------------------------------------------------------------------
// Log capture
//-------------------------------------------------------------------------

class LogCapture {
 public:
  explicit LogCapture(log::Level level = log::Level::kDebug) : previous_(log::level()) {
    log::set_level(level);
    log::set_sink([this](log::Level l, std::string_view message) { lines_.emplace_back(l, std::string(message)); });
  }

  ~LogCapture() {
    log::reset_sink();
    log::set_level(previous_);
  }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  [[nodiscard]] bool contains(log::Level level, std::string_view fragment) const {
    for (const auto& [l, message] : lines_) {
      if (l == level && message.find(fragment) != std::string::npos) return true;
    }
    return false;
  }

  [[nodiscard]] std::size_t count(log::Level level) const {
    std::size_t n = 0;
    for (const auto& [l, message] : lines_) n += l == level ? 1 : 0;
    return n;
  }

 private:
  log::Level previous_;
  std::vector<std::pair<log::Level, std::string>> lines_;
};

}  // namespace ts::test
