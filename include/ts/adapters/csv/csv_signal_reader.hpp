// File: include/ts/adapters/csv/csv_signal_reader.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

#include "ts/core/io/reader.hpp"

namespace ts {

struct CsvSignalReaderConfig {
  std::string csv_file;  // header row of channel ids, then one row per sample
  double sample_frequency{1.0};
  double next_sample_time{0.0};
  std::size_t lines_per_chunk{10};
  std::string result_name{"samples"};
  char delimiter{','};
};

// Reads a CSV signal as SignalChunks of up to lines_per_chunk samples.
// Non-numeric rows, including the header, are skipped. The last chunk may be
// short; after it comes eof.
class CsvSignalReader final : public Reader {
 public:
  explicit CsvSignalReader(CsvSignalReaderConfig cfg);
  ~CsvSignalReader() override { close(); }

  Status open() override;
  void close() override;

  Result<BufferDataMap> get_initial() override;
  Result<BufferDataMap> read_next() override;

  std::string name() const override { return "CsvSignalReader"; }

  [[nodiscard]] const CsvSignalReaderConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] double next_sample_time() const noexcept { return next_sample_time_; }

 private:
  Status load_channel_ids();

  CsvSignalReaderConfig cfg_;
  std::ifstream in_;
  bool opened_{false};
  std::size_t line_number_{0};

  std::vector<ChannelId> channel_ids_;
  double next_sample_time_{0.0};
};

}  // namespace ts
