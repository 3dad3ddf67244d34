// File: include/ts/adapters/csv/csv_numeric_event_reader.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "ts/core/io/reader.hpp"

namespace ts {

struct CsvNumericEventReaderConfig {
  std::string csv_file;            // rows of: time, value[, value ...]
  std::string result_name{"events"};
  char delimiter{','};
};

// One NumericEventList row per read. Rows with non-numeric cells (e.g. a
// header) are skipped and read as "nothing yet".
class CsvNumericEventReader final : public Reader {
 public:
  explicit CsvNumericEventReader(CsvNumericEventReaderConfig cfg);
  ~CsvNumericEventReader() override { close(); }

  Status open() override;
  void close() override;

  // Column count comes from the file's first row, or 2 if it can't be read.
  Result<BufferDataMap> get_initial() override;
  Result<BufferDataMap> read_next() override;

  std::string name() const override { return "CsvNumericEventReader"; }

  [[nodiscard]] const CsvNumericEventReaderConfig& config() const noexcept { return cfg_; }

 private:
  CsvNumericEventReaderConfig cfg_;
  std::ifstream in_;
  bool opened_{false};
  std::size_t line_number_{0};
};

}  // namespace ts
