// File: src/adapters/csv/csv_numeric_event_reader.cpp
#include "ts/adapters/csv/csv_numeric_event_reader.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/util/csv.hpp"

namespace ts {

CsvNumericEventReader::CsvNumericEventReader(CsvNumericEventReaderConfig cfg) : cfg_(std::move(cfg)) {}

Status CsvNumericEventReader::open() {
  if (cfg_.csv_file.empty()) return Status::invalid_argument("CsvNumericEventReader: csv_file is empty");
  close();
  in_.open(cfg_.csv_file);
  if (!in_.is_open()) return Status::not_found("CsvNumericEventReader: file not found: " + cfg_.csv_file);
  opened_ = true;
  line_number_ = 0;
  return Status::ok_status();
}

void CsvNumericEventReader::close() {
  if (in_.is_open()) in_.close();
  opened_ = false;
}

Result<BufferDataMap> CsvNumericEventReader::get_initial() {
  std::size_t columns = 2;
  auto first_r = peek_csv_row(cfg_.csv_file, cfg_.delimiter);
  if (!first_r.ok()) {
    log::error("Unable to peek at CSV file {}: {}", cfg_.csv_file, first_r.status().to_string());
  } else if (first_r->empty()) {
    log::warn("Using default column count for CSV events: {}", columns);
  } else {
    columns = first_r->size();
  }

  if (columns < 2) {
    return Result<BufferDataMap>::err(Status::invalid_argument(
        "CsvNumericEventReader: " + cfg_.csv_file + " needs a time column and at least one value column"));
  }

  BufferDataMap initial;
  initial.emplace(cfg_.result_name, std::make_unique<NumericEventList>(columns));
  return Result<BufferDataMap>::ok(std::move(initial));
}

Result<BufferDataMap> CsvNumericEventReader::read_next() {
  if (!opened_) {
    return Result<BufferDataMap>::err(Status::invalid_argument("CsvNumericEventReader::read_next: not opened"));
  }

  std::string line;
  if (!std::getline(in_, line)) {
    if (in_.bad()) return Result<BufferDataMap>::err(Status::io_error("failed reading '" + cfg_.csv_file + "'"));
    return Result<BufferDataMap>::err(Status::eof());
  }
  ++line_number_;

  const std::vector<std::string> fields = split_csv_line(line, cfg_.delimiter);
  const auto numbers = parse_csv_numbers(fields);
  if (!numbers || numbers->size() < 2) {
    log::info("Skipping CSV '{}' line {} because it's not a numeric event: {}", cfg_.csv_file, line_number_, line);
    return Result<BufferDataMap>::ok(BufferDataMap{});
  }

  BufferDataMap results;
  results.emplace(cfg_.result_name,
                  std::make_unique<NumericEventList>(std::vector<std::vector<double>>{*numbers}));
  return Result<BufferDataMap>::ok(std::move(results));
}

}  // namespace ts
