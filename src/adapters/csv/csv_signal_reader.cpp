// File: src/adapters/csv/csv_signal_reader.cpp
#include "ts/adapters/csv/csv_signal_reader.hpp"

#include <memory>
#include <utility>

#include "ts/core/log.hpp"
#include "ts/core/model/signal_chunk.hpp"
#include "ts/core/util/csv.hpp"

namespace ts {

CsvSignalReader::CsvSignalReader(CsvSignalReaderConfig cfg)
    : cfg_(std::move(cfg)), next_sample_time_(cfg_.next_sample_time) {}

Status CsvSignalReader::load_channel_ids() {
  auto header_r = peek_csv_row(cfg_.csv_file, cfg_.delimiter);
  if (!header_r.ok()) return header_r.status();
  if (header_r->empty()) return Status::corrupt_data("CsvSignalReader: no header row in " + cfg_.csv_file);

  channel_ids_.clear();
  for (auto& id : header_r.take_value()) channel_ids_.emplace_back(std::move(id));
  return Status::ok_status();
}

Status CsvSignalReader::open() {
  if (cfg_.csv_file.empty()) return Status::invalid_argument("CsvSignalReader: csv_file is empty");
  if (cfg_.sample_frequency <= 0.0) return Status::invalid_argument("CsvSignalReader: sample_frequency must be > 0");
  if (cfg_.lines_per_chunk == 0) return Status::invalid_argument("CsvSignalReader: lines_per_chunk must be > 0");

  close();
  if (channel_ids_.empty()) TS_RETURN_IF_ERROR(load_channel_ids());

  in_.open(cfg_.csv_file);
  if (!in_.is_open()) return Status::not_found("CsvSignalReader: file not found: " + cfg_.csv_file);
  opened_ = true;
  line_number_ = 0;
  return Status::ok_status();
}

void CsvSignalReader::close() {
  if (in_.is_open()) in_.close();
  opened_ = false;
}

Result<BufferDataMap> CsvSignalReader::get_initial() {
  const Status s = load_channel_ids();
  if (!s.ok()) return Result<BufferDataMap>::err(s);

  BufferDataMap initial;
  initial.emplace(cfg_.result_name,
                  std::make_unique<SignalChunk>(std::vector<double>{}, cfg_.sample_frequency, next_sample_time_,
                                                channel_ids_));
  return Result<BufferDataMap>::ok(std::move(initial));
}

Result<BufferDataMap> CsvSignalReader::read_next() {
  if (!opened_) return Result<BufferDataMap>::err(Status::invalid_argument("CsvSignalReader::read_next: not opened"));

  std::vector<double> samples;
  std::size_t rows = 0;
  std::string line;
  while (rows < cfg_.lines_per_chunk && std::getline(in_, line)) {
    ++line_number_;
    const auto numbers = parse_csv_numbers(split_csv_line(line, cfg_.delimiter));
    if (!numbers || numbers->size() != channel_ids_.size()) {
      log::info("Skipping CSV '{}' line {} because it's not a sample row: {}", cfg_.csv_file, line_number_, line);
      continue;
    }
    samples.insert(samples.end(), numbers->begin(), numbers->end());
    ++rows;
  }
  if (in_.bad()) return Result<BufferDataMap>::err(Status::io_error("failed reading '" + cfg_.csv_file + "'"));

  // Past the last, possibly partial, chunk.
  if (rows == 0) return Result<BufferDataMap>::err(Status::eof());

  BufferDataMap results;
  results.emplace(cfg_.result_name, std::make_unique<SignalChunk>(std::move(samples), cfg_.sample_frequency,
                                                                  next_sample_time_, channel_ids_));
  next_sample_time_ += static_cast<double>(rows) / cfg_.sample_frequency;
  return Result<BufferDataMap>::ok(std::move(results));
}

}  // namespace ts
