// File: src/adapters/delay/delay_simulator_reader.cpp
#include "ts/adapters/delay/delay_simulator_reader.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace ts {
namespace {

double steady_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

}  // namespace

DelaySimulatorReader::DelaySimulatorReader(std::shared_ptr<Reader> reader, Clock clock)
    : reader_(std::move(reader)), clock_(clock ? std::move(clock) : Clock(steady_seconds)) {
  if (!reader_) throw std::invalid_argument("DelaySimulatorReader needs a reader to wrap");
}

Status DelaySimulatorReader::open() {
  start_time_ = clock_();
  stashed_.clear();
  stash_until_.reset();
  return reader_->open();
}

void DelaySimulatorReader::close() { reader_->close(); }

Result<BufferDataMap> DelaySimulatorReader::get_initial() { return reader_->get_initial(); }

Result<BufferDataMap> DelaySimulatorReader::release_stash() {
  if (clock_() < *stash_until_) return Result<BufferDataMap>::ok(BufferDataMap{});
  stash_until_.reset();
  return Result<BufferDataMap>::ok(std::exchange(stashed_, BufferDataMap{}));
}

Result<BufferDataMap> DelaySimulatorReader::read_next() {
  if (stash_until_) return release_stash();

  auto next_r = reader_->read_next();
  if (!next_r.ok() || next_r->empty()) return next_r;

  double latest = 0.0;
  for (const auto& [name, data] : *next_r) {
    if (!data) continue;
    if (const auto end = data->get_end_time()) latest = std::max(latest, *end);
  }
  stashed_ = next_r.take_value();
  stash_until_ = start_time_ + latest;
  return release_stash();
}

}  // namespace ts
