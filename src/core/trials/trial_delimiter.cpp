// File: src/core/trials/trial_delimiter.cpp
#include "ts/core/trials/trial_delimiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"

namespace ts {

TrialDelimiter::TrialDelimiter(std::shared_ptr<Buffer> start_buffer,
                               double start_value,
                               std::size_t start_value_index,
                               double start_time,
                               int trial_count,
                               int trial_log_mod)
    : start_buffer_(std::move(start_buffer)),
      start_value_(start_value),
      start_value_index_(start_value_index),
      start_time_(start_time),
      trial_count_(trial_count),
      trial_log_mod_(trial_log_mod > 0 ? trial_log_mod : 50) {
  if (!start_buffer_ || !start_buffer_->data_as<NumericEventList>()) {
    throw std::invalid_argument("TrialDelimiter start buffer must hold numeric events");
  }
}

std::map<int, Trial> TrialDelimiter::next() {
  const auto& events = *start_buffer_->data_as<NumericEventList>();
  std::vector<double> next_start_times = events.get_times_of(start_value_, start_value_index_);
  std::sort(next_start_times.begin(), next_start_times.end());

  std::map<int, Trial> trials;
  for (double next_start_time : next_start_times) {
    if (next_start_time <= start_time_) continue;

    trials.emplace(trial_count_, Trial(start_buffer_->raw_to_reference(start_time_),
                                       start_buffer_->raw_to_reference(next_start_time)));
    start_time_ = next_start_time;
    ++trial_count_;
    if (trial_count_ % trial_log_mod_ == 0) log::info("Delimited {} trials.", trial_count_);
  }
  return trials;
}

std::pair<int, Trial> TrialDelimiter::last() {
  std::pair<int, Trial> last_trial(trial_count_, Trial(start_buffer_->raw_to_reference(start_time_), std::nullopt));
  ++trial_count_;
  log::info("Delimited {} trials (last one).", trial_count_);
  return last_trial;
}

void TrialDelimiter::discard_before(double reference_time) {
  start_buffer_->data().discard_before(start_buffer_->reference_to_raw(reference_time));
}

}  // namespace ts
