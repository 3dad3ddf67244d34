// File: include/ts/core/trials/trial_delimiter.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <utility>

#include "ts/core/model/buffer.hpp"
#include "ts/core/trials/trial.hpp"

namespace ts {

// Watches the "start" event buffer and makes a new trial each time a
// delimiting event arrives.
class TrialDelimiter {
 public:
  // start_buffer must hold a NumericEventList; throws std::invalid_argument otherwise.
  // start_time is on the start buffer's raw clock.
  TrialDelimiter(std::shared_ptr<Buffer> start_buffer,
                 double start_value,
                 std::size_t start_value_index = 0,
                 double start_time = 0.0,
                 int trial_count = 0,
                 int trial_log_mod = 50);

  // Trials [previous start, next start) for each new start event, keyed by
  // trial number, in reference clock. Advances start_time and trial_count.
  std::map<int, Trial> next();

  // Open-ended trial for whatever's left. Call once, after the start reader is done.
  std::pair<int, Trial> last();

  // Lets the start buffer drop data no longer needed.
  void discard_before(double reference_time);

  [[nodiscard]] double start_time() const noexcept { return start_time_; }
  [[nodiscard]] int trial_count() const noexcept { return trial_count_; }
  [[nodiscard]] const std::shared_ptr<Buffer>& start_buffer() const noexcept { return start_buffer_; }

 private:
  std::shared_ptr<Buffer> start_buffer_;
  double start_value_{0.0};
  std::size_t start_value_index_{0};
  double start_time_{0.0};
  int trial_count_{0};
  int trial_log_mod_{50};
};

}  // namespace ts
