// File: src/core/trials/trial_extractor.cpp
#include "ts/core/trials/trial_extractor.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"

namespace ts {

TrialExtractor::TrialExtractor(std::shared_ptr<Buffer> wrt_buffer,
                               double wrt_value,
                               std::size_t wrt_value_index,
                               std::map<BufferName, std::shared_ptr<Buffer>> named_buffers,
                               std::vector<EnhancerEntry> enhancers)
    : wrt_buffer_(std::move(wrt_buffer)),
      wrt_value_(wrt_value),
      wrt_value_index_(wrt_value_index),
      named_buffers_(std::move(named_buffers)),
      enhancers_(std::move(enhancers)) {
  if (!wrt_buffer_ || !wrt_buffer_->data_as<NumericEventList>()) {
    throw std::invalid_argument("TrialExtractor wrt buffer must hold numeric events");
  }
}

void TrialExtractor::populate_trial(Trial& trial,
                                    int trial_number,
                                    const ValueMap& experiment_info,
                                    const ValueMap& subject_info) const {
  const auto& wrt_events = *wrt_buffer_->data_as<NumericEventList>();
  const std::vector<double> wrt_times =
      wrt_events.get_times_of(wrt_value_, wrt_value_index_, wrt_buffer_->reference_to_raw(trial.start_time),
                              wrt_buffer_->reference_to_raw(trial.end_time));
  if (wrt_times.empty()) {
    trial.wrt_time = 0.0;
  } else {
    trial.wrt_time = wrt_buffer_->raw_to_reference(*std::min_element(wrt_times.begin(), wrt_times.end()));
  }

  for (const auto& [name, buffer] : named_buffers_) {
    std::unique_ptr<BufferData> data = buffer->data().copy_time_range(buffer->reference_to_raw(trial.start_time),
                                                                       buffer->reference_to_raw(trial.end_time));
    data->shift_times(-buffer->reference_to_raw(trial.wrt_time));
    trial.add_buffer_data(name, std::move(data));
  }

  for (const auto& entry : enhancers_) {
    if (entry.when && !entry.when->evaluate(trial).truthy()) continue;
    run_enhancer(entry, trial, trial_number, experiment_info, subject_info);
  }
}

void TrialExtractor::run_enhancer(const EnhancerEntry& entry,
                                  Trial& trial,
                                  int trial_number,
                                  const ValueMap& experiment_info,
                                  const ValueMap& subject_info) const {
  try {
    const Status s = entry.enhancer->enhance(trial, trial_number, experiment_info, subject_info);
    if (!s.ok()) log::error("Error applying {} to trial {}: {}", entry.enhancer->name(), trial_number, s.to_string());
  } catch (const std::exception& e) {
    log::error("Error applying {} to trial {}: {}", entry.enhancer->name(), trial_number, e.what());
  }
}

void TrialExtractor::discard_before(double reference_time) {
  wrt_buffer_->data().discard_before(wrt_buffer_->reference_to_raw(reference_time));
  for (auto& [name, buffer] : named_buffers_) {
    buffer->data().discard_before(buffer->reference_to_raw(reference_time));
  }
}

}  // namespace ts
