// File: src/core/io/reader_sync_registry.cpp
#include "ts/core/io/reader_sync_registry.hpp"

#include <cmath>
#include <utility>

namespace ts {
namespace {

const std::vector<double> kNoEvents;

std::vector<double> truncated(const std::vector<double>& times, OptionalTime end_time) {
  if (!end_time) return times;
  std::vector<double> out;
  out.reserve(times.size());
  for (double t : times) {
    if (t <= *end_time) out.push_back(t);
  }
  return out;
}

// First element with the smallest magnitude.
double min_abs(const std::vector<double>& values) {
  double best = values.front();
  for (double v : values) {
    if (std::fabs(v) < std::fabs(best)) best = v;
  }
  return best;
}

}  // namespace

ReaderSyncRegistry::ReaderSyncRegistry(ReaderName reference_reader_name)
    : reference_reader_name_(std::move(reference_reader_name)) {}

void ReaderSyncRegistry::record_event(const ReaderName& reader_name, double event_time) {
  event_times_[reader_name].push_back(event_time);
}

const std::vector<double>& ReaderSyncRegistry::event_times(const ReaderName& reader_name) const {
  const auto it = event_times_.find(reader_name);
  return it == event_times_.end() ? kNoEvents : it->second;
}

double ReaderSyncRegistry::get_drift(const ReaderName& reader_name,
                                     OptionalTime reference_end_time,
                                     OptionalTime reader_end_time) const {
  const std::vector<double> reference_times = truncated(event_times(reference_reader_name_), reference_end_time);
  if (reference_times.empty()) return 0.0;

  const std::vector<double> reader_times = truncated(event_times(reader_name), reader_end_time);
  if (reader_times.empty()) return 0.0;

  const double reader_last = reader_times.back();
  std::vector<double> reader_offsets;
  reader_offsets.reserve(reference_times.size());
  for (double ref_time : reference_times) reader_offsets.push_back(reader_last - ref_time);
  const double drift_from_reader = min_abs(reader_offsets);

  const double reference_last = reference_times.back();
  std::vector<double> reference_offsets;
  reference_offsets.reserve(reader_times.size());
  for (double reader_time : reader_times) reference_offsets.push_back(reader_time - reference_last);
  const double drift_from_reference = min_abs(reference_offsets);

  return std::fabs(drift_from_reference) < std::fabs(drift_from_reader) ? drift_from_reference
                                                                         : drift_from_reader;
}

}  // namespace ts
