// File: include/ts/core/io/reader_sync_registry.hpp
#pragma once

#include <map>
#include <vector>

#include "ts/core/types.hpp"

namespace ts {

// Sync event times as seen by each reader, and drift estimates relative to
// the reference reader.
//
// Times are paired by proximity, not by index, so a reader that drops sync
// events falls back to an older but still sensible pairing:
//
//   reference: |   |   |   |   |   |   |   |
//   other:     |   |   |
//                      ^ closest to the other reader's latest event
//
// This assumes drift is small compared to the interval between sync events.
class ReaderSyncRegistry {
 public:
  explicit ReaderSyncRegistry(ReaderName reference_reader_name);

  [[nodiscard]] const ReaderName& reference_reader_name() const noexcept { return reference_reader_name_; }

  // Appends; lists grow for the life of the run.
  void record_event(const ReaderName& reader_name, double event_time);

  // Estimated (reader clock - reference clock), using events at or before the
  // given end times on each side. 0.0 when either side has no events.
  // Equal-magnitude candidates resolve to the one computed from the reader's
  // latest event, and within a candidate list to the earliest element.
  [[nodiscard]] double get_drift(const ReaderName& reader_name,
                                 OptionalTime reference_end_time = std::nullopt,
                                 OptionalTime reader_end_time = std::nullopt) const;

  // Empty for readers that recorded nothing.
  [[nodiscard]] const std::vector<double>& event_times(const ReaderName& reader_name) const;

  bool operator==(const ReaderSyncRegistry& other) const {
    return reference_reader_name_ == other.reference_reader_name_ && event_times_ == other.event_times_;
  }

 private:
  ReaderName reference_reader_name_;
  std::map<ReaderName, std::vector<double>> event_times_;
};

}  // namespace ts
