// File: include/ts/core/trials/trial.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/model/signal_chunk.hpp"
#include "ts/core/types.hpp"
#include "ts/core/value.hpp"

namespace ts {

// A delimited part of the timeline with the events, signals and computed
// values from the same time range.
//
// Buffer data attached to a trial is already aligned: wrt_time has been
// subtracted, so t == 0 is the trial's wrt event.
struct Trial {
  double start_time{0.0};
  OptionalTime end_time;  // nullopt for the last, open-ended trial
  double wrt_time{0.0};

  std::map<std::string, NumericEventList> numeric_events;
  std::map<std::string, SignalChunk> signals;

  // Enhancement names are unique per trial. Categories hint at how to
  // interpret them downstream: "value", "id", "time", ...
  ValueMap enhancements;
  std::map<std::string, std::vector<std::string>> enhancement_categories;

  Trial() = default;
  Trial(double start, OptionalTime end, double wrt = 0.0) : start_time(start), end_time(end), wrt_time(wrt) {}

  // Files the data under numeric_events or signals by kind.
  void add_buffer_data(const std::string& name, std::unique_ptr<BufferData> data);

  // Replaces any previous value for name; the name is listed once under category.
  void add_enhancement(const std::string& name, Value value, const std::string& category = "value");

  [[nodiscard]] Value get_enhancement(const std::string& name, const Value& default_value = Value()) const;

  // One element of a list enhancement, the scalar itself for non-lists, or
  // default_value when missing or empty. Negative index counts from the end.
  // Throws std::out_of_range for an index past either end of a non-empty list.
  [[nodiscard]] Value get_one(const std::string& name, const Value& default_value = Value(), int index = 0) const;

  bool operator==(const Trial& other) const;
  bool operator!=(const Trial& other) const { return !(*this == other); }
};

}  // namespace ts
