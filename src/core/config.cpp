// File: src/core/config.cpp
#include "ts/core/config.hpp"

#include <set>

namespace ts {

Status validate_experiment_config(const ExperimentConfig& cfg) {
  if (cfg.readers.empty()) {
    return Status::invalid_argument("readers must not be empty");
  }

  std::set<ReaderName> names;
  int reference_count = 0;
  for (const auto& r : cfg.readers) {
    if (r.name.empty()) return Status::invalid_argument("reader names must not be empty");
    if (!names.insert(r.name).second) return Status::invalid_argument("duplicate reader: " + r.name);
    if (r.reader.class_name.empty()) {
      return Status::invalid_argument("readers." + r.name + ".class must not be empty");
    }
    if (r.empty_reads_allowed < 0) {
      return Status::invalid_argument("readers." + r.name + ".empty_reads_allowed must be >= 0");
    }
    for (const auto& [buffer_name, extra] : r.extra_buffers) {
      if (buffer_name.empty()) return Status::invalid_argument("readers." + r.name + ".extra_buffers has an empty name");
      for (const auto& t : extra.transformers) {
        if (t.class_name.empty()) {
          return Status::invalid_argument("readers." + r.name + ".extra_buffers." + buffer_name +
                                          " has a transformer with no class");
        }
      }
    }
    if (r.sync) {
      if (r.sync->reader_name.empty()) {
        return Status::invalid_argument("readers." + r.name + ".sync.reader_name must not be empty");
      }
      if (r.sync->is_reference) ++reference_count;
    }
  }
  if (reference_count > 1) {
    return Status::invalid_argument("at most one reader may have sync.is_reference");
  }

  const auto& t = cfg.trials;
  if (t.start_buffer.empty()) return Status::invalid_argument("trials.start_buffer must not be empty");
  if (t.wrt_buffer.empty()) return Status::invalid_argument("trials.wrt_buffer must not be empty");
  if (t.trial_count < 0) return Status::invalid_argument("trials.trial_count must be >= 0");
  if (t.trial_log_mod <= 0) return Status::invalid_argument("trials.trial_log_mod must be > 0");
  for (const auto& e : t.enhancers) {
    if (e.enhancer.class_name.empty()) return Status::invalid_argument("trials.enhancers entries need a class");
  }
  return Status::ok_status();
}

}  // namespace ts
