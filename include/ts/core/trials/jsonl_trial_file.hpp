// File: include/ts/core/trials/jsonl_trial_file.hpp
#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "ts/core/trials/trial_file.hpp"

namespace ts {

// One JSON object per line (JSON Lines), one line per trial:
//   {"start_time": 1.0, "end_time": 2.0, "wrt_time": 1.5,
//    "numeric_events": {"name": [[t, v, ...], ...]},
//    "signals": {"name": {"signal_data": [[c0, c1, ...], ...], "sample_frequency": 1000.0,
//                         "first_sample_time": 0.0, "channel_ids": ["a", 2]}},
//    "enhancements": {...}, "enhancement_categories": {"value": ["name", ...]}}
// end_time is null for the last trial. Empty sections are left out.
class JsonlTrialFile final : public TrialFile {
 public:
  explicit JsonlTrialFile(std::string path, bool create_empty = false);
  ~JsonlTrialFile() override;

  Status open() override;
  Status append_trial(const Trial& trial) override;
  Result<std::vector<Trial>> read_trials() const override;
  void close() override;

  const std::string& path() const override { return path_; }

  // Exposed for tests and tools.
  static std::string dump_trial(const Trial& trial);
  static Result<Trial> load_trial(const std::string& json_line);

 private:
  std::string path_;
  bool create_empty_{false};
  bool open_{false};
  std::ofstream f_;
};

}  // namespace ts
