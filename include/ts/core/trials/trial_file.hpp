// File: include/ts/core/trials/trial_file.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ts/core/status.hpp"
#include "ts/core/trials/trial.hpp"

namespace ts {

// Writes trials to disk and reads them back.
//
// Each trial written with append_trial() comes back equal from read_trials(),
// as long as its enhancements are plain Values. The file on disk stays well
// formed after every append so reads can be interleaved with writes.
class TrialFile {
 public:
  virtual ~TrialFile() = default;

  // Prepares the file for appending; truncates it when created with create_empty.
  virtual Status open() = 0;
  virtual Status append_trial(const Trial& trial) = 0;
  virtual Result<std::vector<Trial>> read_trials() const = 0;
  virtual void close() = 0;

  virtual const std::string& path() const = 0;

  // Picks an implementation from the file name: .json / .jsonl -> JsonlTrialFile.
  // Other suffixes are unsupported.
  static Result<std::unique_ptr<TrialFile>> for_file_suffix(const std::string& path, bool create_empty = false);
};

}  // namespace ts
