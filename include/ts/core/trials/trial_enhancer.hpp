// File: include/ts/core/trials/trial_enhancer.hpp
#pragma once

#include <string>

#include "ts/core/status.hpp"
#include "ts/core/trials/trial.hpp"
#include "ts/core/value.hpp"

namespace ts {

// Computes name-value pairs to save with each trial.
//
// Implementations add results with trial.add_enhancement(name, value[, category]).
// Values should stay within what Value can hold so they survive a trial file.
class TrialEnhancer {
 public:
  virtual ~TrialEnhancer() = default;

  virtual Status enhance(Trial& trial,
                         int trial_number,
                         const ValueMap& experiment_info,
                         const ValueMap& subject_info) = 0;

  virtual std::string name() const = 0;
};

}  // namespace ts
