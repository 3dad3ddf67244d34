// File: include/ts/core/trials/trial_extractor.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "ts/core/model/buffer.hpp"
#include "ts/core/trials/trial.hpp"
#include "ts/core/trials/trial_enhancer.hpp"
#include "ts/core/trials/trial_expression.hpp"
#include "ts/core/types.hpp"

namespace ts {

// An enhancer and the optional condition that gates it.
struct EnhancerEntry {
  std::shared_ptr<TrialEnhancer> enhancer;
  std::optional<TrialExpression> when;
};

// Fills trials with wrt-aligned data from named buffers, then runs enhancers
// in declared order.
class TrialExtractor {
 public:
  // wrt_buffer must hold a NumericEventList; throws std::invalid_argument otherwise.
  TrialExtractor(std::shared_ptr<Buffer> wrt_buffer,
                 double wrt_value,
                 std::size_t wrt_value_index = 0,
                 std::map<BufferName, std::shared_ptr<Buffer>> named_buffers = {},
                 std::vector<EnhancerEntry> enhancers = {});

  // A failing enhancer is logged and skipped; the rest still run.
  void populate_trial(Trial& trial,
                      int trial_number,
                      const ValueMap& experiment_info,
                      const ValueMap& subject_info) const;

  // Lets the wrt and named buffers drop data no longer needed.
  void discard_before(double reference_time);

  [[nodiscard]] const std::map<BufferName, std::shared_ptr<Buffer>>& named_buffers() const noexcept {
    return named_buffers_;
  }
  [[nodiscard]] const std::vector<EnhancerEntry>& enhancers() const noexcept { return enhancers_; }

 private:
  void run_enhancer(const EnhancerEntry& entry,
                    Trial& trial,
                    int trial_number,
                    const ValueMap& experiment_info,
                    const ValueMap& subject_info) const;

  std::shared_ptr<Buffer> wrt_buffer_;
  double wrt_value_{0.0};
  std::size_t wrt_value_index_{0};
  std::map<BufferName, std::shared_ptr<Buffer>> named_buffers_;
  std::vector<EnhancerEntry> enhancers_;
};

}  // namespace ts
