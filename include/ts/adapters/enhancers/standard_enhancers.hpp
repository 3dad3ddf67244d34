// File: include/ts/adapters/enhancers/standard_enhancers.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ts/core/status.hpp"
#include "ts/core/trials/trial_enhancer.hpp"
#include "ts/core/trials/trial_expression.hpp"
#include "ts/core/types.hpp"

namespace ts {

// -----------------------------
// Rules files
// -----------------------------
// CSV with a header row. Every rules file needs "type", "value" and "name"
// columns; paired-code rules also need "min", "max", "base" and "scale".
// Extra columns (e.g. "comment") are ignored. Only rows whose type is in
// rule_types are kept, and a later row for the same value replaces an earlier one.

struct CodeRule {
  std::string type;  // also the enhancement category
  double value{0.0};
  std::string name;

  // Paired codes only.
  double min{0.0};
  double max{0.0};
  double base{0.0};
  double scale{1.0};
};

Result<std::vector<CodeRule>> load_code_rules(const std::vector<std::string>& rules_csv,
                                              const std::vector<std::string>& rule_types,
                                              bool paired,
                                              char delimiter = ',');

// -----------------------------
// Enhancers
// -----------------------------

// "duration" = end_time - start_time, null for the open-ended last trial.
class TrialDurationEnhancer final : public TrialEnhancer {
 public:
  Status enhance(Trial& trial,
                 int trial_number,
                 const ValueMap& experiment_info,
                 const ValueMap& subject_info) override;
  std::string name() const override { return "TrialDurationEnhancer"; }
};

// Property-value pairs encoded as events: a property code, followed by a
// value code in [min, max). The first value event at or after each property
// event is saved as (v - base) * scale under the rule's name and type.
class PairedCodesEnhancer final : public TrialEnhancer {
 public:
  PairedCodesEnhancer(std::string buffer_name, std::vector<CodeRule> rules, std::size_t value_index = 0);

  Status enhance(Trial& trial,
                 int trial_number,
                 const ValueMap& experiment_info,
                 const ValueMap& subject_info) override;
  std::string name() const override { return "PairedCodesEnhancer"; }

  [[nodiscard]] const std::vector<CodeRule>& rules() const noexcept { return rules_; }

 private:
  std::string buffer_name_;
  std::vector<CodeRule> rules_;
  std::size_t value_index_{0};
};

// For each rule, the list of times its code occurred (possibly empty).
class EventTimesEnhancer final : public TrialEnhancer {
 public:
  EventTimesEnhancer(std::string buffer_name, std::vector<CodeRule> rules, std::size_t value_index = 0);

  Status enhance(Trial& trial,
                 int trial_number,
                 const ValueMap& experiment_info,
                 const ValueMap& subject_info) override;
  std::string name() const override { return "EventTimesEnhancer"; }

  [[nodiscard]] const std::vector<CodeRule>& rules() const noexcept { return rules_; }

 private:
  std::string buffer_name_;
  std::vector<CodeRule> rules_;
  std::size_t value_index_{0};
};

// Saves the value of an expression over existing enhancements.
class ExpressionEnhancer final : public TrialEnhancer {
 public:
  ExpressionEnhancer(TrialExpression expression, std::string value_name, std::string value_category = "value");

  Status enhance(Trial& trial,
                 int trial_number,
                 const ValueMap& experiment_info,
                 const ValueMap& subject_info) override;
  std::string name() const override { return "ExpressionEnhancer"; }

 private:
  TrialExpression expression_;
  std::string value_name_;
  std::string value_category_;
};

// Moving-average smoothing of one signal channel, in place, same length out.
// Signals shorter than the kernel are left alone.
class SignalSmoother final : public TrialEnhancer {
 public:
  // kernel_size must be > 0; throws std::invalid_argument otherwise.
  SignalSmoother(std::string buffer_name, std::optional<ChannelId> channel_id = std::nullopt, int kernel_size = 10);

  Status enhance(Trial& trial,
                 int trial_number,
                 const ValueMap& experiment_info,
                 const ValueMap& subject_info) override;
  std::string name() const override { return "SignalSmoother"; }

 private:
  std::string buffer_name_;
  std::optional<ChannelId> channel_id_;
  std::size_t kernel_size_{10};
};

// Centered moving average with zero padding at both ends, same length as x.
std::vector<double> smooth_same(const std::vector<double>& x, std::size_t kernel_size);

}  // namespace ts
