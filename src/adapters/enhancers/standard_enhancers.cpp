// File: src/adapters/enhancers/standard_enhancers.cpp
#include "ts/adapters/enhancers/standard_enhancers.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <utility>

#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/model/signal_chunk.hpp"
#include "ts/core/util/csv.hpp"

namespace ts {
namespace {

Result<std::string> column(const std::map<std::string, std::string>& row,
                           const std::string& key,
                           const std::string& file) {
  const auto it = row.find(key);
  if (it == row.end()) return Result<std::string>::err(Status::invalid_argument(file + ": missing column " + key));
  return Result<std::string>::ok(it->second);
}

Result<double> numeric_column(const std::map<std::string, std::string>& row,
                              const std::string& key,
                              const std::string& file) {
  auto text_r = column(row, key, file);
  if (!text_r.ok()) return Result<double>::err(text_r.status());
  const auto v = parse_csv_double(*text_r);
  if (!v) return Result<double>::err(Status::invalid_argument(file + ": " + key + " is not a number: " + *text_r));
  return Result<double>::ok(*v);
}

const NumericEventList* find_events(const Trial& trial, const std::string& buffer_name) {
  const auto it = trial.numeric_events.find(buffer_name);
  return it == trial.numeric_events.end() ? nullptr : &it->second;
}

}  // namespace

// -----------------------------
// Rules files
// -----------------------------

Result<std::vector<CodeRule>> load_code_rules(const std::vector<std::string>& rules_csv,
                                              const std::vector<std::string>& rule_types,
                                              bool paired,
                                              char delimiter) {
  using R = Result<std::vector<CodeRule>>;
  std::vector<CodeRule> rules;

  for (const auto& file : rules_csv) {
    auto rows_r = read_csv_dicts(file, delimiter);
    if (!rows_r.ok()) return R::err(rows_r.status());

    for (const auto& row : *rows_r) {
      auto type_r = column(row, "type", file);
      if (!type_r.ok()) return R::err(type_r.status());
      if (std::find(rule_types.begin(), rule_types.end(), *type_r) == rule_types.end()) continue;

      CodeRule rule;
      rule.type = *type_r;

      auto value_r = numeric_column(row, "value", file);
      if (!value_r.ok()) return R::err(value_r.status());
      rule.value = *value_r;

      auto name_r = column(row, "name", file);
      if (!name_r.ok()) return R::err(name_r.status());
      rule.name = *name_r;

      if (paired) {
        const std::pair<const char*, double*> paired_columns[] = {
            {"min", &rule.min}, {"max", &rule.max}, {"base", &rule.base}, {"scale", &rule.scale}};
        for (const auto& [key, out] : paired_columns) {
          auto v_r = numeric_column(row, key, file);
          if (!v_r.ok()) return R::err(v_r.status());
          *out = *v_r;
        }
      }

      const auto same_value = std::find_if(rules.begin(), rules.end(),
                                           [&](const CodeRule& r) { return r.value == rule.value; });
      if (same_value != rules.end()) {
        *same_value = std::move(rule);
      } else {
        rules.push_back(std::move(rule));
      }
    }
  }
  return R::ok(std::move(rules));
}

// -----------------------------
// TrialDurationEnhancer
// -----------------------------

Status TrialDurationEnhancer::enhance(Trial& trial, int, const ValueMap&, const ValueMap&) {
  trial.add_enhancement("duration", trial.end_time ? Value(*trial.end_time - trial.start_time) : Value(), "value");
  return Status::ok_status();
}

// -----------------------------
// PairedCodesEnhancer
// -----------------------------

PairedCodesEnhancer::PairedCodesEnhancer(std::string buffer_name, std::vector<CodeRule> rules, std::size_t value_index)
    : buffer_name_(std::move(buffer_name)), rules_(std::move(rules)), value_index_(value_index) {}

Status PairedCodesEnhancer::enhance(Trial& trial, int, const ValueMap&, const ValueMap&) {
  const NumericEventList* events = find_events(trial, buffer_name_);
  if (!events) return Status::not_found("PairedCodesEnhancer: trial has no numeric events named " + buffer_name_);

  for (const auto& rule : rules_) {
    const std::vector<double> property_times = events->get_times_of(rule.value, value_index_);
    if (property_times.empty()) continue;

    NumericEventList value_list = events->copy_value_range(rule.min, rule.max, value_index_);
    value_list.apply_offset_then_gain(-rule.base, rule.scale, value_index_);
    for (const double property_time : property_times) {
      const std::vector<double> values = value_list.get_values(property_time, std::nullopt, value_index_);
      if (!values.empty()) trial.add_enhancement(rule.name, values.front(), rule.type);
    }
  }
  return Status::ok_status();
}

// -----------------------------
// EventTimesEnhancer
// -----------------------------

EventTimesEnhancer::EventTimesEnhancer(std::string buffer_name, std::vector<CodeRule> rules, std::size_t value_index)
    : buffer_name_(std::move(buffer_name)), rules_(std::move(rules)), value_index_(value_index) {}

Status EventTimesEnhancer::enhance(Trial& trial, int, const ValueMap&, const ValueMap&) {
  const NumericEventList* events = find_events(trial, buffer_name_);
  if (!events) return Status::not_found("EventTimesEnhancer: trial has no numeric events named " + buffer_name_);

  for (const auto& rule : rules_) {
    Value::List times;
    for (const double t : events->get_times_of(rule.value, value_index_)) times.emplace_back(t);
    trial.add_enhancement(rule.name, Value(std::move(times)), rule.type);
  }
  return Status::ok_status();
}

// -----------------------------
// ExpressionEnhancer
// -----------------------------

ExpressionEnhancer::ExpressionEnhancer(TrialExpression expression, std::string value_name, std::string value_category)
    : expression_(std::move(expression)),
      value_name_(std::move(value_name)),
      value_category_(std::move(value_category)) {}

Status ExpressionEnhancer::enhance(Trial& trial, int, const ValueMap&, const ValueMap&) {
  trial.add_enhancement(value_name_, expression_.evaluate(trial), value_category_);
  return Status::ok_status();
}

// -----------------------------
// SignalSmoother
// -----------------------------

std::vector<double> smooth_same(const std::vector<double>& x, std::size_t kernel_size) {
  const std::size_t n = x.size();
  std::vector<double> out(n, 0.0);
  if (kernel_size == 0) return out;

  // Window for out[i] is x[i - k/2, i - k/2 + k), zeros outside x.
  const auto half = static_cast<std::ptrdiff_t>(kernel_size / 2);
  for (std::size_t i = 0; i < n; ++i) {
    double sum = 0.0;
    for (std::size_t j = 0; j < kernel_size; ++j) {
      const std::ptrdiff_t idx = static_cast<std::ptrdiff_t>(i) - half + static_cast<std::ptrdiff_t>(j);
      if (idx >= 0 && idx < static_cast<std::ptrdiff_t>(n)) sum += x[static_cast<std::size_t>(idx)];
    }
    out[i] = sum / static_cast<double>(kernel_size);
  }
  return out;
}

SignalSmoother::SignalSmoother(std::string buffer_name, std::optional<ChannelId> channel_id, int kernel_size)
    : buffer_name_(std::move(buffer_name)), channel_id_(std::move(channel_id)) {
  if (kernel_size <= 0) throw std::invalid_argument("SignalSmoother kernel_size must be > 0");
  kernel_size_ = static_cast<std::size_t>(kernel_size);
}

Status SignalSmoother::enhance(Trial& trial, int, const ValueMap&, const ValueMap&) {
  const auto it = trial.signals.find(buffer_name_);
  if (it == trial.signals.end()) return Status::ok_status();

  SignalChunk& signal = it->second;
  if (signal.sample_count() < kernel_size_) return Status::ok_status();

  const std::size_t c = channel_id_ ? signal.channel_index(*channel_id_) : 0;
  signal.set_channel_values(c, smooth_same(signal.get_channel_values(signal.channel_ids().at(c)), kernel_size_));
  return Status::ok_status();
}

}  // namespace ts
