// File: src/adapters/standard_components.cpp
#include "ts/adapters/standard_components.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ts/adapters/csv/csv_numeric_event_reader.hpp"
#include "ts/adapters/csv/csv_signal_reader.hpp"
#include "ts/adapters/enhancers/standard_enhancers.hpp"
#include "ts/adapters/transformers/standard_transformers.hpp"
#include "ts/core/pipeline/component_args.hpp"

namespace ts {
namespace {

// Unwraps an arg lookup or returns its status from the enclosing factory.
#define TS_ASSIGN_ARG(lhs, expr)                   \
  auto lhs##_r = (expr);                           \
  if (!lhs##_r.ok()) return Out::err(lhs##_r.status()); \
  auto lhs = lhs##_r.take_value()

Result<char> delimiter_arg(const ValueMap& args) {
  auto d = arg_string(args, "delimiter", std::string(","));
  if (!d.ok()) return Result<char>::err(d.status());
  if (d->size() != 1) return Result<char>::err(Status::invalid_argument("delimiter must be one character: " + *d));
  return Result<char>::ok(d->front());
}

Result<std::size_t> index_arg(const ValueMap& args, const std::string& key) {
  auto i = arg_int(args, key, 0);
  if (!i.ok()) return Result<std::size_t>::err(i.status());
  if (*i < 0) return Result<std::size_t>::err(Status::invalid_argument(key + " must be >= 0"));
  return Result<std::size_t>::ok(static_cast<std::size_t>(*i));
}

// -----------------------------
// Readers
// -----------------------------

Result<std::shared_ptr<Reader>> make_csv_numeric_event_reader(const ValueMap& args, const FileFinder& finder) {
  using Out = Result<std::shared_ptr<Reader>>;
  TS_ASSIGN_ARG(csv_file, arg_string(args, "csv_file"));
  TS_ASSIGN_ARG(result_name, arg_string(args, "result_name", std::string("events")));
  TS_ASSIGN_ARG(delimiter, delimiter_arg(args));

  CsvNumericEventReaderConfig cfg;
  cfg.csv_file = finder.find(csv_file);
  cfg.result_name = std::move(result_name);
  cfg.delimiter = delimiter;
  return Out::ok(std::make_shared<CsvNumericEventReader>(std::move(cfg)));
}

Result<std::shared_ptr<Reader>> make_csv_signal_reader(const ValueMap& args, const FileFinder& finder) {
  using Out = Result<std::shared_ptr<Reader>>;
  TS_ASSIGN_ARG(csv_file, arg_string(args, "csv_file"));
  TS_ASSIGN_ARG(sample_frequency, arg_double(args, "sample_frequency", 1.0));
  TS_ASSIGN_ARG(next_sample_time, arg_double(args, "next_sample_time", 0.0));
  TS_ASSIGN_ARG(lines_per_chunk, arg_int(args, "lines_per_chunk", 10));
  TS_ASSIGN_ARG(result_name, arg_string(args, "result_name", std::string("samples")));
  TS_ASSIGN_ARG(delimiter, delimiter_arg(args));

  if (sample_frequency <= 0.0) return Out::err(Status::invalid_argument("sample_frequency must be > 0"));
  if (lines_per_chunk <= 0) return Out::err(Status::invalid_argument("lines_per_chunk must be > 0"));

  CsvSignalReaderConfig cfg;
  cfg.csv_file = finder.find(csv_file);
  cfg.sample_frequency = sample_frequency;
  cfg.next_sample_time = next_sample_time;
  cfg.lines_per_chunk = static_cast<std::size_t>(lines_per_chunk);
  cfg.result_name = std::move(result_name);
  cfg.delimiter = delimiter;
  return Out::ok(std::make_shared<CsvSignalReader>(std::move(cfg)));
}

// -----------------------------
// Transformers
// -----------------------------

Result<std::shared_ptr<const Transformer>> make_offset_then_gain(const ValueMap& args, const FileFinder&) {
  using Out = Result<std::shared_ptr<const Transformer>>;
  TS_ASSIGN_ARG(offset, arg_double(args, "offset", 0.0));
  TS_ASSIGN_ARG(gain, arg_double(args, "gain", 1.0));
  TS_ASSIGN_ARG(value_index, index_arg(args, "value_index"));
  return Out::ok(std::make_shared<OffsetThenGain>(offset, gain, value_index));
}

Result<std::shared_ptr<const Transformer>> make_filter_range(const ValueMap& args, const FileFinder&) {
  using Out = Result<std::shared_ptr<const Transformer>>;
  TS_ASSIGN_ARG(min, arg_optional_double(args, "min"));
  TS_ASSIGN_ARG(max, arg_optional_double(args, "max"));
  TS_ASSIGN_ARG(value_index, index_arg(args, "value_index"));
  return Out::ok(std::make_shared<FilterRange>(min, max, value_index));
}

// -----------------------------
// Enhancers
// -----------------------------

Result<std::shared_ptr<TrialEnhancer>> make_trial_duration(const ValueMap&, const FileFinder&) {
  return Result<std::shared_ptr<TrialEnhancer>>::ok(std::make_shared<TrialDurationEnhancer>());
}

Result<std::vector<CodeRule>> rules_from_args(const ValueMap& args,
                                              const FileFinder& finder,
                                              const std::vector<std::string>& default_types,
                                              bool paired) {
  using Out = Result<std::vector<CodeRule>>;
  TS_ASSIGN_ARG(rules_csv, arg_string_list(args, "rules_csv"));
  TS_ASSIGN_ARG(rule_types, arg_string_list(args, "rule_types", default_types));
  TS_ASSIGN_ARG(delimiter, delimiter_arg(args));

  for (auto& file : rules_csv) file = finder.find(file);
  return load_code_rules(rules_csv, rule_types, paired, delimiter);
}

Result<std::shared_ptr<TrialEnhancer>> make_paired_codes(const ValueMap& args, const FileFinder& finder) {
  using Out = Result<std::shared_ptr<TrialEnhancer>>;
  TS_ASSIGN_ARG(buffer_name, arg_string(args, "buffer_name"));
  TS_ASSIGN_ARG(value_index, index_arg(args, "value_index"));
  TS_ASSIGN_ARG(rules, rules_from_args(args, finder, {"id", "value"}, true));
  return Out::ok(std::make_shared<PairedCodesEnhancer>(std::move(buffer_name), std::move(rules), value_index));
}

Result<std::shared_ptr<TrialEnhancer>> make_event_times(const ValueMap& args, const FileFinder& finder) {
  using Out = Result<std::shared_ptr<TrialEnhancer>>;
  TS_ASSIGN_ARG(buffer_name, arg_string(args, "buffer_name"));
  TS_ASSIGN_ARG(value_index, index_arg(args, "value_index"));
  TS_ASSIGN_ARG(rules, rules_from_args(args, finder, {"time"}, false));
  return Out::ok(std::make_shared<EventTimesEnhancer>(std::move(buffer_name), std::move(rules), value_index));
}

Result<std::shared_ptr<TrialEnhancer>> make_expression(const ValueMap& args, const FileFinder&) {
  using Out = Result<std::shared_ptr<TrialEnhancer>>;
  TS_ASSIGN_ARG(expression, arg_string(args, "expression"));
  TS_ASSIGN_ARG(value_name, arg_string(args, "value_name"));
  TS_ASSIGN_ARG(value_category, arg_string(args, "value_category", std::string("value")));
  TS_ASSIGN_ARG(parsed, TrialExpression::parse(expression, arg_value(args, "default_value")));
  return Out::ok(std::make_shared<ExpressionEnhancer>(std::move(parsed), std::move(value_name),
                                                      std::move(value_category)));
}

Result<std::shared_ptr<TrialEnhancer>> make_signal_smoother(const ValueMap& args, const FileFinder&) {
  using Out = Result<std::shared_ptr<TrialEnhancer>>;
  TS_ASSIGN_ARG(buffer_name, arg_string(args, "buffer_name"));
  TS_ASSIGN_ARG(channel_id, arg_channel_id(args, "channel_id"));
  TS_ASSIGN_ARG(kernel_size, arg_int(args, "kernel_size", 10));
  if (kernel_size <= 0) return Out::err(Status::invalid_argument("kernel_size must be > 0"));
  return Out::ok(std::make_shared<SignalSmoother>(std::move(buffer_name), std::move(channel_id),
                                                  static_cast<int>(kernel_size)));
}

#undef TS_ASSIGN_ARG

}  // namespace

Status register_standard_components(ComponentRegistry& registry) {
  TS_RETURN_IF_ERROR(registry.register_reader("CsvNumericEventReader", make_csv_numeric_event_reader));
  TS_RETURN_IF_ERROR(registry.register_reader("CsvSignalReader", make_csv_signal_reader));

  TS_RETURN_IF_ERROR(registry.register_transformer("OffsetThenGain", make_offset_then_gain));
  TS_RETURN_IF_ERROR(registry.register_transformer("FilterRange", make_filter_range));

  TS_RETURN_IF_ERROR(registry.register_enhancer("TrialDurationEnhancer", make_trial_duration));
  TS_RETURN_IF_ERROR(registry.register_enhancer("PairedCodesEnhancer", make_paired_codes));
  TS_RETURN_IF_ERROR(registry.register_enhancer("EventTimesEnhancer", make_event_times));
  TS_RETURN_IF_ERROR(registry.register_enhancer("ExpressionEnhancer", make_expression));
  TS_RETURN_IF_ERROR(registry.register_enhancer("SignalSmoother", make_signal_smoother));
  return Status::ok_status();
}

}  // namespace ts
