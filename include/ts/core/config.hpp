// File: include/ts/core/config.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ts/core/io/reader.hpp"
#include "ts/core/status.hpp"
#include "ts/core/types.hpp"
#include "ts/core/value.hpp"

namespace ts {

// -----------------------------
// Components by name
// -----------------------------
// "class" picks a factory from the ComponentRegistry, "args" are handed to it.
struct ClassSpec {
  std::string class_name;
  ValueMap args;
};

// -----------------------------
// Readers
// -----------------------------
struct ExtraBufferConfig {
  // Defaults to the buffer name.
  std::string reader_result_name;
  std::vector<ClassSpec> transformers;
};

struct ReaderConfig {
  ReaderName name;
  ClassSpec reader;

  // Aliases and transformations on top of the default pass-through routes,
  // keyed by buffer name.
  std::vector<std::pair<BufferName, ExtraBufferConfig>> extra_buffers;

  // reader_name defaults to this reader's name.
  std::optional<ReaderSyncConfig> sync;

  int empty_reads_allowed{3};

  // Only honoured when the run allows simulated delay.
  bool simulate_delay{false};
};

// -----------------------------
// Trials
// -----------------------------
struct EnhancerConfig {
  ClassSpec enhancer;
  std::optional<std::string> when;
};

struct TrialsConfig {
  BufferName start_buffer{"start"};
  double start_value{0.0};
  std::size_t start_value_index{0};
  double trial_start_time{0.0};
  int trial_count{0};
  int trial_log_mod{50};

  BufferName wrt_buffer{"wrt"};
  double wrt_value{0.0};
  std::size_t wrt_value_index{0};

  std::vector<EnhancerConfig> enhancers;
};

// -----------------------------
// Root config
// -----------------------------
struct ExperimentConfig {
  // Free-form info handed to every enhancer.
  ValueMap experiment;
  ValueMap subject;

  // In file order.
  std::vector<ReaderConfig> readers;
  TrialsConfig trials;
};

// Minimal validation (keep it strict; fail early).
Status validate_experiment_config(const ExperimentConfig& cfg);

}  // namespace ts
