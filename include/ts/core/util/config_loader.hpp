// File: include/ts/core/util/config_loader.hpp
#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "ts/core/config.hpp"
#include "ts/core/status.hpp"
#include "ts/core/util/file_finder.hpp"

namespace ts {

struct ConfigLoadOptions {
  std::string experiment_path;

  // Optional; its "subject:" map becomes ExperimentConfig::subject.
  std::string subject_path;

  // "reader_name.arg=value", applied to readers.<reader_name>.args.
  std::vector<std::string> reader_overrides;
};

// Loads an experiment YAML file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - Experiment and subject paths are located with the FileFinder.
//
// Returns a fully populated ExperimentConfig with defaults applied + validated.
Result<ExperimentConfig> load_experiment_config(const ConfigLoadOptions& options, const FileFinder& finder);

// Same, for YAML already in memory.
Result<ExperimentConfig> experiment_config_from_yaml(const YAML::Node& experiment,
                                                     const YAML::Node& subject = YAML::Node());

// Sets readers.<reader>.args.<arg> = value for each "reader.arg=value".
Status apply_reader_overrides(YAML::Node& experiment, const std::vector<std::string>& overrides);

}  // namespace ts
