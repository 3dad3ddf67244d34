// File: src/apps/trialsync/main.cpp
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ts/adapters/standard_components.hpp"
#include "ts/core/log.hpp"
#include "ts/core/pipeline/component_registry.hpp"
#include "ts/core/pipeline/pipeline.hpp"
#include "ts/core/trials/trial_file.hpp"
#include "ts/core/util/config_loader.hpp"
#include "ts/core/util/file_finder.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitRunError = 2;

struct Args {
  std::string command;
  std::string experiment_path;
  std::string subject_path;
  std::string trial_file;
  std::vector<std::string> readers;
  std::vector<std::string> search_path;
  bool simulate_delay{false};
  std::string log_level{"info"};
  bool help{false};
  std::string error;
};

bool is_flag(const std::string& s) { return s.rfind("--", 0) == 0 || s == "-h"; }

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (!is_flag(s) && a.command.empty()) {
      a.command = s;
      continue;
    }
    if (s == "--experiment" && i + 1 < argc) {
      a.experiment_path = argv[++i];
      continue;
    }
    if (s == "--subject" && i + 1 < argc) {
      a.subject_path = argv[++i];
      continue;
    }
    if (s == "--trial-file" && i + 1 < argc) {
      a.trial_file = argv[++i];
      continue;
    }
    if (s == "--log-level" && i + 1 < argc) {
      a.log_level = argv[++i];
      continue;
    }
    if (s == "--simulate-delay") {
      a.simulate_delay = true;
      continue;
    }
    // These take one or more values, up to the next flag.
    if (s == "--readers" || s == "--search-path") {
      auto& values = s == "--readers" ? a.readers : a.search_path;
      while (i + 1 < argc && !is_flag(argv[i + 1])) values.push_back(argv[++i]);
      continue;
    }
    a.error = "unexpected argument: " + s;
    return a;
  }

  if (a.command.empty()) {
    a.error = "missing command";
  } else if (a.command != "convert") {
    a.error = "unknown command: " + a.command;
  } else if (a.experiment_path.empty()) {
    a.error = "--experiment is required";
  } else if (a.trial_file.empty()) {
    a.error = "--trial-file is required";
  }
  return a;
}

void print_usage() {
  std::cout << "trialsync convert\n"
            << "  --experiment <yaml>          experiment config: readers, trials, experiment info\n"
            << "  --trial-file <path>          output, .json or .jsonl\n"
            << "  [--subject <yaml>]           subject info\n"
            << "  [--readers r.arg=value ...]  override reader args\n"
            << "  [--search-path dir ...]      where to look for relative file names\n"
            << "  [--simulate-delay]           play back readers marked simulate_delay in real time\n"
            << "  [--log-level debug|info|warn|error]\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help) {
    print_usage();
    return kExitOk;
  }
  if (!args.error.empty()) {
    std::cerr << args.error << "\n";
    print_usage();
    return kExitConfigError;
  }

  auto level_r = ts::log::parse_level(args.log_level);
  if (!level_r.ok()) {
    std::cerr << level_r.status().message() << "\n";
    return kExitConfigError;
  }
  ts::log::set_level(*level_r);

  const ts::FileFinder finder(args.search_path);

  ts::ConfigLoadOptions options;
  options.experiment_path = args.experiment_path;
  options.subject_path = args.subject_path;
  options.reader_overrides = args.readers;

  auto cfg_r = ts::load_experiment_config(options, finder);
  if (!cfg_r.ok()) {
    ts::log::error("Bad experiment config: {}", cfg_r.status().to_string());
    return kExitConfigError;
  }

  ts::ComponentRegistry registry;
  const ts::Status st_reg = ts::register_standard_components(registry);
  if (!st_reg.ok()) {
    ts::log::error("{}", st_reg.to_string());
    return kExitConfigError;
  }

  auto pipeline_r = ts::Pipeline::from_config(*cfg_r, registry, finder, args.simulate_delay);
  if (!pipeline_r.ok()) {
    ts::log::error("Can't set up readers and trials: {}", pipeline_r.status().to_string());
    return kExitConfigError;
  }
  std::unique_ptr<ts::Pipeline> pipeline = pipeline_r.take_value();

  auto file_r = ts::TrialFile::for_file_suffix(args.trial_file, true);
  if (!file_r.ok()) {
    ts::log::error("{}", file_r.status().to_string());
    return kExitConfigError;
  }
  std::unique_ptr<ts::TrialFile> trial_file = file_r.take_value();

  const ts::Status st_open = trial_file->open();
  if (!st_open.ok()) {
    ts::log::error("{}", st_open.to_string());
    return kExitRunError;
  }

  // Ensure we always close/flush cleanly.
  struct Guard {
    ts::TrialFile& f;
    ~Guard() { f.close(); }
  } guard{*trial_file};

  auto summary_r = pipeline->run(*trial_file);
  if (!summary_r.ok()) {
    ts::log::error("Run failed: {}", summary_r.status().to_string());
    return kExitRunError;
  }

  std::cout << "Trials: " << summary_r->trials_written << " -> " << trial_file->path() << "\n";
  for (const auto& [reader_name, state] : summary_r->readers) {
    std::cout << "  " << reader_name << ": " << ts::router_state_name(state.code);
    if (!state.reason.empty()) std::cout << " (" << state.reason << ")";
    std::cout << "\n";
  }
  std::cout << "OK\n";
  return kExitOk;
}
