// File: src/core/util/config_loader.cpp
#include "ts/core/util/config_loader.hpp"

#include <filesystem>
#include <utility>

#include "ts/core/log.hpp"
#include "ts/core/util/yaml_value.hpp"

namespace ts {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth = 0) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (is_map(root) && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

// -----------------------------
// Sections
// -----------------------------

static Result<ClassSpec> parse_class_spec(const YAML::Node& n, const std::string& where) {
  if (!is_map(n)) return Result<ClassSpec>::err(Status::invalid_argument(where + " must be a map"));
  ClassSpec spec;
  maybe_set(n, "class", spec.class_name);
  if (spec.class_name.empty()) return Result<ClassSpec>::err(Status::invalid_argument(where + ".class is required"));
  if (n["args"] && !n["args"].IsNull()) {
    if (!n["args"].IsMap()) return Result<ClassSpec>::err(Status::invalid_argument(where + ".args must be a map"));
    spec.args = yaml_to_value_map(n["args"]);
  }
  if (n["package_path"]) {
    log::warn("{}.package_path is ignored; {} must be a registered class", where, spec.class_name);
  }
  return Result<ClassSpec>::ok(std::move(spec));
}

static Result<ReaderConfig> parse_reader(const std::string& name, const YAML::Node& n) {
  const std::string where = "readers." + name;
  auto spec_r = parse_class_spec(n, where);
  if (!spec_r.ok()) return Result<ReaderConfig>::err(spec_r.status());

  ReaderConfig rc;
  rc.name = name;
  rc.reader = spec_r.take_value();
  maybe_set(n, "empty_reads_allowed", rc.empty_reads_allowed);
  maybe_set(n, "simulate_delay", rc.simulate_delay);

  if (n["extra_buffers"]) {
    const YAML::Node buffers = n["extra_buffers"];
    if (!buffers.IsMap()) return Result<ReaderConfig>::err(Status::invalid_argument(where + ".extra_buffers must be a map"));
    for (const auto& it : buffers) {
      const auto buffer_name = it.first.as<std::string>();
      const YAML::Node b = it.second;
      ExtraBufferConfig extra;
      extra.reader_result_name = buffer_name;
      if (is_map(b)) {
        maybe_set(b, "reader_result_name", extra.reader_result_name);
        if (b["transformers"]) {
          if (!b["transformers"].IsSequence()) {
            return Result<ReaderConfig>::err(
                Status::invalid_argument(where + ".extra_buffers." + buffer_name + ".transformers must be a list"));
          }
          for (std::size_t i = 0; i < b["transformers"].size(); ++i) {
            auto t_r = parse_class_spec(b["transformers"][i],
                                        where + ".extra_buffers." + buffer_name + ".transformers[" +
                                            std::to_string(i) + "]");
            if (!t_r.ok()) return Result<ReaderConfig>::err(t_r.status());
            extra.transformers.push_back(t_r.take_value());
          }
        }
      }
      rc.extra_buffers.emplace_back(buffer_name, std::move(extra));
    }
  }

  if (is_map(n["sync"]) && n["sync"].size() > 0) {
    const YAML::Node s = n["sync"];
    ReaderSyncConfig sync;
    sync.reader_name = name;
    maybe_set(s, "is_reference", sync.is_reference);
    maybe_set(s, "reader_result_name", sync.reader_result_name);
    if (s["event_value"] && !s["event_value"].IsNull()) sync.event_value = s["event_value"].as<double>();
    maybe_set(s, "event_value_index", sync.event_value_index);
    maybe_set(s, "reader_name", sync.reader_name);
    rc.sync = std::move(sync);
  }

  return Result<ReaderConfig>::ok(std::move(rc));
}

static Status parse_trials(const YAML::Node& t, TrialsConfig& out) {
  if (!t) return Status::ok_status();
  if (!t.IsMap()) return Status::invalid_argument("trials must be a map");

  maybe_set(t, "start_buffer", out.start_buffer);
  maybe_set(t, "start_value", out.start_value);
  maybe_set(t, "start_value_index", out.start_value_index);
  maybe_set(t, "trial_start_time", out.trial_start_time);
  maybe_set(t, "trial_count", out.trial_count);
  maybe_set(t, "trial_log_mod", out.trial_log_mod);
  maybe_set(t, "wrt_buffer", out.wrt_buffer);
  maybe_set(t, "wrt_value", out.wrt_value);
  maybe_set(t, "wrt_value_index", out.wrt_value_index);

  if (t["enhancers"]) {
    const YAML::Node enhancers = t["enhancers"];
    if (!enhancers.IsSequence()) return Status::invalid_argument("trials.enhancers must be a list");
    for (std::size_t i = 0; i < enhancers.size(); ++i) {
      auto spec_r = parse_class_spec(enhancers[i], "trials.enhancers[" + std::to_string(i) + "]");
      if (!spec_r.ok()) return spec_r.status();
      EnhancerConfig ec;
      ec.enhancer = spec_r.take_value();
      if (enhancers[i]["when"] && !enhancers[i]["when"].IsNull()) ec.when = enhancers[i]["when"].as<std::string>();
      out.enhancers.push_back(std::move(ec));
    }
  }
  return Status::ok_status();
}

// -----------------------------
// Public
// -----------------------------

Status apply_reader_overrides(YAML::Node& experiment, const std::vector<std::string>& overrides) {
  for (const auto& o : overrides) {
    const auto dot = o.find('.');
    const auto eq = o.find('=', dot == std::string::npos ? 0 : dot);
    if (dot == std::string::npos || eq == std::string::npos || dot == 0 || eq == dot + 1) {
      return Status::invalid_argument("reader override must look like reader.arg=value: " + o);
    }
    const std::string reader_name = o.substr(0, dot);
    const std::string arg = o.substr(dot + 1, eq - dot - 1);
    const std::string value = o.substr(eq + 1);

    YAML::Node reader = experiment["readers"][reader_name];
    if (!is_map(reader)) return Status::invalid_argument("reader override for unknown reader: " + reader_name);
    reader["args"][arg] = value;
  }
  return Status::ok_status();
}

Result<ExperimentConfig> experiment_config_from_yaml(const YAML::Node& y, const YAML::Node& subject) {
  if (!is_map(y)) return Result<ExperimentConfig>::err(Status::invalid_argument("experiment config must be a map"));

  ExperimentConfig cfg;
  try {
    cfg.experiment = yaml_to_value_map(y["experiment"]);
    if (is_map(subject)) cfg.subject = yaml_to_value_map(subject["subject"]);

    const YAML::Node readers = y["readers"];
    if (!is_map(readers)) return Result<ExperimentConfig>::err(Status::invalid_argument("readers must be a map"));
    for (const auto& it : readers) {
      auto r = parse_reader(it.first.as<std::string>(), it.second);
      if (!r.ok()) return Result<ExperimentConfig>::err(r.status());
      cfg.readers.push_back(r.take_value());
    }

    const Status st = parse_trials(y["trials"], cfg.trials);
    if (!st.ok()) return Result<ExperimentConfig>::err(st);
  } catch (const YAML::Exception& e) {
    return Result<ExperimentConfig>::err(Status::invalid_argument(std::string("bad config value: ") + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_experiment_config(cfg);
  if (!s.ok()) return Result<ExperimentConfig>::err(s);

  return Result<ExperimentConfig>::ok(std::move(cfg));
}

Result<ExperimentConfig> load_experiment_config(const ConfigLoadOptions& options, const FileFinder& finder) {
  if (options.experiment_path.empty()) {
    return Result<ExperimentConfig>::err(Status::invalid_argument("experiment config path is empty"));
  }

  auto yaml_r = load_with_includes(fs::path(finder.find(options.experiment_path)));
  if (!yaml_r.ok()) return Result<ExperimentConfig>::err(yaml_r.status());
  YAML::Node experiment = yaml_r.take_value();

  const Status st = apply_reader_overrides(experiment, options.reader_overrides);
  if (!st.ok()) return Result<ExperimentConfig>::err(st);

  YAML::Node subject;
  if (!options.subject_path.empty()) {
    auto subject_r = load_yaml_file(fs::path(finder.find(options.subject_path)));
    if (!subject_r.ok()) return Result<ExperimentConfig>::err(subject_r.status());
    subject = subject_r.take_value();
  }

  return experiment_config_from_yaml(experiment, subject);
}

}  // namespace ts
