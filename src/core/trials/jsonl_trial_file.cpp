// File: src/core/trials/jsonl_trial_file.cpp
#include "ts/core/trials/jsonl_trial_file.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include "ts/core/log.hpp"
#include "ts/core/util/yaml_value.hpp"

namespace ts {
namespace {

// -----------------------------
// Writing
// -----------------------------

// Shortest text that reads back to the same double, always with a decimal
// point or exponent so it doesn't read back as an integer.
std::string json_double(double v) {
  if (!std::isfinite(v)) return "null";
  std::string s = fmt::format("{}", v);
  if (s.find_first_of(".eE") == std::string::npos) s += ".0";
  return s;
}

std::string json_optional_double(const std::optional<double>& v) { return v ? json_double(*v) : "null"; }

std::string json_string(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
  return out;
}

void write_value(std::ostringstream& ss, const Value& v) {
  switch (v.type()) {
    case Value::Type::kNull: ss << "null"; break;
    case Value::Type::kBool: ss << (v.as_bool() ? "true" : "false"); break;
    case Value::Type::kInt: ss << v.as_int(); break;
    case Value::Type::kDouble: ss << json_double(v.as_double()); break;
    case Value::Type::kString: ss << json_string(v.as_string()); break;
    case Value::Type::kList: {
      ss << "[";
      const char* sep = "";
      for (const auto& item : v.as_list()) {
        ss << sep;
        write_value(ss, item);
        sep = ", ";
      }
      ss << "]";
      break;
    }
    case Value::Type::kMap: {
      ss << "{";
      const char* sep = "";
      for (const auto& [key, item] : v.as_map()) {
        ss << sep << json_string(key) << ": ";
        write_value(ss, item);
        sep = ", ";
      }
      ss << "}";
      break;
    }
  }
}

void write_rows(std::ostringstream& ss, const std::vector<double>& flat, std::size_t columns) {
  ss << "[";
  for (std::size_t i = 0; columns > 0 && i < flat.size(); i += columns) {
    if (i > 0) ss << ", ";
    ss << "[";
    for (std::size_t c = 0; c < columns; ++c) {
      if (c > 0) ss << ", ";
      ss << json_double(flat[i + c]);
    }
    ss << "]";
  }
  ss << "]";
}

void write_channel_id(std::ostringstream& ss, const ChannelId& id) {
  if (const auto* i = std::get_if<std::int64_t>(&id)) {
    ss << *i;
  } else {
    ss << json_string(std::get<std::string>(id));
  }
}

// -----------------------------
// Reading
// -----------------------------

double read_double(const YAML::Node& n) {
  if (!n || n.IsNull()) return std::nan("");
  return n.as<double>();
}

std::optional<double> read_optional_double(const YAML::Node& n) {
  if (!n || n.IsNull()) return std::nullopt;
  return n.as<double>();
}

Result<std::vector<std::vector<double>>> read_rows(const YAML::Node& n, const std::string& what) {
  using R = Result<std::vector<std::vector<double>>>;
  if (!n.IsSequence()) return R::err(Status::corrupt_data(what + " must be a list of rows"));
  std::vector<std::vector<double>> rows;
  rows.reserve(n.size());
  for (const auto& row_node : n) {
    if (!row_node.IsSequence()) return R::err(Status::corrupt_data(what + " rows must be lists"));
    std::vector<double> row;
    row.reserve(row_node.size());
    for (const auto& v : row_node) row.push_back(read_double(v));
    rows.push_back(std::move(row));
  }
  return R::ok(std::move(rows));
}

Result<SignalChunk> read_signal(const YAML::Node& n, const std::string& name) {
  using R = Result<SignalChunk>;
  if (!n.IsMap()) return R::err(Status::corrupt_data("signal " + name + " must be an object"));

  auto rows_r = read_rows(n["signal_data"], "signal " + name + " signal_data");
  if (!rows_r.ok()) return R::err(rows_r.status());

  std::vector<ChannelId> channel_ids;
  const YAML::Node ids = n["channel_ids"];
  if (ids && ids.IsSequence()) {
    for (const auto& id : ids) {
      const Value v = yaml_to_value(id);
      if (v.is_int()) {
        channel_ids.emplace_back(v.as_int());
      } else {
        channel_ids.emplace_back(id.Scalar());
      }
    }
  }

  try {
    return R::ok(SignalChunk::from_rows(rows_r.value(), read_optional_double(n["sample_frequency"]),
                                        read_optional_double(n["first_sample_time"]), std::move(channel_ids)));
  } catch (const std::invalid_argument& e) {
    return R::err(Status::corrupt_data("signal " + name + ": " + e.what()));
  }
}

Result<Trial> trial_from_yaml(const YAML::Node& y) {
  using R = Result<Trial>;
  if (!y.IsMap()) return R::err(Status::corrupt_data("trial must be a JSON object"));
  if (!y["start_time"]) return R::err(Status::corrupt_data("trial is missing start_time"));

  Trial trial;
  trial.start_time = y["start_time"].as<double>();
  trial.end_time = read_optional_double(y["end_time"]);
  if (y["wrt_time"]) trial.wrt_time = y["wrt_time"].as<double>();

  if (y["numeric_events"]) {
    for (const auto& it : y["numeric_events"]) {
      const auto name = it.first.as<std::string>();
      auto rows_r = read_rows(it.second, "numeric_events " + name);
      if (!rows_r.ok()) return R::err(rows_r.status());
      try {
        trial.numeric_events.insert_or_assign(name, NumericEventList(rows_r.value()));
      } catch (const std::invalid_argument& e) {
        return R::err(Status::corrupt_data("numeric_events " + name + ": " + e.what()));
      }
    }
  }

  if (y["signals"]) {
    for (const auto& it : y["signals"]) {
      const auto name = it.first.as<std::string>();
      auto signal_r = read_signal(it.second, name);
      if (!signal_r.ok()) return R::err(signal_r.status());
      trial.signals.insert_or_assign(name, signal_r.take_value());
    }
  }

  trial.enhancements = yaml_to_value_map(y["enhancements"]);

  if (y["enhancement_categories"]) {
    for (const auto& it : y["enhancement_categories"]) {
      auto& names = trial.enhancement_categories[it.first.as<std::string>()];
      for (const auto& name : it.second) names.push_back(name.as<std::string>());
    }
  }

  return R::ok(std::move(trial));
}

}  // namespace

JsonlTrialFile::JsonlTrialFile(std::string path, bool create_empty)
    : path_(std::move(path)), create_empty_(create_empty) {}

JsonlTrialFile::~JsonlTrialFile() { close(); }

Status JsonlTrialFile::open() {
  close();

  const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) return Status::io_error("failed creating '" + parent.string() + "': " + ec.message());
  }

  if (create_empty_) log::info("Creating empty JSON trial file: {}", path_);
  f_.open(path_, create_empty_ ? (std::ios::out | std::ios::trunc) : (std::ios::out | std::ios::app));
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  open_ = true;
  return Status::ok_status();
}

std::string JsonlTrialFile::dump_trial(const Trial& trial) {
  std::ostringstream ss;
  ss << "{"
     << "\"start_time\": " << json_double(trial.start_time) << ", "
     << "\"end_time\": " << json_optional_double(trial.end_time) << ", "
     << "\"wrt_time\": " << json_double(trial.wrt_time);

  if (!trial.numeric_events.empty()) {
    ss << ", \"numeric_events\": {";
    const char* sep = "";
    for (const auto& [name, events] : trial.numeric_events) {
      ss << sep << json_string(name) << ": ";
      write_rows(ss, events.raw(), events.columns());
      sep = ", ";
    }
    ss << "}";
  }

  if (!trial.signals.empty()) {
    ss << ", \"signals\": {";
    const char* sep = "";
    for (const auto& [name, signal] : trial.signals) {
      ss << sep << json_string(name) << ": {\"signal_data\": ";
      write_rows(ss, signal.raw(), signal.channel_count());
      ss << ", \"sample_frequency\": " << json_optional_double(signal.sample_frequency())
         << ", \"first_sample_time\": " << json_optional_double(signal.first_sample_time())
         << ", \"channel_ids\": [";
      const char* id_sep = "";
      for (const auto& id : signal.channel_ids()) {
        ss << id_sep;
        write_channel_id(ss, id);
        id_sep = ", ";
      }
      ss << "]}";
      sep = ", ";
    }
    ss << "}";
  }

  if (!trial.enhancements.empty()) {
    ss << ", \"enhancements\": ";
    write_value(ss, Value(trial.enhancements));
  }

  if (!trial.enhancement_categories.empty()) {
    ss << ", \"enhancement_categories\": {";
    const char* sep = "";
    for (const auto& [category, names] : trial.enhancement_categories) {
      ss << sep << json_string(category) << ": [";
      const char* name_sep = "";
      for (const auto& name : names) {
        ss << name_sep << json_string(name);
        name_sep = ", ";
      }
      ss << "]";
      sep = ", ";
    }
    ss << "}";
  }

  ss << "}";
  return ss.str();
}

Result<Trial> JsonlTrialFile::load_trial(const std::string& json_line) {
  try {
    return trial_from_yaml(YAML::Load(json_line));
  } catch (const YAML::Exception& e) {
    return Result<Trial>::err(Status::parse_error(std::string("bad trial JSON: ") + e.what()));
  }
}

Status JsonlTrialFile::append_trial(const Trial& trial) {
  if (!open_) return Status::invalid_argument("JsonlTrialFile::append_trial called while not open");

  f_ << dump_trial(trial) << "\n";
  f_.flush();
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  return Status::ok_status();
}

Result<std::vector<Trial>> JsonlTrialFile::read_trials() const {
  using R = Result<std::vector<Trial>>;

  std::ifstream in(path_);
  if (!in.is_open()) return R::err(Status::not_found("trial file not found: " + path_));

  std::vector<Trial> trials;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty()) continue;
    auto trial_r = load_trial(line);
    if (!trial_r.ok()) {
      return R::err(Status(trial_r.status().code(),
                           path_ + ":" + std::to_string(line_number) + ": " + trial_r.status().message()));
    }
    trials.push_back(trial_r.take_value());
  }
  if (in.bad()) return R::err(Status::io_error("failed reading '" + path_ + "'"));
  return R::ok(std::move(trials));
}

void JsonlTrialFile::close() {
  if (f_.is_open()) f_.close();
  open_ = false;
}

}  // namespace ts
