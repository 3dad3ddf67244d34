// File: src/core/trials/trial_file.cpp
#include "ts/core/trials/trial_file.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include "ts/core/trials/jsonl_trial_file.hpp"

namespace ts {
namespace {

// ".json" and ".gz" for "trials.json.gz", lower-cased.
std::set<std::string> lower_suffixes(const std::string& path) {
  std::string name = std::filesystem::path(path).filename().string();
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::set<std::string> out;
  std::size_t dot = name.find('.', 1);
  while (dot != std::string::npos) {
    const std::size_t next = name.find('.', dot + 1);
    out.insert(name.substr(dot, next == std::string::npos ? std::string::npos : next - dot));
    dot = next;
  }
  return out;
}

}  // namespace

Result<std::unique_ptr<TrialFile>> TrialFile::for_file_suffix(const std::string& path, bool create_empty) {
  using R = Result<std::unique_ptr<TrialFile>>;
  const std::set<std::string> suffixes = lower_suffixes(path);
  if (suffixes.count(".json") || suffixes.count(".jsonl")) {
    return R::ok(std::make_unique<JsonlTrialFile>(path, create_empty));
  }
  return R::err(Status::unsupported("unsupported trial file suffix: " + path));
}

}  // namespace ts
