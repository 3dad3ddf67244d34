// File: src/core/util/file_finder.cpp
#include "ts/core/util/file_finder.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

namespace ts {
namespace fs = std::filesystem;

static fs::path expand_user(const std::string& p) {
  if (p.empty() || p[0] != '~') return fs::path(p);
  if (p.size() > 1 && p[1] != '/') return fs::path(p);  // ~user is not supported
  const char* home = std::getenv("HOME");
  if (!home) return fs::path(p);
  return fs::path(home) / p.substr(p.size() > 1 ? 2 : 1);
}

FileFinder::FileFinder(std::vector<std::string> search_path) : search_path_(std::move(search_path)) {}

std::string FileFinder::find(const std::string& original) const {
  const fs::path original_path = expand_user(original);
  if (original_path.is_absolute()) return original_path.generic_string();

  std::error_code ec;
  for (const auto& prefix : search_path_) {
    const fs::path prefixed = expand_user(prefix) / original_path;
    if (fs::exists(prefixed, ec)) return prefixed.generic_string();
  }
  return original_path.generic_string();
}

}  // namespace ts
