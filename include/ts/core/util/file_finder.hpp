// File: include/ts/core/util/file_finder.hpp
#pragma once

#include <string>
#include <vector>

namespace ts {

// Locates files relative to a list of path prefixes.
//
// Rules, in order:
//  - a leading "~" expands to $HOME
//  - absolute paths are returned as-is
//  - the first prefix p where p/original exists wins
//  - otherwise the (expanded) original is returned unchanged
class FileFinder {
 public:
  explicit FileFinder(std::vector<std::string> search_path = {});

  [[nodiscard]] std::string find(const std::string& original) const;

  [[nodiscard]] const std::vector<std::string>& search_path() const noexcept { return search_path_; }

 private:
  std::vector<std::string> search_path_;
};

}  // namespace ts
