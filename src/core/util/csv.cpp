// File: src/core/util/csv.cpp
#include "ts/core/util/csv.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>

namespace ts {
namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

std::vector<std::string> split_csv_line(const std::string& line, char delimiter) {
  std::string text = line;
  if (!text.empty() && text.back() == '\r') text.pop_back();

  std::vector<std::string> fields;
  if (text.empty()) return fields;

  std::string cur;
  bool in_quotes = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"') {
      if (in_quotes && i + 1 < text.size() && text[i + 1] == '"') {
        cur.push_back('"');
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delimiter) {
      fields.push_back(std::move(cur));
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  fields.push_back(std::move(cur));
  return fields;
}

std::optional<double> parse_csv_double(const std::string& cell) {
  const std::string t = trim(cell);
  if (t.empty()) return std::nullopt;

  const std::string low = to_lower(t);
  if (low == "nan" || low == "+nan" || low == "-nan") return std::numeric_limits<double>::quiet_NaN();
  if (low == "inf" || low == "+inf" || low == "infinity" || low == "+infinity") {
    return std::numeric_limits<double>::infinity();
  }
  if (low == "-inf" || low == "-infinity") return -std::numeric_limits<double>::infinity();

  std::istringstream iss(t);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) return std::nullopt;
  iss >> std::ws;
  if (!iss.eof()) return std::nullopt;
  return v;
}

std::optional<std::vector<double>> parse_csv_numbers(const std::vector<std::string>& fields) {
  std::vector<double> out;
  out.reserve(fields.size());
  for (const auto& f : fields) {
    const auto v = parse_csv_double(f);
    if (!v) return std::nullopt;
    out.push_back(*v);
  }
  return out;
}

Result<std::vector<std::string>> peek_csv_row(const std::string& path, char delimiter) {
  using R = Result<std::vector<std::string>>;
  std::ifstream in(path);
  if (!in.is_open()) return R::err(Status::not_found("CSV file not found: " + path));

  std::string line;
  if (!std::getline(in, line)) return R::ok({});
  return R::ok(split_csv_line(line, delimiter));
}

Result<std::vector<std::map<std::string, std::string>>> read_csv_dicts(const std::string& path, char delimiter) {
  using R = Result<std::vector<std::map<std::string, std::string>>>;
  std::ifstream in(path);
  if (!in.is_open()) return R::err(Status::not_found("CSV file not found: " + path));

  std::vector<std::string> header;
  std::vector<std::map<std::string, std::string>> rows;
  std::string line;
  while (std::getline(in, line)) {
    std::vector<std::string> fields = split_csv_line(line, delimiter);
    if (fields.empty()) continue;
    if (header.empty()) {
      for (auto& f : fields) header.push_back(trim(f));
      continue;
    }

    std::map<std::string, std::string> row;
    for (std::size_t i = 0; i < fields.size() && i < header.size(); ++i) row.emplace(header[i], std::move(fields[i]));
    rows.push_back(std::move(row));
  }
  if (in.bad()) return R::err(Status::io_error("failed reading '" + path + "'"));
  return R::ok(std::move(rows));
}

}  // namespace ts
