// File: include/ts/core/util/csv.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ts/core/status.hpp"

namespace ts {

// Splits one CSV line. Fields may be double-quoted; "" inside quotes is a
// literal quote. A trailing '\r' is dropped. An empty line has no fields.
std::vector<std::string> split_csv_line(const std::string& line, char delimiter = ',');

// Strict numeric cell parse in the classic locale, surrounding whitespace
// allowed. Accepts nan/inf spellings. nullopt when the cell isn't a number.
std::optional<double> parse_csv_double(const std::string& cell);

// All fields of a row as numbers, or nullopt if any isn't.
std::optional<std::vector<double>> parse_csv_numbers(const std::vector<std::string>& fields);

// First row of a CSV file, e.g. a header with channel names.
Result<std::vector<std::string>> peek_csv_row(const std::string& path, char delimiter = ',');

// Rows keyed by the header row's column names. Blank lines are skipped;
// short rows leave the missing columns out.
Result<std::vector<std::map<std::string, std::string>>> read_csv_dicts(const std::string& path,
                                                                       char delimiter = ',');

}  // namespace ts
