// File: src/core/model/numeric_event_list.cpp
#include "ts/core/model/numeric_event_list.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ts {

NumericEventList::NumericEventList(std::size_t columns) : columns_(columns) {
  if (columns_ < 2) {
    throw std::invalid_argument("NumericEventList needs >= 2 columns, got " + std::to_string(columns_));
  }
}

NumericEventList::NumericEventList(const std::vector<std::vector<double>>& rows,
                                   std::size_t columns_if_empty)
    : NumericEventList(rows.empty() ? columns_if_empty : rows.front().size()) {
  data_.reserve(rows.size() * columns_);
  for (const auto& r : rows) {
    if (r.size() != columns_) {
      throw std::invalid_argument("NumericEventList rows must all have " + std::to_string(columns_) +
                                  " columns, got " + std::to_string(r.size()));
    }
    data_.insert(data_.end(), r.begin(), r.end());
  }
}

std::size_t NumericEventList::value_column(std::size_t value_index) const {
  const std::size_t col = value_index + 1;
  if (col >= columns_) {
    throw std::out_of_range("value_index " + std::to_string(value_index) + " out of range for " +
                            std::to_string(values_per_event()) + " values per event");
  }
  return col;
}

bool NumericEventList::in_range(std::size_t row, OptionalTime start_time, OptionalTime end_time) const {
  const double t = data_[row * columns_];
  if (start_time && t < *start_time) return false;
  if (end_time && t >= *end_time) return false;
  return true;
}

std::unique_ptr<BufferData> NumericEventList::copy() const {
  return std::make_unique<NumericEventList>(*this);
}

std::unique_ptr<BufferData> NumericEventList::copy_time_range(OptionalTime start_time,
                                                              OptionalTime end_time) const {
  auto out = std::make_unique<NumericEventList>(columns_);
  const std::size_t n = event_count();
  for (std::size_t i = 0; i < n; ++i) {
    if (!in_range(i, start_time, end_time)) continue;
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(i * columns_);
    out->data_.insert(out->data_.end(), first, first + static_cast<std::ptrdiff_t>(columns_));
  }
  return out;
}

Status NumericEventList::append(const BufferData& other) {
  if (other.empty()) return Status::ok_status();

  const auto* events = dynamic_cast<const NumericEventList*>(&other);
  if (!events) {
    return Status::invalid_argument(std::string("can't append ") + other.kind_name() +
                                    " to NumericEventList");
  }
  if (events->columns_ != columns_) {
    return Status::invalid_argument("can't append events with " + std::to_string(events->columns_) +
                                    " columns to events with " + std::to_string(columns_));
  }
  data_.insert(data_.end(), events->data_.begin(), events->data_.end());
  return Status::ok_status();
}

void NumericEventList::discard_before(double start_time) {
  std::vector<double> kept;
  kept.reserve(data_.size());
  const std::size_t n = event_count();
  for (std::size_t i = 0; i < n; ++i) {
    if (data_[i * columns_] < start_time) continue;
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(i * columns_);
    kept.insert(kept.end(), first, first + static_cast<std::ptrdiff_t>(columns_));
  }
  data_.swap(kept);
}

void NumericEventList::shift_times(double shift) {
  for (std::size_t i = 0; i < data_.size(); i += columns_) data_[i] += shift;
}

OptionalTime NumericEventList::get_end_time() const {
  // Rows from separate reads need not be sorted, so take the max.
  OptionalTime end;
  for (std::size_t i = 0; i < data_.size(); i += columns_) {
    if (!end || data_[i] > *end) end = data_[i];
  }
  return end;
}

bool NumericEventList::equals(const BufferData& other) const {
  const auto* events = dynamic_cast<const NumericEventList*>(&other);
  return events && *this == *events;
}

bool NumericEventList::operator==(const NumericEventList& other) const {
  if (empty() && other.empty()) return true;
  return columns_ == other.columns_ && data_ == other.data_;
}

double NumericEventList::value_at(std::size_t row, std::size_t value_index) const {
  return data_.at(row * columns_ + value_column(value_index));
}

std::vector<double> NumericEventList::row(std::size_t row) const {
  if (row >= event_count()) throw std::out_of_range("event row " + std::to_string(row));
  const auto first = data_.begin() + static_cast<std::ptrdiff_t>(row * columns_);
  return std::vector<double>(first, first + static_cast<std::ptrdiff_t>(columns_));
}

std::vector<double> NumericEventList::get_times() const {
  std::vector<double> out;
  out.reserve(event_count());
  for (std::size_t i = 0; i < data_.size(); i += columns_) out.push_back(data_[i]);
  return out;
}

std::vector<double> NumericEventList::get_times_of(double event_value,
                                                   std::size_t value_index,
                                                   OptionalTime start_time,
                                                   OptionalTime end_time) const {
  const std::size_t col = value_column(value_index);
  std::vector<double> out;
  const std::size_t n = event_count();
  for (std::size_t i = 0; i < n; ++i) {
    if (!in_range(i, start_time, end_time)) continue;
    if (data_[i * columns_ + col] == event_value) out.push_back(data_[i * columns_]);
  }
  return out;
}

std::vector<double> NumericEventList::get_values(OptionalTime start_time,
                                                 OptionalTime end_time,
                                                 std::size_t value_index) const {
  const std::size_t col = value_column(value_index);
  std::vector<double> out;
  const std::size_t n = event_count();
  for (std::size_t i = 0; i < n; ++i) {
    if (in_range(i, start_time, end_time)) out.push_back(data_[i * columns_ + col]);
  }
  return out;
}

NumericEventList NumericEventList::copy_value_range(std::optional<double> min,
                                                    std::optional<double> max,
                                                    std::size_t value_index) const {
  const std::size_t col = value_column(value_index);
  NumericEventList out(columns_);
  const std::size_t n = event_count();
  for (std::size_t i = 0; i < n; ++i) {
    const double v = data_[i * columns_ + col];
    if (min && v < *min) continue;
    if (max && v >= *max) continue;
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(i * columns_);
    out.data_.insert(out.data_.end(), first, first + static_cast<std::ptrdiff_t>(columns_));
  }
  return out;
}

void NumericEventList::apply_offset_then_gain(double offset, double gain, std::size_t value_index) {
  const std::size_t col = value_column(value_index);
  for (std::size_t i = col; i < data_.size(); i += columns_) {
    data_[i] = (data_[i] + offset) * gain;
  }
}

}  // namespace ts
