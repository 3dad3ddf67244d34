// File: include/ts/core/model/numeric_event_list.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "ts/core/model/buffer_data.hpp"

namespace ts {

// One event per row: [timestamp, value_0, value_1, ...].
// Column 0 holds times, value_index i lives in column i + 1.
//
// Value indexes past the last column are contract violations and throw
// std::out_of_range.
class NumericEventList final : public BufferData {
 public:
  // Empty list with the given number of columns (times + values, >= 2).
  explicit NumericEventList(std::size_t columns = 2);

  // All rows must have the same size, >= 2. Throws std::invalid_argument otherwise.
  NumericEventList(const std::vector<std::vector<double>>& rows, std::size_t columns_if_empty = 2);

  Kind kind() const noexcept override { return Kind::kNumericEventList; }
  std::unique_ptr<BufferData> copy() const override;
  std::unique_ptr<BufferData> copy_time_range(OptionalTime start_time, OptionalTime end_time) const override;
  Status append(const BufferData& other) override;
  void discard_before(double start_time) override;
  void shift_times(double shift) override;
  OptionalTime get_end_time() const override;
  bool empty() const noexcept override { return data_.empty(); }
  bool equals(const BufferData& other) const override;

  [[nodiscard]] std::size_t event_count() const noexcept { return columns_ ? data_.size() / columns_ : 0; }
  [[nodiscard]] std::size_t columns() const noexcept { return columns_; }
  [[nodiscard]] std::size_t values_per_event() const noexcept { return columns_ - 1; }

  [[nodiscard]] double time_at(std::size_t row) const { return data_.at(row * columns_); }
  [[nodiscard]] double value_at(std::size_t row, std::size_t value_index = 0) const;
  [[nodiscard]] std::vector<double> row(std::size_t row) const;

  // Row-major backing store, for writers.
  [[nodiscard]] const std::vector<double>& raw() const noexcept { return data_; }

  [[nodiscard]] std::vector<double> get_times() const;

  // Times of events whose value at value_index equals event_value,
  // optionally restricted to [start_time, end_time).
  [[nodiscard]] std::vector<double> get_times_of(double event_value,
                                                 std::size_t value_index = 0,
                                                 OptionalTime start_time = std::nullopt,
                                                 OptionalTime end_time = std::nullopt) const;

  [[nodiscard]] std::vector<double> get_values(OptionalTime start_time = std::nullopt,
                                               OptionalTime end_time = std::nullopt,
                                               std::size_t value_index = 0) const;

  // Events with value in [min, max); an empty bound is unbounded.
  [[nodiscard]] NumericEventList copy_value_range(std::optional<double> min,
                                                  std::optional<double> max,
                                                  std::size_t value_index = 0) const;

  // value = (value + offset) * gain, in place.
  void apply_offset_then_gain(double offset, double gain, std::size_t value_index = 0);

  // Two empty lists are equal whatever their column counts.
  bool operator==(const NumericEventList& other) const;

 private:
  std::size_t value_column(std::size_t value_index) const;
  bool in_range(std::size_t row, OptionalTime start_time, OptionalTime end_time) const;

  std::size_t columns_{2};
  std::vector<double> data_;
};

}  // namespace ts
