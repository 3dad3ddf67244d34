// File: include/ts/adapters/transformers/standard_transformers.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "ts/core/io/transformer.hpp"

namespace ts {

// value = (value + offset) * gain.
// Event lists: the one value column at value_index. Signals: every channel.
class OffsetThenGain final : public Transformer {
 public:
  OffsetThenGain(double offset = 0.0, double gain = 1.0, std::size_t value_index = 0)
      : offset_(offset), gain_(gain), value_index_(value_index) {}

  Result<std::unique_ptr<BufferData>> transform(std::unique_ptr<BufferData> data) const override;
  std::string name() const override { return "OffsetThenGain"; }

  [[nodiscard]] double offset() const noexcept { return offset_; }
  [[nodiscard]] double gain() const noexcept { return gain_; }
  [[nodiscard]] std::size_t value_index() const noexcept { return value_index_; }

 private:
  double offset_{0.0};
  double gain_{1.0};
  std::size_t value_index_{0};
};

// Keeps events whose value is in [min, max). Other data passes through.
class FilterRange final : public Transformer {
 public:
  FilterRange(std::optional<double> min = std::nullopt,
              std::optional<double> max = std::nullopt,
              std::size_t value_index = 0)
      : min_(min), max_(max), value_index_(value_index) {}

  Result<std::unique_ptr<BufferData>> transform(std::unique_ptr<BufferData> data) const override;
  std::string name() const override { return "FilterRange"; }

 private:
  std::optional<double> min_;
  std::optional<double> max_;
  std::size_t value_index_{0};
};

}  // namespace ts
