// File: include/ts/core/model/buffer.hpp
#pragma once

#include <memory>

#include "ts/core/model/buffer_data.hpp"

namespace ts {

// One sliding window of data from a single reader, plus that reader's current
// clock drift relative to the reference reader.
//
// Data is stored on the reader's raw clock:
//   reference = raw - drift
//   raw       = reference + drift
class Buffer {
 public:
  explicit Buffer(std::unique_ptr<BufferData> data, double clock_drift = 0.0);

  [[nodiscard]] BufferData& data() noexcept { return *data_; }
  [[nodiscard]] const BufferData& data() const noexcept { return *data_; }

  // Typed access, nullptr when the data is of another kind.
  template <typename T>
  [[nodiscard]] T* data_as() noexcept { return dynamic_cast<T*>(data_.get()); }
  template <typename T>
  [[nodiscard]] const T* data_as() const noexcept { return dynamic_cast<const T*>(data_.get()); }

  [[nodiscard]] double clock_drift() const noexcept { return clock_drift_; }
  void set_clock_drift(double drift) noexcept { clock_drift_ = drift; }

  [[nodiscard]] double raw_to_reference(double raw_time) const noexcept { return raw_time - clock_drift_; }
  [[nodiscard]] double reference_to_raw(double reference_time) const noexcept {
    return reference_time + clock_drift_;
  }

  // Unbounded stays unbounded.
  [[nodiscard]] OptionalTime raw_to_reference(OptionalTime raw_time) const noexcept;
  [[nodiscard]] OptionalTime reference_to_raw(OptionalTime reference_time) const noexcept;

 private:
  std::unique_ptr<BufferData> data_;
  double clock_drift_{0.0};
};

}  // namespace ts
