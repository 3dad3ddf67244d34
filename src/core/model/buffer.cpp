// File: src/core/model/buffer.cpp
#include "ts/core/model/buffer.hpp"

#include <stdexcept>
#include <utility>

namespace ts {

Buffer::Buffer(std::unique_ptr<BufferData> data, double clock_drift)
    : data_(std::move(data)), clock_drift_(clock_drift) {
  if (!data_) throw std::invalid_argument("Buffer needs data");
}

OptionalTime Buffer::raw_to_reference(OptionalTime raw_time) const noexcept {
  if (!raw_time) return std::nullopt;
  return *raw_time - clock_drift_;
}

OptionalTime Buffer::reference_to_raw(OptionalTime reference_time) const noexcept {
  if (!reference_time) return std::nullopt;
  return *reference_time + clock_drift_;
}

}  // namespace ts
