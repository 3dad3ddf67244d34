// File: include/ts/core/model/buffer_data.hpp
#pragma once

#include <map>
#include <memory>
#include <string>

#include "ts/core/status.hpp"
#include "ts/core/types.hpp"

namespace ts {

// What every time-series type must support in order to flow from a Reader,
// through Buffers, into Trials.
//
// Range conventions:
//  - copy_time_range() selects the half-open interval [start, end)
//  - an empty start or end means unbounded on that side
class BufferData {
 public:
  enum class Kind {
    kNumericEventList,
    kSignalChunk,
  };

  virtual ~BufferData() = default;

  [[nodiscard]] virtual Kind kind() const noexcept = 0;

  // Independent deep copy.
  [[nodiscard]] virtual std::unique_ptr<BufferData> copy() const = 0;

  // Never mutates this object.
  [[nodiscard]] virtual std::unique_ptr<BufferData> copy_time_range(OptionalTime start_time,
                                                                    OptionalTime end_time) const = 0;

  // Concatenate in place. An empty `other` is always accepted.
  // Returns invalid_argument when kinds or shapes don't match; this is left unchanged then.
  virtual Status append(const BufferData& other) = 0;

  // Drop data strictly before start_time.
  virtual void discard_before(double start_time) = 0;

  virtual void shift_times(double shift) = 0;

  // Latest time still held, or nullopt when there is no data.
  [[nodiscard]] virtual OptionalTime get_end_time() const = 0;

  [[nodiscard]] virtual bool empty() const noexcept = 0;

  [[nodiscard]] virtual bool equals(const BufferData& other) const = 0;

  [[nodiscard]] const char* kind_name() const noexcept;
};

// Named results from a Reader, keyed like "events", "spikes", "samples".
using BufferDataMap = std::map<std::string, std::unique_ptr<BufferData>>;

BufferDataMap copy_all(const BufferDataMap& results);

}  // namespace ts
