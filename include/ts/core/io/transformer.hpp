// File: include/ts/core/io/transformer.hpp
#pragma once

#include <memory>
#include <string>

#include "ts/core/model/buffer_data.hpp"
#include "ts/core/status.hpp"

namespace ts {

// Transforms values and/or type of BufferData on the way from a Reader to a Buffer.
// Implementations may hold configuration but no data between calls.
class Transformer {
 public:
  virtual ~Transformer() = default;

  // Takes ownership of `data`; may modify it in place and hand it back, or
  // return something new. Non-ok status drops the data for this cycle.
  virtual Result<std::unique_ptr<BufferData>> transform(std::unique_ptr<BufferData> data) const = 0;

  virtual std::string name() const = 0;
};

}  // namespace ts
