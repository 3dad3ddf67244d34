// File: src/core/model/buffer_data.cpp
#include "ts/core/model/buffer_data.hpp"

namespace ts {

const char* BufferData::kind_name() const noexcept {
  switch (kind()) {
    case Kind::kNumericEventList: return "NumericEventList";
    case Kind::kSignalChunk: return "SignalChunk";
  }
  return "unknown";
}

BufferDataMap copy_all(const BufferDataMap& results) {
  BufferDataMap out;
  for (const auto& [name, data] : results) {
    if (data) out.emplace(name, data->copy());
  }
  return out;
}

}  // namespace ts
