// File: src/adapters/transformers/standard_transformers.cpp
#include "ts/adapters/transformers/standard_transformers.hpp"

#include <utility>

#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"
#include "ts/core/model/signal_chunk.hpp"

namespace ts {

using TransformResult = Result<std::unique_ptr<BufferData>>;

TransformResult OffsetThenGain::transform(std::unique_ptr<BufferData> data) const {
  if (!data) return TransformResult::err(Status::invalid_argument("OffsetThenGain: no data"));

  if (auto* events = dynamic_cast<NumericEventList*>(data.get())) {
    events->apply_offset_then_gain(offset_, gain_, value_index_);
  } else if (auto* signal = dynamic_cast<SignalChunk*>(data.get())) {
    signal->apply_offset_then_gain(offset_, gain_);
  } else {
    log::warn("OffsetThenGain doesn't know how to apply to {}", data->kind_name());
  }
  return TransformResult::ok(std::move(data));
}

TransformResult FilterRange::transform(std::unique_ptr<BufferData> data) const {
  if (!data) return TransformResult::err(Status::invalid_argument("FilterRange: no data"));

  if (const auto* events = dynamic_cast<const NumericEventList*>(data.get())) {
    return TransformResult::ok(std::make_unique<NumericEventList>(events->copy_value_range(min_, max_, value_index_)));
  }
  log::warn("FilterRange doesn't know how to apply to {}", data->kind_name());
  return TransformResult::ok(std::move(data));
}

}  // namespace ts
