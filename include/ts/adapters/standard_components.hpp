// File: include/ts/adapters/standard_components.hpp
#pragma once

#include "ts/core/pipeline/component_registry.hpp"
#include "ts/core/status.hpp"

namespace ts {

// Registers the readers, transformers and enhancers that ship with trialsync,
// under their class names:
//   readers:      CsvNumericEventReader, CsvSignalReader
//   transformers: OffsetThenGain, FilterRange
//   enhancers:    TrialDurationEnhancer, PairedCodesEnhancer, EventTimesEnhancer,
//                 ExpressionEnhancer, SignalSmoother
Status register_standard_components(ComponentRegistry& registry);

}  // namespace ts
