// File: include/ts/core/util/yaml_value.hpp
#pragma once

#include <yaml-cpp/yaml.h>

#include "ts/core/value.hpp"

namespace ts {

// YAML (and therefore JSON) node -> Value.
//
// Quoted scalars stay strings. Plain scalars become null, bool, integer or
// floating point when they read as one, otherwise strings.
Value yaml_to_value(const YAML::Node& node);

// Map nodes -> ValueMap; anything else yields an empty map.
ValueMap yaml_to_value_map(const YAML::Node& node);

}  // namespace ts
