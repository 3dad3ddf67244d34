// File: include/ts/core/pipeline/component_args.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ts/core/status.hpp"
#include "ts/core/types.hpp"
#include "ts/core/value.hpp"

namespace ts {

// Typed lookups into a component's "args" map.
//
// A missing key falls back to `fallback`, or is invalid_argument when there is
// none. A present key of the wrong type is always invalid_argument.
// Numbers given as strings (e.g. from a command line override) are accepted.
Result<std::string> arg_string(const ValueMap& args,
                               const std::string& key,
                               const std::optional<std::string>& fallback = std::nullopt);

Result<double> arg_double(const ValueMap& args, const std::string& key, std::optional<double> fallback = std::nullopt);

Result<std::int64_t> arg_int(const ValueMap& args,
                             const std::string& key,
                             std::optional<std::int64_t> fallback = std::nullopt);

// Missing or null -> nullopt.
Result<std::optional<double>> arg_optional_double(const ValueMap& args, const std::string& key);

// A single string is taken as a one-element list.
Result<std::vector<std::string>> arg_string_list(const ValueMap& args,
                                                 const std::string& key,
                                                 const std::optional<std::vector<std::string>>& fallback = std::nullopt);

// Missing or null -> nullopt. Integers stay integers, anything else is a string id.
Result<std::optional<ChannelId>> arg_channel_id(const ValueMap& args, const std::string& key);

// Missing -> null Value.
[[nodiscard]] Value arg_value(const ValueMap& args, const std::string& key);

}  // namespace ts
