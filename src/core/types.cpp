// File: src/core/types.cpp
#include "ts/core/types.hpp"

namespace ts {

std::string to_string(const ChannelId& id) {
  if (const auto* s = std::get_if<std::string>(&id)) return *s;
  return std::to_string(std::get<std::int64_t>(id));
}

}  // namespace ts
