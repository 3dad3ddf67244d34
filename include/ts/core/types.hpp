// File: include/ts/core/types.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ts {

// -----------------------------
// Basic identifiers
// -----------------------------

using ReaderName = std::string;  // e.g. "ecodes", "plexon"
using BufferName = std::string;  // e.g. "start", "wrt", "spikes"

// Signal channels are named by the acquisition system, either "AD01" style
// strings or plain integer indices.
using ChannelId = std::variant<std::int64_t, std::string>;

std::string to_string(const ChannelId& id);

// -----------------------------
// Time
// -----------------------------
// Times are seconds as double, on whichever clock the owning data came from.
// An empty optional means "unbounded" for range queries and "no data" for
// end-time queries.

using Seconds = double;
using OptionalTime = std::optional<double>;

}  // namespace ts
