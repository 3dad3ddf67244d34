// File: include/ts/core/log.hpp
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "ts/core/status.hpp"

namespace ts::log {

enum class Level : int {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kOff,
};

// Process-wide minimum level. Default kInfo.
void set_level(Level level) noexcept;
Level level() noexcept;
[[nodiscard]] inline bool enabled(Level l) noexcept { return l >= level(); }

Result<Level> parse_level(std::string_view name);
const char* level_name(Level l) noexcept;

// Lines go to stderr as "<utc time> [LEVEL] message" unless a sink is set.
// Tests install a sink to capture what was logged.
using Sink = std::function<void(Level, std::string_view)>;
void set_sink(Sink sink);
void reset_sink();

void write(Level l, std::string_view message);

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
  if (enabled(Level::kDebug)) write(Level::kDebug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
  if (enabled(Level::kInfo)) write(Level::kInfo, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
  if (enabled(Level::kWarn)) write(Level::kWarn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
  if (enabled(Level::kError)) write(Level::kError, fmt::format(f, std::forward<Args>(args)...));
}

}  // namespace ts::log
