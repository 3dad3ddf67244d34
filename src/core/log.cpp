// File: src/core/log.cpp
#include "ts/core/log.hpp"

#include <atomic>
#include <cctype>
#include <ctime>
#include <string>

#include <fmt/chrono.h>

namespace ts::log {
namespace {

std::atomic<int> g_level{static_cast<int>(Level::kInfo)};

Sink& sink_slot() {
  static Sink sink;
  return sink;
}

}  // namespace

void set_level(Level l) noexcept { g_level.store(static_cast<int>(l)); }

Level level() noexcept { return static_cast<Level>(g_level.load()); }

const char* level_name(Level l) noexcept {
  switch (l) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kOff: return "OFF";
  }
  return "?";
}

Result<Level> parse_level(std::string_view name) {
  std::string s(name);
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "debug") return Result<Level>::ok(Level::kDebug);
  if (s == "info") return Result<Level>::ok(Level::kInfo);
  if (s == "warn" || s == "warning") return Result<Level>::ok(Level::kWarn);
  if (s == "error") return Result<Level>::ok(Level::kError);
  if (s == "off") return Result<Level>::ok(Level::kOff);
  return Result<Level>::err(Status::invalid_argument("unknown log level: " + s));
}

void set_sink(Sink sink) { sink_slot() = std::move(sink); }

void reset_sink() { sink_slot() = nullptr; }

void write(Level l, std::string_view message) {
  if (const Sink& sink = sink_slot()) {
    sink(l, message);
    return;
  }
  const std::time_t now = std::time(nullptr);
  fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} [{}] {}\n", fmt::gmtime(now), level_name(l), message);
}

}  // namespace ts::log
