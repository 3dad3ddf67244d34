// File: include/ts/core/io/reader_router.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ts/core/io/reader.hpp"
#include "ts/core/io/reader_sync_registry.hpp"
#include "ts/core/model/buffer.hpp"
#include "ts/core/types.hpp"

namespace ts {

// Per-router circuit breaker. Once a reader leaves kActive it never comes back.
struct RouterState {
  enum class Code {
    kActive,
    kExhausted,  // reader reported eof
    kFaulted,    // reader failed; see reason
  };

  Code code{Code::kActive};
  std::string reason;

  [[nodiscard]] bool active() const noexcept { return code == Code::kActive; }
};

const char* router_state_name(RouterState::Code code) noexcept;

// Drives one Reader: reads increments, routes copies through transformers
// into named buffers, records sync events, and keeps faults local.
//
// Buffers are shared with the delimiter/extractor, which only discard from them.
class ReaderRouter {
 public:
  ReaderRouter(ReaderName reader_name,
               std::shared_ptr<Reader> reader,
               std::vector<ReaderRoute> routes,
               std::map<BufferName, std::shared_ptr<Buffer>> named_buffers,
               int empty_reads_allowed = 3,
               std::optional<ReaderSyncConfig> sync_config = std::nullopt,
               std::shared_ptr<ReaderSyncRegistry> sync_registry = nullptr);

  // Reads once, unconditionally. True iff the reader produced results.
  bool route_next();

  // Reads until buffered data reaches target_reference_time (converted to
  // this reader's clock) or more than empty_reads_allowed reads in a row come
  // back empty. Returns the latest raw time buffered so far.
  double route_until(double target_reference_time);

  // Pulls a new drift estimate from the registry, bounded to sync events at or
  // before reference_end_time, and pushes it to every owned buffer.
  // Returns 0.0 when sync isn't configured.
  double update_drift_estimate(OptionalTime reference_end_time = std::nullopt);

  [[nodiscard]] bool still_going() const noexcept { return state_.active(); }
  [[nodiscard]] const RouterState& state() const noexcept { return state_; }

  [[nodiscard]] const ReaderName& reader_name() const noexcept { return reader_name_; }
  [[nodiscard]] Reader& reader() noexcept { return *reader_; }
  [[nodiscard]] const std::vector<ReaderRoute>& routes() const noexcept { return routes_; }
  [[nodiscard]] const std::map<BufferName, std::shared_ptr<Buffer>>& named_buffers() const noexcept {
    return named_buffers_;
  }
  [[nodiscard]] const std::optional<ReaderSyncConfig>& sync_config() const noexcept { return sync_config_; }

  [[nodiscard]] int empty_reads_allowed() const noexcept { return empty_reads_allowed_; }
  [[nodiscard]] double max_buffer_time() const noexcept { return max_buffer_time_; }
  [[nodiscard]] double clock_drift() const noexcept { return clock_drift_; }

 private:
  void record_sync_events(const BufferDataMap& results);
  void route_result(const ReaderRoute& route, const BufferDataMap& results);
  void update_max_buffer_time();

  ReaderName reader_name_;
  std::shared_ptr<Reader> reader_;
  std::vector<ReaderRoute> routes_;
  std::map<BufferName, std::shared_ptr<Buffer>> named_buffers_;
  int empty_reads_allowed_{3};
  std::optional<ReaderSyncConfig> sync_config_;
  std::shared_ptr<ReaderSyncRegistry> sync_registry_;

  RouterState state_;
  double max_buffer_time_{0.0};
  double clock_drift_{0.0};
};

}  // namespace ts
