// File: include/ts/adapters/delay/delay_simulator_reader.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "ts/core/io/reader.hpp"

namespace ts {

// Plays an offline reader back roughly in real time: each result is held
// until the wall time since open() reaches the result's latest end time.
class DelaySimulatorReader final : public Reader {
 public:
  // Seconds on some monotonic clock. Tests substitute their own.
  using Clock = std::function<double()>;

  explicit DelaySimulatorReader(std::shared_ptr<Reader> reader, Clock clock = nullptr);

  Status open() override;
  void close() override;

  Result<BufferDataMap> get_initial() override;
  Result<BufferDataMap> read_next() override;

  std::string name() const override { return "DelaySimulatorReader(" + reader_->name() + ")"; }

  [[nodiscard]] Reader& wrapped() noexcept { return *reader_; }

 private:
  Result<BufferDataMap> release_stash();

  std::shared_ptr<Reader> reader_;
  Clock clock_;

  double start_time_{0.0};
  BufferDataMap stashed_;
  std::optional<double> stash_until_;
};

}  // namespace ts
