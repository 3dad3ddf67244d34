// File: include/ts/core/pipeline/pipeline.hpp
#pragma once

#include <map>
#include <memory>
#include <utility>
#include <vector>

#include "ts/core/config.hpp"
#include "ts/core/io/reader_router.hpp"
#include "ts/core/io/reader_sync_registry.hpp"
#include "ts/core/model/buffer.hpp"
#include "ts/core/pipeline/component_registry.hpp"
#include "ts/core/status.hpp"
#include "ts/core/trials/trial_delimiter.hpp"
#include "ts/core/trials/trial_extractor.hpp"
#include "ts/core/trials/trial_file.hpp"
#include "ts/core/util/file_finder.hpp"
#include "ts/core/value.hpp"

namespace ts {

struct RunSummary {
  int trials_written{0};

  // Final state of each reader, in config order.
  std::vector<std::pair<ReaderName, RouterState>> readers;
};

// Everything needed to turn readers into trials: routers and their buffers,
// the shared sync registry, the delimiter and the extractor.
class Pipeline {
 public:
  // start_router must be one of routers, the one that owns the delimiter's start buffer.
  Pipeline(std::vector<std::shared_ptr<ReaderRouter>> routers,
           std::shared_ptr<ReaderRouter> start_router,
           std::unique_ptr<TrialDelimiter> delimiter,
           std::unique_ptr<TrialExtractor> extractor,
           ValueMap experiment_info = {},
           ValueMap subject_info = {},
           std::shared_ptr<ReaderSyncRegistry> sync_registry = nullptr);

  // Builds readers, routes, buffers, routers, delimiter and extractor.
  // Readers with simulate_delay are wrapped in a DelaySimulatorReader only
  // when allow_simulate_delay is set.
  // Any wiring problem comes back as a non-ok status before anything runs.
  static Result<std::unique_ptr<Pipeline>> from_config(const ExperimentConfig& cfg,
                                                       const ComponentRegistry& registry,
                                                       const FileFinder& finder,
                                                       bool allow_simulate_delay = false);

  // Opens all readers, makes trials until the start reader is done, appends
  // each one to trial_file (which must already be open), then closes the readers.
  // Fails only if readers can't be opened or trial_file can't be written.
  Result<RunSummary> run(TrialFile& trial_file);

  [[nodiscard]] const std::vector<std::shared_ptr<ReaderRouter>>& routers() const noexcept { return routers_; }
  [[nodiscard]] const ReaderRouter& start_router() const noexcept { return *start_router_; }
  [[nodiscard]] const TrialDelimiter& delimiter() const noexcept { return *delimiter_; }
  [[nodiscard]] const TrialExtractor& extractor() const noexcept { return *extractor_; }
  [[nodiscard]] const std::shared_ptr<ReaderSyncRegistry>& sync_registry() const noexcept { return sync_registry_; }
  [[nodiscard]] const ValueMap& experiment_info() const noexcept { return experiment_info_; }
  [[nodiscard]] const ValueMap& subject_info() const noexcept { return subject_info_; }

 private:
  Status emit_trial(TrialFile& trial_file, int trial_number, Trial& trial, RunSummary& summary);

  std::vector<std::shared_ptr<ReaderRouter>> routers_;
  std::shared_ptr<ReaderRouter> start_router_;
  std::unique_ptr<TrialDelimiter> delimiter_;
  std::unique_ptr<TrialExtractor> extractor_;
  ValueMap experiment_info_;
  ValueMap subject_info_;
  std::shared_ptr<ReaderSyncRegistry> sync_registry_;
};

}  // namespace ts
