// File: src/core/pipeline/pipeline.cpp
#include "ts/core/pipeline/pipeline.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "ts/adapters/delay/delay_simulator_reader.hpp"
#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"

namespace ts {
namespace {

// -----------------------------
// Routes and buffers
// -----------------------------

Result<std::vector<ReaderRoute>> make_routes(const ReaderConfig& rc,
                                             const BufferDataMap& initial,
                                             const ComponentRegistry& registry,
                                             const FileFinder& finder) {
  using R = Result<std::vector<ReaderRoute>>;

  // Default: every reader result goes straight into a buffer of the same name.
  std::vector<ReaderRoute> routes;
  for (const auto& [result_name, data] : initial) {
    routes.push_back(ReaderRoute{result_name, result_name, {}});
  }

  for (const auto& [buffer_name, extra] : rc.extra_buffers) {
    ReaderRoute route{extra.reader_result_name.empty() ? buffer_name : extra.reader_result_name, buffer_name, {}};
    for (const auto& spec : extra.transformers) {
      auto t_r = registry.make_transformer(spec, finder);
      if (!t_r.ok()) return R::err_from(t_r, "buffer " + buffer_name);
      route.transformers.push_back(t_r.take_value());
    }

    const auto same = std::find_if(routes.begin(), routes.end(),
                                   [&](const ReaderRoute& r) { return r.buffer_name == buffer_name; });
    if (same != routes.end()) {
      *same = std::move(route);
    } else {
      routes.push_back(std::move(route));
    }
  }
  return R::ok(std::move(routes));
}

Result<std::unique_ptr<BufferData>> transform_initial(const Transformer& transformer,
                                                      std::unique_ptr<BufferData> data) {
  try {
    return transformer.transform(std::move(data));
  } catch (const std::exception& e) {
    return Result<std::unique_ptr<BufferData>>::err(Status::invalid_argument(transformer.name() + ": " + e.what()));
  }
}

// Initial data for a route, shaped the way its transformers will shape later reads.
Result<std::shared_ptr<Buffer>> make_buffer(const ReaderRoute& route, const BufferDataMap& initial) {
  using R = Result<std::shared_ptr<Buffer>>;

  const auto it = initial.find(route.reader_result_name);
  if (it == initial.end() || !it->second) {
    return R::err(Status::invalid_argument("reader has no result named " + route.reader_result_name));
  }

  std::unique_ptr<BufferData> data = it->second->copy();
  for (const auto& transformer : route.transformers) {
    auto t_r = transform_initial(*transformer, std::move(data));
    if (!t_r.ok()) return R::err(t_r.status());
    data = t_r.take_value();
    if (!data) return R::err(Status::internal(transformer->name() + " returned no data"));
  }
  return R::ok(std::make_shared<Buffer>(std::move(data)));
}

Result<BufferDataMap> initial_results(Reader& reader) {
  try {
    return reader.get_initial();
  } catch (const std::exception& e) {
    return Result<BufferDataMap>::err(Status::invalid_argument(std::string("get_initial failed: ") + e.what()));
  }
}

std::string reference_reader_name(const ExperimentConfig& cfg) {
  for (const auto& rc : cfg.readers) {
    if (rc.sync && rc.sync->is_reference) return rc.sync->reader_name.empty() ? rc.name : rc.sync->reader_name;
  }
  return {};
}

// Marker lookups index value columns of the start and wrt buffers.
Status check_value_index(const Buffer& buffer, std::size_t value_index, const std::string& buffer_field,
                         const std::string& index_field) {
  const auto* events = buffer.data_as<NumericEventList>();
  if (!events) return Status::invalid_argument(buffer_field + " must hold numeric events");
  if (value_index >= events->values_per_event()) {
    return Status::invalid_argument(index_field + " " + std::to_string(value_index) + " out of range for " +
                                    std::to_string(events->values_per_event()) + " values per event");
  }
  return Status::ok_status();
}

}  // namespace

Pipeline::Pipeline(std::vector<std::shared_ptr<ReaderRouter>> routers,
                   std::shared_ptr<ReaderRouter> start_router,
                   std::unique_ptr<TrialDelimiter> delimiter,
                   std::unique_ptr<TrialExtractor> extractor,
                   ValueMap experiment_info,
                   ValueMap subject_info,
                   std::shared_ptr<ReaderSyncRegistry> sync_registry)
    : routers_(std::move(routers)),
      start_router_(std::move(start_router)),
      delimiter_(std::move(delimiter)),
      extractor_(std::move(extractor)),
      experiment_info_(std::move(experiment_info)),
      subject_info_(std::move(subject_info)),
      sync_registry_(std::move(sync_registry)) {
  if (!start_router_ || !delimiter_ || !extractor_) {
    throw std::invalid_argument("Pipeline needs a start router, delimiter and extractor");
  }
  if (std::find(routers_.begin(), routers_.end(), start_router_) == routers_.end()) {
    throw std::invalid_argument("Pipeline start router must be one of its routers");
  }
}

Result<std::unique_ptr<Pipeline>> Pipeline::from_config(const ExperimentConfig& cfg,
                                                        const ComponentRegistry& registry,
                                                        const FileFinder& finder,
                                                        bool allow_simulate_delay) {
  using R = Result<std::unique_ptr<Pipeline>>;

  const std::string reference_name = reference_reader_name(cfg);
  if (reference_name.empty()) log::info("No reference reader for clock sync; drift estimates stay 0");
  auto sync_registry = std::make_shared<ReaderSyncRegistry>(reference_name);

  std::vector<std::shared_ptr<ReaderRouter>> routers;
  std::map<BufferName, std::shared_ptr<Buffer>> all_buffers;
  std::map<BufferName, std::shared_ptr<ReaderRouter>> buffer_owner;

  for (const auto& rc : cfg.readers) {
    const std::string where = "reader " + rc.name;

    auto reader_r = registry.make_reader(rc.reader, finder);
    if (!reader_r.ok()) return R::err_from(reader_r, where);
    std::shared_ptr<Reader> reader = reader_r.take_value();
    if (rc.simulate_delay && allow_simulate_delay) {
      log::info("Simulating delay for reader {}", rc.name);
      reader = std::make_shared<DelaySimulatorReader>(reader);
    }

    auto initial_r = initial_results(*reader);
    if (!initial_r.ok()) return R::err_from(initial_r, where);

    auto routes_r = make_routes(rc, *initial_r, registry, finder);
    if (!routes_r.ok()) return R::err_from(routes_r, where);
    std::vector<ReaderRoute> routes = routes_r.take_value();

    std::map<BufferName, std::shared_ptr<Buffer>> router_buffers;
    for (const auto& route : routes) {
      if (all_buffers.count(route.buffer_name)) {
        return R::err(Status::invalid_argument(where + ": buffer name already used: " + route.buffer_name));
      }
      auto buffer_r = make_buffer(route, *initial_r);
      if (!buffer_r.ok()) {
        return R::err_from(buffer_r, where + " buffer " + route.buffer_name);
      }
      router_buffers.emplace(route.buffer_name, buffer_r.value());
      all_buffers.emplace(route.buffer_name, buffer_r.take_value());
    }

    std::optional<ReaderSyncConfig> sync = rc.sync;
    if (sync && sync->reader_name.empty()) sync->reader_name = rc.name;

    auto router = std::make_shared<ReaderRouter>(rc.name, std::move(reader), std::move(routes), router_buffers,
                                                 rc.empty_reads_allowed, std::move(sync), sync_registry);
    for (const auto& [buffer_name, buffer] : router_buffers) buffer_owner.emplace(buffer_name, router);
    routers.push_back(std::move(router));
  }

  const TrialsConfig& t = cfg.trials;
  const auto start_it = all_buffers.find(t.start_buffer);
  if (start_it == all_buffers.end()) {
    return R::err(Status::invalid_argument("trials.start_buffer not found: " + t.start_buffer));
  }
  const auto wrt_it = all_buffers.find(t.wrt_buffer);
  if (wrt_it == all_buffers.end()) {
    return R::err(Status::invalid_argument("trials.wrt_buffer not found: " + t.wrt_buffer));
  }

  const Status start_index =
      check_value_index(*start_it->second, t.start_value_index, "trials.start_buffer", "trials.start_value_index");
  if (!start_index.ok()) return R::err(start_index);
  const Status wrt_index =
      check_value_index(*wrt_it->second, t.wrt_value_index, "trials.wrt_buffer", "trials.wrt_value_index");
  if (!wrt_index.ok()) return R::err(wrt_index);

  std::map<BufferName, std::shared_ptr<Buffer>> other_buffers;
  for (const auto& [name, buffer] : all_buffers) {
    if (name != t.start_buffer && name != t.wrt_buffer) other_buffers.emplace(name, buffer);
  }

  std::vector<EnhancerEntry> enhancers;
  for (std::size_t i = 0; i < t.enhancers.size(); ++i) {
    const EnhancerConfig& ec = t.enhancers[i];
    const std::string where = "trials.enhancers[" + std::to_string(i) + "]";

    auto enhancer_r = registry.make_enhancer(ec.enhancer, finder);
    if (!enhancer_r.ok()) return R::err_from(enhancer_r, where);

    EnhancerEntry entry{enhancer_r.take_value(), std::nullopt};
    if (ec.when) {
      auto when_r = TrialExpression::parse(*ec.when, Value(false));
      if (!when_r.ok()) return R::err_from(when_r, where + ".when");
      entry.when = when_r.take_value();
    }
    enhancers.push_back(std::move(entry));
  }

  try {
    auto delimiter = std::make_unique<TrialDelimiter>(start_it->second, t.start_value, t.start_value_index,
                                                      t.trial_start_time, t.trial_count, t.trial_log_mod);
    auto extractor = std::make_unique<TrialExtractor>(wrt_it->second, t.wrt_value, t.wrt_value_index,
                                                      std::move(other_buffers), std::move(enhancers));
    auto start_router = buffer_owner.at(t.start_buffer);
    return R::ok(std::make_unique<Pipeline>(std::move(routers), std::move(start_router), std::move(delimiter),
                                            std::move(extractor), cfg.experiment, cfg.subject,
                                            std::move(sync_registry)));
  } catch (const std::invalid_argument& e) {
    return R::err(Status::invalid_argument(e.what()));
  }
}

Status Pipeline::emit_trial(TrialFile& trial_file, int trial_number, Trial& trial, RunSummary& summary) {
  extractor_->populate_trial(trial, trial_number, experiment_info_, subject_info_);
  const Status s = trial_file.append_trial(trial);
  if (!s.ok()) return s.with_context("trial " + std::to_string(trial_number));
  ++summary.trials_written;
  return Status::ok_status();
}

Result<RunSummary> Pipeline::run(TrialFile& trial_file) {
  ScopedReaders readers;
  for (const auto& router : routers_) {
    const Status s = readers.open(router->reader());
    if (!s.ok()) return Result<RunSummary>::err(s.with_context("reader " + router->reader_name()));
  }

  RunSummary summary;
  log::info("Making trials from start buffer events on reader {}", start_router_->reader_name());

  while (start_router_->still_going()) {
    if (!start_router_->route_next()) continue;

    for (auto& [trial_number, trial] : delimiter_->next()) {
      for (const auto& router : routers_) router->route_until(*trial.end_time);
      for (const auto& router : routers_) router->update_drift_estimate(trial.end_time);

      const Status s = emit_trial(trial_file, trial_number, trial, summary);
      if (!s.ok()) return Result<RunSummary>::err(s);

      delimiter_->discard_before(trial.start_time);
      extractor_->discard_before(trial.start_time);
    }
  }

  // Pick up anything the other readers still had, then the open-ended last trial.
  for (const auto& router : routers_) router->route_next();
  for (const auto& router : routers_) router->update_drift_estimate();

  auto [last_number, last_trial] = delimiter_->last();
  const Status s = emit_trial(trial_file, last_number, last_trial, summary);
  if (!s.ok()) return Result<RunSummary>::err(s);

  for (const auto& router : routers_) {
    summary.readers.emplace_back(router->reader_name(), router->state());
    log::info("Reader {} finished {}{}", router->reader_name(), router_state_name(router->state().code),
              router->state().reason.empty() ? "" : ": " + router->state().reason);
  }
  log::info("Wrote {} trials to {}", summary.trials_written, trial_file.path());
  return Result<RunSummary>::ok(std::move(summary));
}

}  // namespace ts
