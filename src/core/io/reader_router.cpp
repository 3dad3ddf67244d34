// File: src/core/io/reader_router.cpp
#include "ts/core/io/reader_router.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "ts/core/log.hpp"
#include "ts/core/model/numeric_event_list.hpp"

namespace ts {
namespace {

using DataResult = Result<std::unique_ptr<BufferData>>;

DataResult apply_transformer(const Transformer& transformer, std::unique_ptr<BufferData> data) {
  try {
    return transformer.transform(std::move(data));
  } catch (const std::exception& e) {
    return DataResult::err(Status::internal(e.what()));
  }
}

}  // namespace

const char* router_state_name(RouterState::Code code) noexcept {
  switch (code) {
    case RouterState::Code::kActive: return "active";
    case RouterState::Code::kExhausted: return "exhausted";
    case RouterState::Code::kFaulted: return "faulted";
  }
  return "unknown";
}

ReaderRouter::ReaderRouter(ReaderName reader_name,
                           std::shared_ptr<Reader> reader,
                           std::vector<ReaderRoute> routes,
                           std::map<BufferName, std::shared_ptr<Buffer>> named_buffers,
                           int empty_reads_allowed,
                           std::optional<ReaderSyncConfig> sync_config,
                           std::shared_ptr<ReaderSyncRegistry> sync_registry)
    : reader_name_(std::move(reader_name)),
      reader_(std::move(reader)),
      routes_(std::move(routes)),
      named_buffers_(std::move(named_buffers)),
      empty_reads_allowed_(empty_reads_allowed),
      sync_config_(std::move(sync_config)),
      sync_registry_(std::move(sync_registry)) {
  if (!reader_) throw std::invalid_argument("ReaderRouter for '" + reader_name_ + "' needs a reader");
}

bool ReaderRouter::route_next() {
  if (!state_.active()) return false;

  BufferDataMap results;
  try {
    auto read_r = reader_->read_next();
    if (!read_r.ok()) {
      if (read_r.status().is_eof()) {
        state_.code = RouterState::Code::kExhausted;
        state_.reason = read_r.status().message();
        log::info("Reader {} ({}) is done.", reader_name_, reader_->name());
      } else {
        state_.code = RouterState::Code::kFaulted;
        state_.reason = read_r.status().to_string();
        log::warn("Reader {} ({}) is disabled: {}", reader_name_, reader_->name(), state_.reason);
      }
      return false;
    }
    results = read_r.take_value();
  } catch (const std::exception& e) {
    state_.code = RouterState::Code::kFaulted;
    state_.reason = e.what();
    log::warn("Reader {} ({}) is disabled, it threw: {}", reader_name_, reader_->name(), state_.reason);
    return false;
  }

  if (results.empty()) return false;

  record_sync_events(results);
  for (const auto& route : routes_) route_result(route, results);
  update_max_buffer_time();
  return true;
}

void ReaderRouter::record_sync_events(const BufferDataMap& results) {
  if (!sync_config_ || !sync_registry_ || !sync_config_->event_value) return;

  const auto it = results.find(sync_config_->reader_result_name);
  if (it == results.end() || !it->second) return;

  const auto* events = dynamic_cast<const NumericEventList*>(it->second.get());
  if (!events) return;

  try {
    for (double t : events->get_times_of(*sync_config_->event_value, sync_config_->event_value_index)) {
      sync_registry_->record_event(sync_config_->reader_name, t);
    }
  } catch (const std::out_of_range& e) {
    log::error("Reader {} sync events not recorded: {}", reader_name_, e.what());
  }
}

void ReaderRouter::route_result(const ReaderRoute& route, const BufferDataMap& results) {
  const auto buffer_it = named_buffers_.find(route.buffer_name);
  if (buffer_it == named_buffers_.end() || !buffer_it->second) return;

  const auto result_it = results.find(route.reader_result_name);
  if (result_it == results.end() || !result_it->second) return;

  std::unique_ptr<BufferData> data = result_it->second->copy();
  for (const auto& transformer : route.transformers) {
    auto transformed = apply_transformer(*transformer, std::move(data));
    if (!transformed.ok() || !transformed.value()) {
      log::error("Route transformer {} failed, skipping data for {} -> {}: {}", transformer->name(),
                 route.reader_result_name, route.buffer_name,
                 transformed.ok() ? std::string("no data") : transformed.status().to_string());
      return;
    }
    data = transformed.take_value();
  }

  const Status appended = buffer_it->second->data().append(*data);
  if (!appended.ok()) {
    log::error("Route buffer can't append, skipping data for {} -> {}: {}", route.reader_result_name,
               route.buffer_name, appended.to_string());
  }
}

void ReaderRouter::update_max_buffer_time() {
  for (const auto& [name, buffer] : named_buffers_) {
    const OptionalTime end = buffer->data().get_end_time();
    if (end && *end > max_buffer_time_) max_buffer_time_ = *end;
  }
}

double ReaderRouter::route_until(double target_reference_time) {
  const double target_raw_time = target_reference_time + clock_drift_;
  int empty_reads = 0;
  while (max_buffer_time_ < target_raw_time && empty_reads <= empty_reads_allowed_) {
    if (route_next()) {
      empty_reads = 0;
    } else {
      ++empty_reads;
    }
  }
  return max_buffer_time_;
}

double ReaderRouter::update_drift_estimate(OptionalTime reference_end_time) {
  if (!sync_config_ || !sync_registry_) return 0.0;

  OptionalTime reader_end_time;
  if (reference_end_time) reader_end_time = *reference_end_time + clock_drift_;

  clock_drift_ = sync_registry_->get_drift(sync_config_->reader_name, reference_end_time, reader_end_time);
  for (auto& [name, buffer] : named_buffers_) buffer->set_clock_drift(clock_drift_);
  return clock_drift_;
}

}  // namespace ts
