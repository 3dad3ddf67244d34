// File: src/core/model/signal_chunk.cpp
#include "ts/core/model/signal_chunk.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ts {

SignalChunk::SignalChunk(std::vector<double> sample_data,
                         std::optional<double> sample_frequency,
                         OptionalTime first_sample_time,
                         std::vector<ChannelId> channel_ids)
    : sample_data_(std::move(sample_data)),
      sample_frequency_(sample_frequency),
      first_sample_time_(first_sample_time),
      channel_ids_(std::move(channel_ids)) {
  if (sample_data_.empty()) return;
  if (channel_ids_.empty() || sample_data_.size() % channel_ids_.size() != 0) {
    throw std::invalid_argument("SignalChunk has " + std::to_string(sample_data_.size()) +
                                " values, not a multiple of " + std::to_string(channel_ids_.size()) +
                                " channels");
  }
  if (!sample_frequency_ || *sample_frequency_ <= 0.0 || !first_sample_time_) {
    throw std::invalid_argument("SignalChunk with samples needs sample_frequency > 0 and first_sample_time");
  }
}

SignalChunk SignalChunk::from_rows(const std::vector<std::vector<double>>& rows,
                                   std::optional<double> sample_frequency,
                                   OptionalTime first_sample_time,
                                   std::vector<ChannelId> channel_ids) {
  std::vector<double> flat;
  flat.reserve(rows.size() * channel_ids.size());
  for (const auto& r : rows) {
    if (r.size() != channel_ids.size()) {
      throw std::invalid_argument("SignalChunk rows must have one value per channel");
    }
    flat.insert(flat.end(), r.begin(), r.end());
  }
  return SignalChunk(std::move(flat), sample_frequency, first_sample_time, std::move(channel_ids));
}

std::unique_ptr<BufferData> SignalChunk::copy() const {
  return std::make_unique<SignalChunk>(*this);
}

std::vector<double> SignalChunk::get_times() const {
  const std::size_t n = sample_count();
  std::vector<double> times;
  times.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    times.push_back(*first_sample_time_ + static_cast<double>(i) / *sample_frequency_);
  }
  return times;
}

std::unique_ptr<BufferData> SignalChunk::copy_time_range(OptionalTime start_time, OptionalTime end_time) const {
  const std::vector<double> times = get_times();
  const std::size_t channels = channel_ids_.size();
  const bool single_sample = start_time && end_time && *start_time == *end_time;

  std::vector<double> selected;
  OptionalTime selected_first;
  for (std::size_t i = 0; i < times.size(); ++i) {
    if (start_time && times[i] < *start_time) continue;
    if (!single_sample && end_time && times[i] >= *end_time) continue;

    const auto first = sample_data_.begin() + static_cast<std::ptrdiff_t>(i * channels);
    selected.insert(selected.end(), first, first + static_cast<std::ptrdiff_t>(channels));
    if (!selected_first) selected_first = times[i];
    if (single_sample) break;
  }

  return std::make_unique<SignalChunk>(std::move(selected), sample_frequency_, selected_first, channel_ids_);
}

Status SignalChunk::append(const BufferData& other) {
  const auto* signal = dynamic_cast<const SignalChunk*>(&other);
  if (!signal) {
    if (other.empty()) return Status::ok_status();
    return Status::invalid_argument(std::string("can't append ") + other.kind_name() + " to SignalChunk");
  }
  if (signal->empty()) {
    if (!sample_frequency_) sample_frequency_ = signal->sample_frequency_;
    return Status::ok_status();
  }
  if (signal->channel_count() != channel_count()) {
    return Status::invalid_argument("can't append signal with " + std::to_string(signal->channel_count()) +
                                    " channels to signal with " + std::to_string(channel_count()));
  }

  if (empty()) first_sample_time_ = signal->first_sample_time_;
  if (!sample_frequency_) sample_frequency_ = signal->sample_frequency_;
  sample_data_.insert(sample_data_.end(), signal->sample_data_.begin(), signal->sample_data_.end());
  return Status::ok_status();
}

void SignalChunk::discard_before(double start_time) {
  const std::vector<double> times = get_times();
  const auto keep_from = static_cast<std::size_t>(
      std::lower_bound(times.begin(), times.end(), start_time) - times.begin());
  if (keep_from == 0) return;

  sample_data_.erase(sample_data_.begin(),
                     sample_data_.begin() + static_cast<std::ptrdiff_t>(keep_from * channel_ids_.size()));
  if (keep_from < times.size()) {
    first_sample_time_ = times[keep_from];
  } else {
    first_sample_time_.reset();
  }
}

void SignalChunk::shift_times(double shift) {
  if (first_sample_time_) *first_sample_time_ += shift;
}

OptionalTime SignalChunk::get_end_time() const {
  const std::size_t n = sample_count();
  if (n == 0) return std::nullopt;
  return *first_sample_time_ + static_cast<double>(n - 1) / *sample_frequency_;
}

bool SignalChunk::equals(const BufferData& other) const {
  const auto* signal = dynamic_cast<const SignalChunk*>(&other);
  return signal && *this == *signal;
}

bool SignalChunk::operator==(const SignalChunk& other) const {
  const bool data_equal = (empty() && other.empty()) || sample_data_ == other.sample_data_;
  return data_equal && sample_frequency_ == other.sample_frequency_ &&
         first_sample_time_ == other.first_sample_time_ && channel_ids_ == other.channel_ids_;
}

std::size_t SignalChunk::channel_index(const ChannelId& id) const {
  const auto it = std::find(channel_ids_.begin(), channel_ids_.end(), id);
  if (it == channel_ids_.end()) throw std::out_of_range("unknown signal channel: " + to_string(id));
  return static_cast<std::size_t>(it - channel_ids_.begin());
}

double SignalChunk::sample_at(std::size_t sample, std::size_t channel) const {
  if (channel >= channel_ids_.size()) throw std::out_of_range("channel index " + std::to_string(channel));
  return sample_data_.at(sample * channel_ids_.size() + channel);
}

std::vector<double> SignalChunk::get_channel_values(const std::optional<ChannelId>& id) const {
  if (channel_ids_.empty()) throw std::out_of_range("signal has no channels");
  const std::size_t c = id ? channel_index(*id) : 0;
  const std::size_t n = sample_count();
  std::vector<double> values;
  values.reserve(n);
  for (std::size_t i = 0; i < n; ++i) values.push_back(sample_data_[i * channel_ids_.size() + c]);
  return values;
}

void SignalChunk::set_channel_values(std::size_t channel_index, const std::vector<double>& values) {
  if (channel_index >= channel_ids_.size()) {
    throw std::out_of_range("channel index " + std::to_string(channel_index));
  }
  if (values.size() != sample_count()) {
    throw std::invalid_argument("expected " + std::to_string(sample_count()) + " channel values, got " +
                                std::to_string(values.size()));
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    sample_data_[i * channel_ids_.size() + channel_index] = values[i];
  }
}

void SignalChunk::apply_offset_then_gain(double offset, double gain, const std::optional<ChannelId>& id) {
  const std::size_t channels = channel_ids_.size();
  if (id) {
    const std::size_t c = channel_index(*id);
    for (std::size_t i = c; i < sample_data_.size(); i += channels) {
      sample_data_[i] = (sample_data_[i] + offset) * gain;
    }
    return;
  }
  for (double& v : sample_data_) v = (v + offset) * gain;
}

}  // namespace ts
