// File: include/ts/core/model/signal_chunk.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "ts/core/model/buffer_data.hpp"

namespace ts {

// Uniformly sampled, multi-channel signal. Samples are rows, channels are columns.
//
// Sample i happens at first_sample_time + i / sample_frequency.
// An empty placeholder may leave frequency and first time unset; the first
// non-empty append() fills them in.
class SignalChunk final : public BufferData {
 public:
  // sample_data is row-major, size must be a multiple of channel_ids.size().
  // Throws std::invalid_argument otherwise.
  SignalChunk(std::vector<double> sample_data,
              std::optional<double> sample_frequency,
              OptionalTime first_sample_time,
              std::vector<ChannelId> channel_ids);

  static SignalChunk from_rows(const std::vector<std::vector<double>>& rows,
                               std::optional<double> sample_frequency,
                               OptionalTime first_sample_time,
                               std::vector<ChannelId> channel_ids);

  Kind kind() const noexcept override { return Kind::kSignalChunk; }
  std::unique_ptr<BufferData> copy() const override;

  // copy_time_range(t, t) yields exactly one sample, the first at or after t.
  std::unique_ptr<BufferData> copy_time_range(OptionalTime start_time, OptionalTime end_time) const override;
  Status append(const BufferData& other) override;
  void discard_before(double start_time) override;
  void shift_times(double shift) override;
  OptionalTime get_end_time() const override;
  bool empty() const noexcept override { return sample_data_.empty(); }
  bool equals(const BufferData& other) const override;

  [[nodiscard]] std::size_t sample_count() const noexcept {
    return channel_ids_.empty() ? 0 : sample_data_.size() / channel_ids_.size();
  }
  [[nodiscard]] std::size_t channel_count() const noexcept { return channel_ids_.size(); }

  [[nodiscard]] std::optional<double> sample_frequency() const noexcept { return sample_frequency_; }
  [[nodiscard]] OptionalTime first_sample_time() const noexcept { return first_sample_time_; }
  [[nodiscard]] const std::vector<ChannelId>& channel_ids() const noexcept { return channel_ids_; }
  [[nodiscard]] const std::vector<double>& raw() const noexcept { return sample_data_; }

  [[nodiscard]] std::vector<double> get_times() const;

  // Throws std::out_of_range for unknown channels.
  [[nodiscard]] std::size_t channel_index(const ChannelId& id) const;

  // Defaults to the first channel.
  [[nodiscard]] std::vector<double> get_channel_values(const std::optional<ChannelId>& id = std::nullopt) const;
  void set_channel_values(std::size_t channel_index, const std::vector<double>& values);

  [[nodiscard]] double sample_at(std::size_t sample, std::size_t channel) const;

  // value = (value + offset) * gain, on one channel or all of them.
  void apply_offset_then_gain(double offset, double gain, const std::optional<ChannelId>& id = std::nullopt);

  bool operator==(const SignalChunk& other) const;

 private:
  std::vector<double> sample_data_;
  std::optional<double> sample_frequency_;
  OptionalTime first_sample_time_;
  std::vector<ChannelId> channel_ids_;
};

}  // namespace ts
