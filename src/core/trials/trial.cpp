// File: src/core/trials/trial.cpp
#include "ts/core/trials/trial.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "ts/core/log.hpp"

namespace ts {

void Trial::add_buffer_data(const std::string& name, std::unique_ptr<BufferData> data) {
  if (!data) return;
  if (auto* events = dynamic_cast<NumericEventList*>(data.get())) {
    numeric_events.insert_or_assign(name, std::move(*events));
  } else if (auto* signal = dynamic_cast<SignalChunk*>(data.get())) {
    signals.insert_or_assign(name, std::move(*signal));
  } else {
    log::warn("Data for {} not added to trial, {} is not supported.", name, data->kind_name());
  }
}

void Trial::add_enhancement(const std::string& name, Value value, const std::string& category) {
  auto& names = enhancement_categories[category];
  if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
  enhancements.insert_or_assign(name, std::move(value));
}

Value Trial::get_enhancement(const std::string& name, const Value& default_value) const {
  const auto it = enhancements.find(name);
  return it == enhancements.end() ? default_value : it->second;
}

Value Trial::get_one(const std::string& name, const Value& default_value, int index) const {
  const auto it = enhancements.find(name);
  if (it == enhancements.end()) return default_value;
  if (!it->second.is_list()) return it->second;

  const Value::List& list = it->second.as_list();
  if (list.empty()) return default_value;

  const auto size = static_cast<int>(list.size());
  const int i = index < 0 ? size + index : index;
  if (i < 0 || i >= size) {
    throw std::out_of_range("index " + std::to_string(index) + " out of range for enhancement " + name +
                            " with " + std::to_string(size) + " elements");
  }
  return list[static_cast<std::size_t>(i)];
}

bool Trial::operator==(const Trial& other) const {
  return start_time == other.start_time && end_time == other.end_time && wrt_time == other.wrt_time &&
         numeric_events == other.numeric_events && signals == other.signals &&
         enhancements == other.enhancements && enhancement_categories == other.enhancement_categories;
}

}  // namespace ts
