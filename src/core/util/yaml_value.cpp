// File: src/core/util/yaml_value.cpp
#include "ts/core/util/yaml_value.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

namespace ts {
namespace {

bool is_one_of(const std::string& s, std::initializer_list<const char*> words) {
  for (const char* w : words) {
    if (s == w) return true;
  }
  return false;
}

Value scalar_to_value(const YAML::Node& node) {
  const std::string& s = node.Scalar();

  // Quoted ('...' or "...") scalars carry the non-specific "!" tag.
  if (node.Tag() == "!") return Value(s);

  if (is_one_of(s, {"true", "True", "TRUE"})) return Value(true);
  if (is_one_of(s, {"false", "False", "FALSE"})) return Value(false);

  std::int64_t i = 0;
  if (YAML::convert<std::int64_t>::decode(node, i)) return Value(i);

  double d = 0.0;
  if (YAML::convert<double>::decode(node, d)) return Value(d);

  return Value(s);
}

}  // namespace

Value yaml_to_value(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value();
    case YAML::NodeType::Scalar:
      return scalar_to_value(node);
    case YAML::NodeType::Sequence: {
      Value::List list;
      list.reserve(node.size());
      for (const auto& item : node) list.push_back(yaml_to_value(item));
      return Value(std::move(list));
    }
    case YAML::NodeType::Map:
      return Value(yaml_to_value_map(node));
  }
  return Value();
}

ValueMap yaml_to_value_map(const YAML::Node& node) {
  ValueMap out;
  if (!node || !node.IsMap()) return out;
  for (const auto& it : node) {
    out.insert_or_assign(it.first.as<std::string>(), yaml_to_value(it.second));
  }
  return out;
}

}  // namespace ts
