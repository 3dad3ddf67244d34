// File: src/core/value.cpp
#include "ts/core/value.hpp"

#include <fmt/core.h>

namespace ts {

double Value::as_double() const {
  if (is_int()) return static_cast<double>(std::get<std::int64_t>(v_));
  return std::get<double>(v_);
}

bool Value::truthy() const noexcept {
  switch (type()) {
    case Type::kNull: return false;
    case Type::kBool: return std::get<bool>(v_);
    case Type::kInt: return std::get<std::int64_t>(v_) != 0;
    case Type::kDouble: return std::get<double>(v_) != 0.0;
    case Type::kString: return !std::get<std::string>(v_).empty();
    case Type::kList: return !std::get<List>(v_).empty();
    case Type::kMap: return !std::get<Map>(v_).empty();
  }
  return false;
}

bool Value::operator==(const Value& other) const {
  if (is_number() && other.is_number()) {
    if (is_int() && other.is_int()) return as_int() == other.as_int();
    return as_double() == other.as_double();
  }
  return v_ == other.v_;
}

std::string Value::to_string() const {
  switch (type()) {
    case Type::kNull: return "null";
    case Type::kBool: return as_bool() ? "true" : "false";
    case Type::kInt: return fmt::format("{}", as_int());
    case Type::kDouble: return fmt::format("{}", std::get<double>(v_));
    case Type::kString: return "\"" + as_string() + "\"";
    case Type::kList: {
      std::string out = "[";
      const List& l = as_list();
      for (std::size_t i = 0; i < l.size(); ++i) {
        if (i) out += ", ";
        out += l[i].to_string();
      }
      return out + "]";
    }
    case Type::kMap: {
      std::string out = "{";
      bool first = true;
      for (const auto& [k, v] : as_map()) {
        if (!first) out += ", ";
        first = false;
        out += "\"" + k + "\": " + v.to_string();
      }
      return out + "}";
    }
  }
  return "?";
}

}  // namespace ts
