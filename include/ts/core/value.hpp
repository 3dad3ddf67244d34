// File: include/ts/core/value.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace ts {

// Portable structured value for trial enhancements and experiment/subject info.
// Limited to what survives a trip through a trial file: null, bool, integer,
// floating point, string, and nested lists/maps of these.
class Value {
 public:
  using List = std::vector<Value>;
  using Map = std::map<std::string, Value>;

  enum class Type { kNull, kBool, kInt, kDouble, kString, kList, kMap };

  Value() = default;  // null
  Value(std::nullptr_t) {}
  Value(bool b) : v_(b) {}
  Value(int i) : v_(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v_(i) {}
  Value(double d) : v_(d) {}
  Value(const char* s) : v_(std::string(s)) {}
  Value(std::string s) : v_(std::move(s)) {}
  Value(List l) : v_(std::move(l)) {}
  Value(Map m) : v_(std::move(m)) {}

  [[nodiscard]] Type type() const noexcept { return static_cast<Type>(v_.index()); }

  [[nodiscard]] bool is_null() const noexcept { return type() == Type::kNull; }
  [[nodiscard]] bool is_bool() const noexcept { return type() == Type::kBool; }
  [[nodiscard]] bool is_int() const noexcept { return type() == Type::kInt; }
  [[nodiscard]] bool is_double() const noexcept { return type() == Type::kDouble; }
  [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
  [[nodiscard]] bool is_string() const noexcept { return type() == Type::kString; }
  [[nodiscard]] bool is_list() const noexcept { return type() == Type::kList; }
  [[nodiscard]] bool is_map() const noexcept { return type() == Type::kMap; }

  // Typed access throws std::bad_variant_access on a type mismatch, except
  // as_double() which also accepts integers.
  [[nodiscard]] bool as_bool() const { return std::get<bool>(v_); }
  [[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(v_); }
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(v_); }
  [[nodiscard]] const List& as_list() const { return std::get<List>(v_); }
  [[nodiscard]] List& as_list() { return std::get<List>(v_); }
  [[nodiscard]] const Map& as_map() const { return std::get<Map>(v_); }
  [[nodiscard]] Map& as_map() { return std::get<Map>(v_); }

  // null, false, 0, "", [] and {} are false; everything else is true.
  [[nodiscard]] bool truthy() const noexcept;

  // Numbers compare by value across int/double, so 1 == 1.0.
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

  // Compact JSON-like rendering, for logs and test failure messages.
  [[nodiscard]] std::string to_string() const;

 private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string, List, Map> v_;
};

using ValueMap = Value::Map;

}  // namespace ts
