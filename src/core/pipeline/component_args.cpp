// File: src/core/pipeline/component_args.cpp
#include "ts/core/pipeline/component_args.hpp"

#include <cstdlib>
#include <utility>

namespace ts {
namespace {

const Value* find_arg(const ValueMap& args, const std::string& key) {
  const auto it = args.find(key);
  if (it == args.end()) return nullptr;
  return &it->second;
}

Status missing(const std::string& key) { return Status::invalid_argument("missing required arg: " + key); }

Status wrong_type(const std::string& key, const char* expected, const Value& v) {
  return Status::invalid_argument("arg " + key + " must be " + expected + ", got " + v.to_string());
}

// Whole-string numeric parse, for overrides that arrive as text.
std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return d;
}

std::optional<std::int64_t> parse_int(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const long long i = std::strtoll(s.c_str(), &end, 10);
  if (end != s.c_str() + s.size()) return std::nullopt;
  return static_cast<std::int64_t>(i);
}

}  // namespace

Result<std::string> arg_string(const ValueMap& args, const std::string& key, const std::optional<std::string>& fallback) {
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) {
    if (fallback) return Result<std::string>::ok(*fallback);
    return Result<std::string>::err(missing(key));
  }
  if (v->is_string()) return Result<std::string>::ok(v->as_string());
  if (v->is_int()) return Result<std::string>::ok(std::to_string(v->as_int()));
  return Result<std::string>::err(wrong_type(key, "a string", *v));
}

Result<double> arg_double(const ValueMap& args, const std::string& key, std::optional<double> fallback) {
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) {
    if (fallback) return Result<double>::ok(*fallback);
    return Result<double>::err(missing(key));
  }
  if (v->is_number()) return Result<double>::ok(v->as_double());
  if (v->is_string()) {
    if (const auto d = parse_double(v->as_string())) return Result<double>::ok(*d);
  }
  return Result<double>::err(wrong_type(key, "a number", *v));
}

Result<std::int64_t> arg_int(const ValueMap& args, const std::string& key, std::optional<std::int64_t> fallback) {
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) {
    if (fallback) return Result<std::int64_t>::ok(*fallback);
    return Result<std::int64_t>::err(missing(key));
  }
  if (v->is_int()) return Result<std::int64_t>::ok(v->as_int());
  if (v->is_string()) {
    if (const auto i = parse_int(v->as_string())) return Result<std::int64_t>::ok(*i);
  }
  return Result<std::int64_t>::err(wrong_type(key, "an integer", *v));
}

Result<std::optional<double>> arg_optional_double(const ValueMap& args, const std::string& key) {
  using R = Result<std::optional<double>>;
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) return R::ok(std::nullopt);
  auto d = arg_double(args, key);
  if (!d.ok()) return R::err(d.status());
  return R::ok(*d);
}

Result<std::vector<std::string>> arg_string_list(const ValueMap& args,
                                                 const std::string& key,
                                                 const std::optional<std::vector<std::string>>& fallback) {
  using R = Result<std::vector<std::string>>;
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) {
    if (fallback) return R::ok(*fallback);
    return R::err(missing(key));
  }
  if (v->is_string()) return R::ok({v->as_string()});
  if (!v->is_list()) return R::err(wrong_type(key, "a string or list of strings", *v));

  std::vector<std::string> out;
  for (const auto& item : v->as_list()) {
    if (!item.is_string()) return R::err(wrong_type(key, "a list of strings", *v));
    out.push_back(item.as_string());
  }
  return R::ok(std::move(out));
}

Result<std::optional<ChannelId>> arg_channel_id(const ValueMap& args, const std::string& key) {
  using R = Result<std::optional<ChannelId>>;
  const Value* v = find_arg(args, key);
  if (!v || v->is_null()) return R::ok(std::nullopt);
  if (v->is_int()) return R::ok(ChannelId(v->as_int()));
  if (v->is_string()) return R::ok(ChannelId(v->as_string()));
  return R::err(wrong_type(key, "a channel name or number", *v));
}

Value arg_value(const ValueMap& args, const std::string& key) {
  const Value* v = find_arg(args, key);
  return v ? *v : Value();
}

}  // namespace ts
