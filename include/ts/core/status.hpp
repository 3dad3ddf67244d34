// File: include/ts/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ts {

class Status {
 public:
  // Readers, transformers, enhancers, config loading and trial files all
  // report through these codes; nothing here is specific to one layer.
  enum class Code : int {
    kOk = 0,
    kInvalidArgument,  // bad config, bad args, mismatched data shapes
    kOutOfRange,       // also end of data from Reader::read_next, see eof()
    kNotFound,         // missing files, buffers, classes, variables
    kIoError,
    kParseError,       // YAML, JSON and trial expressions
    kCorruptData,      // well-formed input that doesn't make sense
    kUnsupported,
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // "<code>: <message>", for logs.
  [[nodiscard]] std::string to_string() const;

  // Same code, message prefixed with "<where>: ". Ok stays ok.
  [[nodiscard]] Status with_context(const std::string& where) const;

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status out_of_range(std::string msg) { return Status(Code::kOutOfRange, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status corrupt_data(std::string msg) { return Status(Code::kCorruptData, std::move(msg)); }
  static Status unsupported(std::string msg) { return Status(Code::kUnsupported, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

  // A reader that has nothing more to give returns eof(). Any other
  // non-ok status from a reader is a fault.
  static Status eof() { return Status(Code::kOutOfRange, "eof"); }
  [[nodiscard]] bool is_eof() const noexcept { return code_ == Code::kOutOfRange; }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

const char* code_name(Status::Code code) noexcept;

template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T* value_if_ok() const noexcept { return ok() ? &(*value_) : nullptr; }
  [[nodiscard]] T* value_if_ok() noexcept { return ok() ? &(*value_) : nullptr; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

  // Error result carrying another result's status, with context.
  template <typename U>
  static Result err_from(const Result<U>& other, const std::string& where) {
    return err(other.status().with_context(where));
  }

 private:
  explicit Result(T value) : value_(std::move(value)), status_(Status::ok_status()) {}
  explicit Result(Status status) : value_(std::nullopt), status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

#define TS_RETURN_IF_ERROR(expr)      \
  do {                                \
    const ::ts::Status _s = (expr);   \
    if (!_s.ok()) return _s;          \
  } while (0)

}  // namespace ts
