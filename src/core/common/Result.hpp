#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace certgen {

enum class ErrorCode {
  Validation,
  Unauthorized,
  AssetNotFound,
  AssetStoreUnavailable,
  EncodingError,
  UnsupportedImageFormat,
  TemplateRenderError,
  InvalidIdentity,
  ConversionProcessError,
  ConversionOutputMissing,
  PublishError
};

const char* to_string(ErrorCode code);

// True for errors caused by the caller's input (reported as 4xx).
bool is_client_error(ErrorCode code);

struct PipelineError {
  ErrorCode   code;
  std::string message;
};

// Value or tagged error returned by every pipeline stage.
template <typename T>
class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(PipelineError err) : v_(std::move(err)) {}

  static Result fail(ErrorCode code, std::string message) {
    return Result(PipelineError{code, std::move(message)});
  }

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& {
    if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
    return std::get<T>(v_);
  }
  T&& value() && {
    if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
    return std::get<T>(std::move(v_));
  }

  const PipelineError& error() const { return std::get<PipelineError>(v_); }

private:
  std::variant<T, PipelineError> v_;
};

template <>
class Result<void> {
public:
  Result() = default;
  Result(PipelineError err) : err_(std::move(err)) {}

  static Result fail(ErrorCode code, std::string message) {
    return Result(PipelineError{code, std::move(message)});
  }

  bool ok() const { return !err_.has_value(); }
  explicit operator bool() const { return ok(); }

  const PipelineError& error() const { return *err_; }

private:
  std::optional<PipelineError> err_;
};

using Status = Result<void>;

} // namespace certgen
