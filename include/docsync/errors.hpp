#pragma once

// docsync/errors.hpp — Error taxonomy shared by every docsync component.
//
// PROPAGATION POLICY:
//   - StructuralDecodeError and ChainIntegrityError are never swallowed.
//   - SanitizerFailure is the only class with a configurable local recovery
//     (fail-open degrades to the original text, fail-closed escalates).
//   - Every local recovery that discards external data is logged at warning
//     level with the error type and stage (see observability.hpp).

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docsync {

enum class ErrorCode {
  none,
  validation_error,
  manifest_not_found,
  pack_not_found,
  structural_decode_error,
  chain_integrity_error,
  sanitizer_failure,
  sanitizer_timeout,
  io_error,
};

std::string to_string(ErrorCode code);

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

  // Short stable name of the concrete error class, used in log context.
  virtual const char* type_name() const noexcept { return "Error"; }

 private:
  ErrorCode code_;
};

// Malformed manifest or claim input. Carries every validation message.
class ValidationError : public Error {
 public:
  explicit ValidationError(std::vector<std::string> errors,
                           ErrorCode code = ErrorCode::validation_error);

  const std::vector<std::string>& errors() const noexcept { return errors_; }
  const char* type_name() const noexcept override { return "ValidationError"; }

 private:
  std::vector<std::string> errors_;
};

// Malformed pack JSON or claim dict read from an untrusted source.
class StructuralDecodeError : public Error {
 public:
  explicit StructuralDecodeError(const std::string& message)
      : Error(ErrorCode::structural_decode_error, message) {}

  const char* type_name() const noexcept override { return "StructuralDecodeError"; }
};

// Hash mismatch between a stored and a recomputed chain value.
class ChainIntegrityError : public Error {
 public:
  ChainIntegrityError(const std::string& reason, std::size_t index,
                      std::string expected, std::string actual)
      : Error(ErrorCode::chain_integrity_error, reason),
        index_(index),
        expected_(std::move(expected)),
        actual_(std::move(actual)) {}

  std::size_t index() const noexcept { return index_; }
  const std::string& expected() const noexcept { return expected_; }
  const std::string& actual() const noexcept { return actual_; }
  const char* type_name() const noexcept override { return "ChainIntegrityError"; }

 private:
  std::size_t index_;
  std::string expected_;
  std::string actual_;
};

// Transport error, timeout or malformed response from the redaction capability.
class SanitizerFailure : public Error {
 public:
  explicit SanitizerFailure(const std::string& message,
                            ErrorCode code = ErrorCode::sanitizer_failure)
      : Error(code, message) {}

  const char* type_name() const noexcept override { return "SanitizerFailure"; }
};

class IoError : public Error {
 public:
  explicit IoError(const std::string& message, ErrorCode code = ErrorCode::io_error)
      : Error(code, message) {}

  const char* type_name() const noexcept override { return "IoError"; }
};

}  // namespace docsync
