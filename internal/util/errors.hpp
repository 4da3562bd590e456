#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace ticketflow::util {

/*
  Central error types.

  Extraction misses are never reported through these; they are plain
  values (FieldValue with no raw text). Exceptions are reserved for
  lookups that callers asked to be strict, configuration problems and
  infrastructure failures.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable: I/O, OCR engine and persistence timeouts. Handled by the batch layer.
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed vendor template or synonym table. Raised at load time only.
class TemplateError : public std::runtime_error {
 public:
  explicit TemplateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;

  const std::string msg = context + ": " + result.message;
  if (result.IsRetryable()) {
    throw TransientError(msg);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw NotFound(msg);
    case db::ErrorCode::AlreadyExists:
      throw AlreadyExists(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace ticketflow::util
