#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCategory {
  Validation,
  Connection,
  Transfer,
  Timeout,
  Consistency,
  Cancelled
};

inline const char* to_string(ErrorCategory category) {
  switch(category) {
    case ErrorCategory::Validation: return "validation";
    case ErrorCategory::Connection: return "connection";
    case ErrorCategory::Transfer: return "transfer";
    case ErrorCategory::Timeout: return "timeout";
    case ErrorCategory::Consistency: return "consistency";
    case ErrorCategory::Cancelled: return "cancelled";
  }
  return "unknown";
}

class WarpsyncError : public std::runtime_error {
public:
  WarpsyncError(ErrorCategory category, const std::string& message)
    : std::runtime_error(message), category_(category) {}

  ErrorCategory category() const { return category_; }

  // "<category>: <message>", the form stored in a transfer's error_message.
  std::string prefixed() const {
    return std::string(to_string(category_)) + ": " + what();
  }

private:
  ErrorCategory category_;
};

class ValidationError : public WarpsyncError {
public:
  explicit ValidationError(const std::string& message)
    : WarpsyncError(ErrorCategory::Validation, message) {}
};

class ConnectionError : public WarpsyncError {
public:
  explicit ConnectionError(const std::string& message)
    : WarpsyncError(ErrorCategory::Connection, message) {}
};

class TransferError : public WarpsyncError {
public:
  explicit TransferError(const std::string& message)
    : WarpsyncError(ErrorCategory::Transfer, message) {}
};

class TimeoutError : public WarpsyncError {
public:
  explicit TimeoutError(const std::string& message)
    : WarpsyncError(ErrorCategory::Timeout, message) {}
};

class ConsistencyError : public WarpsyncError {
public:
  explicit ConsistencyError(const std::string& message)
    : WarpsyncError(ErrorCategory::Consistency, message) {}
};

class StateTransitionError : public ConsistencyError {
public:
  explicit StateTransitionError(const std::string& message)
    : ConsistencyError(message) {}
};

inline std::string prefixed_message(ErrorCategory category, const std::string& message) {
  return std::string(to_string(category)) + ": " + message;
}
