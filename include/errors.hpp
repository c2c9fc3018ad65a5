#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// ============================================================================
// EXCEPTIONS (thrown inside the core)
// ============================================================================

class SimulationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed order or configuration. Never retried.
class ValidationError : public SimulationError {
public:
  using SimulationError::SimulationError;
};

// Unknown symbol or order id
class NotFoundError : public SimulationError {
public:
  using SimulationError::SimulationError;
};

// Internal consistency check failed. Fatal for the symbol's lane.
class InvariantViolation : public SimulationError {
public:
  using SimulationError::SimulationError;
};

// A single agent could not decide this tick. The agent is skipped.
class AgentDecisionError : public SimulationError {
public:
  using SimulationError::SimulationError;
};

// ============================================================================
// BOUNDARY RESULTS (returned by Simulation)
// ============================================================================

enum class ErrorCode {
  OK,
  VALIDATION_ERROR,
  NOT_FOUND,
  ALREADY_EXISTS,
  INVARIANT_VIOLATION,
  LANE_HALTED,
  INVALID_STATE
};

std::string to_string(ErrorCode code);

struct Status {
  ErrorCode code = ErrorCode::OK;
  std::string message;

  bool ok() const { return code == ErrorCode::OK; }

  static Status success() { return Status{}; }
  static Status error(ErrorCode code, std::string message) {
    return Status{code, std::move(message)};
  }
};

template <typename T> class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Status status) : status_(std::move(status)) {
    if (status_.ok()) {
      status_ = Status::error(ErrorCode::INVALID_STATE,
                              "Result constructed without a value");
    }
  }

  bool ok() const { return status_.ok(); }
  const Status &status() const { return status_; }
  ErrorCode code() const { return status_.code; }

  const T &value() const {
    if (!value_) {
      throw std::logic_error("Result has no value: " + status_.message);
    }
    return *value_;
  }

  const T &operator*() const { return value(); }
  const T *operator->() const { return &value(); }

private:
  Status status_;
  std::optional<T> value_;
};
