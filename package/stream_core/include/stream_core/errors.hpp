#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace stream_core {

class StreamCoreError : public std::runtime_error {
public:
  explicit StreamCoreError(std::string msg)
      : std::runtime_error(std::move(msg)) {}
};

// Malformed caller input: bad budget, day outside the horizon, duplicate ids.
class InvalidInput : public StreamCoreError {
public:
  explicit InvalidInput(std::string msg) : StreamCoreError(std::move(msg)) {}
};

// Existing commitments cannot be honored by the remaining budget/capacity.
class InfeasibleConstraint : public StreamCoreError {
public:
  explicit InfeasibleConstraint(std::string msg)
      : StreamCoreError(std::move(msg)) {}
};

// Persisted state could not be written.
class PersistenceError : public StreamCoreError {
public:
  explicit PersistenceError(std::string msg)
      : StreamCoreError(std::move(msg)) {}
};

// Recoverable conditions are reported alongside results, never thrown.
enum class WarningKind { SolverTimeout, MissingData, StaleAvailability };

struct EngineWarning {
  WarningKind kind{WarningKind::MissingData};
  std::string message;
};

inline const char *warning_kind_name(WarningKind kind) {
  switch (kind) {
  case WarningKind::SolverTimeout:
    return "solver_timeout";
  case WarningKind::MissingData:
    return "missing_data";
  case WarningKind::StaleAvailability:
    return "stale_availability";
  }
  return "unknown";
}

} // namespace stream_core
