#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace easythreads::core {

/// Error categories surfaced by the scheduler. Callers branch on the
/// category, never on the message text.
enum class ErrorCategory {
  Configuration,   // Invalid SchedulerConfig, fatal at construction
  DuplicateName,   // Submission collides with a registered record
  NotFound,        // Query for an unknown task name
  TaskFailure,     // A task body raised; recorded on its record
  InvalidState,    // Illegal lifecycle transition
  InvalidArgument, // Malformed submission (e.g. empty callable)
  Canceled         // Cooperative cancellation observed
};

/// Structured error for scheduler and registry operations.
struct SchedulerError {
  ErrorCategory category = ErrorCategory::InvalidArgument;
  int code = 0; // Stable numeric code, one per factory below
  std::string message;
  std::map<std::string, std::string> details;

  SchedulerError() = default;

  SchedulerError(ErrorCategory cat, int c, std::string msg,
                 std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static SchedulerError Configuration(std::string msg) {
    return {ErrorCategory::Configuration, 1001, std::move(msg)};
  }
  static SchedulerError DuplicateName(const std::string &name) {
    return {ErrorCategory::DuplicateName, 1002,
            "Task name already registered: " + name, {{"name", name}}};
  }
  static SchedulerError NotFound(const std::string &name) {
    return {ErrorCategory::NotFound, 1003, "No task named '" + name + "'",
            {{"name", name}}};
  }
  static SchedulerError TaskFailure(const std::string &name,
                                    const std::string &cause) {
    return {ErrorCategory::TaskFailure, 1004,
            "Task " + name + " failed: " + cause, {{"name", name}}};
  }
  static SchedulerError InvalidState(std::string msg) {
    return {ErrorCategory::InvalidState, 1005, std::move(msg)};
  }
  static SchedulerError InvalidArgument(std::string msg) {
    return {ErrorCategory::InvalidArgument, 1006, std::move(msg)};
  }
  static SchedulerError Canceled(std::string msg = "Scheduler canceled") {
    return {ErrorCategory::Canceled, 1007, std::move(msg)};
  }
};

/// Thrown by CancelToken::throw_if_canceled() from inside a task body. The
/// execution wrapper records it as a canceled failure.
class TaskCanceled : public std::runtime_error {
public:
  TaskCanceled() : std::runtime_error("Task canceled") {}
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Configuration:
    return "Configuration";
  case ErrorCategory::DuplicateName:
    return "DuplicateName";
  case ErrorCategory::NotFound:
    return "NotFound";
  case ErrorCategory::TaskFailure:
    return "TaskFailure";
  case ErrorCategory::InvalidState:
    return "InvalidState";
  case ErrorCategory::InvalidArgument:
    return "InvalidArgument";
  case ErrorCategory::Canceled:
    return "Canceled";
  }
  return "Unknown";
}

} // namespace easythreads::core
