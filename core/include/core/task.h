#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/scheduler_error.h"

#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace easythreads::core {

// ---- Task State Enum ----

enum class TaskState {
  Pending,   // Registered, waiting in the admission queue
  Running,   // Admitted, body executing on a worker
  Succeeded, // Body returned normally (terminal)
  Failed     // Body raised (terminal, retryable via a new record)
};

const char *to_string(TaskState state);

bool is_terminal(TaskState state);

// ---- Task body ----

/// Handed to a task body while it runs.
struct TaskContext {
  std::string name;
  std::shared_ptr<CancelToken> cancel_token;

  /// Progress sink (completed, total). Advisory only.
  std::function<void(int, int)> on_progress;

  [[nodiscard]] bool is_canceled() const {
    return cancel_token && cancel_token->is_canceled();
  }

  void report_progress(int completed, int total) const {
    if (on_progress) {
      on_progress(completed, total);
    }
  }
};

using TaskResult = std::any;
using TaskFn = std::function<TaskResult(TaskContext &)>;

/// Bind a plain callable and its arguments into a TaskFn. The arguments are
/// copied at bind time so a retry re-runs the body with identical inputs.
/// A void return becomes an empty TaskResult.
template <typename F, typename... Args> TaskFn bind_task(F fn, Args... args) {
  return [fn = std::move(fn),
          bound = std::make_tuple(std::move(args)...)](TaskContext &)
             -> TaskResult {
    using R = std::invoke_result_t<const F &, const Args &...>;
    if constexpr (std::is_void_v<R>) {
      std::apply(fn, bound);
      return TaskResult{};
    } else {
      return TaskResult(std::apply(fn, bound));
    }
  };
}

/// Why a task body failed.
struct TaskFailure {
  std::string message;
  std::exception_ptr cause; // Original exception, for re-raise on request
  bool canceled = false;    // Body observed cooperative cancellation
};

/// What the execution wrapper captured from one run of a task body.
struct TaskOutcome {
  TaskResult result;
  std::optional<TaskFailure> failure;

  [[nodiscard]] bool succeeded() const { return !failure.has_value(); }
};

struct TaskProgress {
  int completed = 0;
  int total = 1;
};

// ---- Task Record ----

/// One unit of work as tracked by the registry: the immutable description
/// (name, priority, body) plus its run state.
struct TaskRecord {
  std::string name;
  int priority = 0;           // Lower value is admitted first
  std::uint64_t sequence = 0; // Submission ordinal, assigned by the registry
  TaskFn fn;

  // Retry lineage
  int attempt = 1;
  std::string retry_of; // Name of the failed record this one retries

  TaskState state = TaskState::Pending;
  TaskProgress progress;

  // Exactly one of these is set once the record leaves Running.
  std::optional<TaskResult> result;
  std::optional<TaskFailure> failure;

  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  TimePoint submitted_at = Clock::now();
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;

  /// Legal transitions: Pending -> Running, Running -> Succeeded | Failed.
  /// Anything else is rejected and leaves the record unchanged.
  Result<void, SchedulerError> transition_to(TaskState new_state);

  /// Leave Running with the captured outcome: stores result or failure,
  /// stamps finished_at and marks progress complete.
  Result<void, SchedulerError> complete(TaskOutcome outcome);

  /// Clamp into [0, total] with total >= 1.
  void set_progress(int completed, int total);

  /// Time spent running; measured up to now while still Running.
  [[nodiscard]] std::optional<Clock::duration> duration() const;
};

/// Returned by submit(). Lets the caller wait on one task without polling
/// the registry.
class TaskHandle {
public:
  TaskHandle() = default;
  TaskHandle(std::string name, std::shared_future<void> done)
      : name_(std::move(name)), done_(std::move(done)) {}

  [[nodiscard]] const std::string &name() const { return name_; }

  /// True once the record reached a terminal state.
  [[nodiscard]] bool done() const {
    return wait_for(std::chrono::milliseconds(0));
  }

  void wait() const {
    if (done_.valid()) {
      done_.wait();
    }
  }

  [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const {
    return done_.valid() &&
           done_.wait_for(timeout) == std::future_status::ready;
  }

private:
  std::string name_;
  std::shared_future<void> done_;
};

} // namespace easythreads::core
