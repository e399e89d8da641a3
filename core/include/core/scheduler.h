#pragma once

#include "core/cancel_token.h"
#include "core/execution_wrapper.h"
#include "core/result.h"
#include "core/retry_coordinator.h"
#include "core/scheduler_error.h"
#include "core/task.h"
#include "core/worker_pool.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace easythreads::core {

class ILogger;

/// Scheduler runtime configuration.
struct SchedulerConfig {
  int max_workers = 0;            // Required, > 0: concurrency cap and thread count
  bool daemon = false;            // Detach workers on destruction instead of joining
  int poll_interval_ms = 100;     // Fallback wake-up for blocked waits; <= 0 -> 100
  int shutdown_timeout_ms = 5000; // Destructor wait for running tasks; < 0 -> 0
};

/// Submission request.
struct TaskSpec {
  std::string name; // Empty: auto-named "task", "task-2", ...
  TaskFn fn;
  int priority = 0;    // Lower value is admitted first
  int total_units = 1; // Progress denominator reported to observers
};

/// Answer to status(name).
struct TaskStatus {
  TaskState state = TaskState::Pending;
  TaskProgress progress;
  std::optional<TaskFailure> failure;
};

/// `std::nullopt` waits without limit; zero performs a single check.
using JoinTimeout = std::optional<std::chrono::milliseconds>;

/// Bounded-concurrency, priority-ordered task scheduler.
///
/// Task bodies run on worker threads, at most `max_workers` at a time, in
/// priority order (ties in submission order). A body that throws is recorded
/// as Failed and never disturbs the scheduler or sibling tasks. All queries
/// return consistent snapshots.
class IScheduler {
public:
  virtual ~IScheduler() = default;

  /// Registers a Pending task and queues it for admission.
  /// Err(DuplicateName) if an explicit name is already registered.
  virtual Result<TaskHandle, SchedulerError> submit(TaskSpec spec) = 0;

  /// Opens admission. Returns false (and does nothing) once canceled.
  virtual bool start_all() = 0;

  /// Admits one Pending task ahead of the queue, whether or not admission is
  /// open. It still waits for a free slot. Ok(false) if the task already
  /// left Pending or was already started; Err(NotFound) for an unknown name;
  /// Err(Canceled) once canceled.
  virtual Result<bool, SchedulerError> start(const std::string &name) = 0;

  /// Blocks until nothing runs and nothing admissible is left, or the
  /// timeout elapses. Returns the names still Pending or Running.
  virtual std::vector<std::string> join(JoinTimeout timeout) = 0;

  /// start_all() followed by join(timeout).
  virtual std::vector<std::string> run(JoinTimeout timeout) = 0;

  [[nodiscard]] virtual Result<TaskStatus, SchedulerError>
  status(const std::string &name) const = 0;

  [[nodiscard]] virtual Result<TaskRecord, SchedulerError>
  get(const std::string &name) const = 0;

  /// Result of one task. For a Failed task: re-raises the original exception
  /// when `rethrow` is set, otherwise returns Err(TaskFailure), or
  /// Err(Canceled) if the body stopped on the cancel token. Pending and
  /// Running tasks yield an empty result.
  [[nodiscard]] virtual Result<TaskResult, SchedulerError>
  result(const std::string &name, bool rethrow = false) const = 0;

  [[nodiscard]] virtual std::map<std::string, TaskResult> results() const = 0;
  [[nodiscard]] virtual std::map<std::string, TaskFailure> failures() const = 0;

  [[nodiscard]] virtual std::vector<std::string> all_names() const = 0;
  [[nodiscard]] virtual std::vector<std::string> active_names() const = 0;
  [[nodiscard]] virtual std::vector<std::string> pending_names() const = 0;

  /// Evicts all terminal records; returns their names.
  virtual std::vector<std::string> remove_finished() = 0;

  /// Re-submits every task Failed right now as a new record. Does not block;
  /// open admission picks the retries up, otherwise run() drains them.
  virtual std::vector<RetryTicket> retry_failed() = 0;

  /// Sets this scheduler's cancellation token. Running tasks are not
  /// interrupted; they see the flag through TaskContext::cancel_token.
  virtual void cancel() = 0;
  [[nodiscard]] virtual bool is_canceled() const = 0;
  [[nodiscard]] virtual std::shared_ptr<CancelToken> cancel_token() const = 0;

  /// No record is Pending or Running.
  [[nodiscard]] virtual bool is_all_done() const = 0;

  [[nodiscard]] virtual int running_count() const = 0;

  /// Invoked from worker threads, never under the scheduler lock.
  virtual void on_state_change(StateCallback cb) = 0;
  virtual void on_progress(ProgressObserver observer) = 0;
};

/// Thread-pool scheduler. Err(Configuration) if max_workers <= 0.
///
/// The scheduler always owns its token. A non-null `cancel_token` acts as a
/// parent: canceling it cancels the scheduler, while cancel() and
/// destruction leave it untouched. The scheduler detaches from the parent
/// when destroyed.
///
/// Destruction cancels the scheduler, then waits up to `shutdown_timeout_ms`
/// for running tasks (daemon schedulers do not wait). Tasks still running
/// after that are logged and left to finish on detached threads.
Result<std::unique_ptr<IScheduler>, SchedulerError>
create_thread_pool_scheduler(const SchedulerConfig &config,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<CancelToken> cancel_token = nullptr);

} // namespace easythreads::core
