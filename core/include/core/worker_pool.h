#pragma once

#include "core/admission_queue.h"
#include "core/cancel_token.h"
#include "core/execution_wrapper.h"
#include "core/retry_coordinator.h"
#include "core/status_registry.h"
#include "core/task.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace easythreads::core {

class ILogger;

/// State change notification: (name, new state).
using StateCallback =
    std::function<void(const std::string &name, TaskState new_state)>;

struct StateEvent {
  std::string name;
  TaskState state;
};

/// Everything the scheduler shares with its worker threads.
///
/// Held by shared_ptr so detached (daemon) workers keep it alive after the
/// scheduler is gone. `registry`, `running`, the flags and the callback
/// lists are guarded by `mutex`; the queues carry their own lock, which is
/// only ever taken after `mutex`.
///
/// `queue` holds submitted work and is served once admission is open.
/// `started` holds work admitted one by one through start(name) and is
/// served first, whether or not admission is open.
struct SchedulerState {
  SchedulerState(int max_workers, std::shared_ptr<CancelToken> cancel_token,
                 std::shared_ptr<ILogger> logger);

  const int max_workers;
  const std::shared_ptr<CancelToken> cancel_token;
  const std::shared_ptr<ILogger> logger;
  const ExecutionWrapper wrapper;
  const RetryCoordinator retry;

  mutable std::mutex mutex;
  std::condition_variable work_cv; // Queue became admissible, or stopping
  std::condition_variable idle_cv; // A slot freed, or cancellation

  StatusRegistry registry;
  AdmissionQueue queue;
  AdmissionQueue started;
  int running = 0;
  bool admission_open = false;
  bool stopping = false;

  std::vector<StateCallback> state_callbacks;
  std::vector<ProgressObserver> progress_observers;

  /// A worker may pop a queue head right now.
  [[nodiscard]] bool admissible_locked() const;

  /// Nothing running and nothing left that could be admitted.
  [[nodiscard]] bool drained_locked() const;

  /// Invokes state callbacks. Must be called without `mutex` held.
  void dispatch(const std::vector<StateEvent> &events);

  /// Progress sink behind TaskContext::report_progress().
  void report_progress(const std::string &name, int completed, int total);

  /// Wakes every waiter so it re-checks its predicate.
  void wake_all();
};

/// Worker Pool Controller.
///
/// Owns `max_workers` threads. Each one waits until the queue is admissible,
/// pops the head, moves the record Pending -> Running, runs it through the
/// execution wrapper outside the lock and then records the outcome. The
/// thread count is the concurrency cap.
class WorkerPool {
public:
  WorkerPool(std::shared_ptr<SchedulerState> state,
             std::chrono::milliseconds poll_interval);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Stops admission. Running tasks always finish; `detach` decides whether
  /// this call waits for them.
  void shutdown(bool detach);

private:
  struct Admission {
    std::string name;
    TaskFn fn;
    TaskContext ctx;
    int total = 1;
  };

  static void worker_loop(std::shared_ptr<SchedulerState> state,
                          std::chrono::milliseconds poll_interval);
  static std::optional<Admission>
  admit_next_locked(const std::shared_ptr<SchedulerState> &state);
  static void finish(SchedulerState &state, const std::string &name,
                     TaskOutcome outcome);

  std::shared_ptr<SchedulerState> state_;
  std::vector<std::thread> threads_;
};

} // namespace easythreads::core
