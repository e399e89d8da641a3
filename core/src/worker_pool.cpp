#include "core/worker_pool.h"

#include "core/logger.h"

#include <utility>

namespace easythreads::core {
namespace {

long long elapsed_ms(const TaskRecord &record) {
  const auto duration = record.duration();
  if (!duration.has_value()) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(*duration)
      .count();
}

} // namespace

// ---- SchedulerState ----

SchedulerState::SchedulerState(int workers, std::shared_ptr<CancelToken> token,
                               std::shared_ptr<ILogger> log)
    : max_workers(workers), cancel_token(std::move(token)),
      logger(std::move(log)), wrapper(logger), retry(logger) {}

bool SchedulerState::admissible_locked() const {
  if (cancel_token->is_canceled() || running >= max_workers) {
    return false;
  }
  return !started.empty() || (admission_open && !queue.empty());
}

bool SchedulerState::drained_locked() const {
  if (running > 0) {
    return false;
  }
  if (cancel_token->is_canceled()) {
    return true;
  }
  return started.empty() && (queue.empty() || !admission_open);
}

void SchedulerState::dispatch(const std::vector<StateEvent> &events) {
  if (events.empty()) {
    return;
  }

  std::vector<StateCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex);
    callbacks = state_callbacks;
  }

  for (const auto &event : events) {
    for (const auto &cb : callbacks) {
      if (!cb) {
        continue;
      }
      try {
        cb(event.name, event.state);
      } catch (const std::exception &e) {
        if (logger) {
          logger->warn(event.name, "scheduler", "observer_failed", e.what());
        }
      } catch (...) {
        if (logger) {
          logger->warn(event.name, "scheduler", "observer_failed",
                       "unknown exception");
        }
      }
    }
  }
}

void SchedulerState::report_progress(const std::string &name, int completed,
                                     int total) {
  std::vector<ProgressObserver> observers;
  TaskProgress stored;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto updated = registry.set_progress(name, completed, total);
    if (updated.is_err()) {
      // Late report from a body that already returned.
      return;
    }
    stored = updated.value();
    observers = progress_observers;
  }
  wrapper.notify(observers, name, stored.completed, stored.total);
}

void SchedulerState::wake_all() {
  {
    // Serialize with waiters so a predicate check cannot miss this wake-up.
    std::lock_guard<std::mutex> lock(mutex);
  }
  work_cv.notify_all();
  idle_cv.notify_all();
}

// ---- WorkerPool ----

WorkerPool::WorkerPool(std::shared_ptr<SchedulerState> state,
                       std::chrono::milliseconds poll_interval)
    : state_(std::move(state)) {
  threads_.reserve(static_cast<size_t>(state_->max_workers));
  for (int i = 0; i < state_->max_workers; ++i) {
    threads_.emplace_back(&WorkerPool::worker_loop, state_, poll_interval);
  }
}

WorkerPool::~WorkerPool() { shutdown(false); }

void WorkerPool::shutdown(bool detach) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stopping = true;
  }
  state_->work_cv.notify_all();
  state_->idle_cv.notify_all();

  for (auto &t : threads_) {
    if (!t.joinable()) {
      continue;
    }
    if (detach) {
      t.detach();
    } else {
      t.join();
    }
  }
  threads_.clear();
}

void WorkerPool::worker_loop(std::shared_ptr<SchedulerState> state,
                             std::chrono::milliseconds poll_interval) {
  while (true) {
    std::optional<Admission> admission;
    std::vector<ProgressObserver> observers;

    {
      std::unique_lock<std::mutex> lock(state->mutex);
      // Woken by submit/start/finish/cancel; the bounded wait covers any
      // signal that does not go through the condition variable.
      while (!state->stopping && !state->admissible_locked()) {
        state->work_cv.wait_for(lock, poll_interval);
      }
      if (state->stopping) {
        return;
      }

      admission = admit_next_locked(state);
      if (!admission.has_value()) {
        continue;
      }
      observers = state->progress_observers;
    }

    if (state->logger) {
      state->logger->info(admission->name, "pool", "task_admitted",
                          "Starting task " + admission->name);
    }
    state->dispatch({{admission->name, TaskState::Running}});
    state->wrapper.notify(observers, admission->name, 0, admission->total);

    TaskOutcome outcome = state->wrapper.run(admission->fn, admission->ctx);
    finish(*state, admission->name, std::move(outcome));
  }
}

std::optional<WorkerPool::Admission>
WorkerPool::admit_next_locked(const std::shared_ptr<SchedulerState> &state) {
  auto next = state->started.pop();
  if (!next.has_value() && state->admission_open) {
    next = state->queue.pop();
  }
  if (!next.has_value()) {
    return std::nullopt;
  }

  auto marked = state->registry.mark_running(*next);
  if (marked.is_err()) {
    // Stale key: the registry is the source of truth.
    if (state->logger) {
      state->logger->warn(*next, "pool", "admission_skipped",
                          marked.error().message);
    }
    return std::nullopt;
  }

  ++state->running;
  const TaskRecord &record = marked.value();

  Admission admission;
  admission.name = record.name;
  admission.fn = record.fn;
  admission.total = record.progress.total;
  admission.ctx.name = record.name;
  admission.ctx.cancel_token = state->cancel_token;

  std::weak_ptr<SchedulerState> weak = state;
  admission.ctx.on_progress = [weak, name = record.name](int completed,
                                                         int total) {
    if (auto locked = weak.lock()) {
      locked->report_progress(name, completed, total);
    }
  };
  return admission;
}

void WorkerPool::finish(SchedulerState &state, const std::string &name,
                        TaskOutcome outcome) {
  std::optional<TaskRecord> snapshot;
  std::vector<ProgressObserver> observers;

  {
    std::lock_guard<std::mutex> lock(state.mutex);
    auto completed = state.registry.complete(name, std::move(outcome));
    if (completed.is_err()) {
      if (state.logger) {
        state.logger->error(name, "pool", "complete_rejected",
                            completed.error().message);
      }
    } else {
      auto record = state.registry.get(name);
      if (record.is_ok()) {
        snapshot = std::move(record).value();
      }
    }
    observers = state.progress_observers;
  }

  if (snapshot.has_value()) {
    if (state.logger) {
      if (snapshot->state == TaskState::Succeeded) {
        state.logger->info(name, "pool", "task_succeeded",
                           "Task " + name + " finished in " +
                               std::to_string(elapsed_ms(*snapshot)) + "ms");
      } else {
        state.logger->info(name, "pool", "task_finished_failed",
                           "Task " + name + " failed after " +
                               std::to_string(elapsed_ms(*snapshot)) + "ms");
      }
    }
    state.dispatch({{name, snapshot->state}});
    state.wrapper.notify(observers, name, snapshot->progress.completed,
                         snapshot->progress.total);
  }

  // The slot is released only after observers ran, so a drained join()
  // never races a completion notification.
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    --state.running;
  }
  state.idle_cv.notify_all();
  state.work_cv.notify_all();
}

} // namespace easythreads::core
