#include "core/scheduler.h"

#include "core/logger.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <utility>

namespace easythreads::core {
namespace {

using Clock = std::chrono::steady_clock;

constexpr int kDefaultPollIntervalMs = 100;
constexpr const char *kDefaultTaskName = "task";

std::string join_names(const std::vector<std::string> &names) {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

class ThreadPoolScheduler final : public IScheduler {
public:
  ThreadPoolScheduler(SchedulerConfig config, std::shared_ptr<ILogger> logger,
                      std::shared_ptr<CancelToken> parent_token)
      : config_(normalize_config(config)), logger_(logger),
        parent_token_(std::move(parent_token)),
        state_(std::make_shared<SchedulerState>(
            config_.max_workers, CancelToken::create(), std::move(logger))),
        pool_(state_, std::chrono::milliseconds(config_.poll_interval_ms)) {
    std::weak_ptr<SchedulerState> weak = state_;
    state_->cancel_token->on_cancel([weak]() {
      if (auto state = weak.lock()) {
        state->wake_all();
      }
    });

    if (parent_token_) {
      std::weak_ptr<CancelToken> child = state_->cancel_token;
      parent_listener_ = parent_token_->on_cancel([child]() {
        if (auto token = child.lock()) {
          token->request_cancel();
        }
      });
    }
  }

  ~ThreadPoolScheduler() override {
    if (parent_token_ && parent_listener_ != 0) {
      parent_token_->remove_listener(parent_listener_);
    }

    std::vector<std::string> abandoned;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      abandoned = state_->registry.pending_names();
    }
    if (logger_ && !abandoned.empty()) {
      logger_->warn("scheduler", "scheduler", "shutdown_abandoned",
                    "Pending tasks never admitted: " + join_names(abandoned));
    }

    state_->cancel_token->request_cancel();

    bool detach = config_.daemon;
    if (!detach) {
      auto still_running = wait_for_running(
          std::chrono::milliseconds(config_.shutdown_timeout_ms));
      if (!still_running.empty()) {
        if (logger_) {
          logger_->warn("scheduler", "scheduler", "shutdown_timeout",
                        "Still running after " +
                            std::to_string(config_.shutdown_timeout_ms) +
                            "ms: " + join_names(still_running));
        }
        detach = true;
      }
    }
    pool_.shutdown(detach);
  }

  Result<TaskHandle, SchedulerError> submit(TaskSpec spec) override {
    if (!spec.fn) {
      return Result<TaskHandle, SchedulerError>::Err(
          SchedulerError::InvalidArgument("Task callable must not be empty"));
    }

    std::string name;
    Result<TaskHandle, SchedulerError> inserted =
        Result<TaskHandle, SchedulerError>::Err(SchedulerError{});
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      name = spec.name.empty() ? state_->registry.unique_name(kDefaultTaskName)
                               : spec.name;

      TaskRecord record;
      record.name = name;
      record.priority = spec.priority;
      record.fn = std::move(spec.fn);
      record.progress.total = std::max(1, spec.total_units);

      inserted = state_->registry.insert(std::move(record));
    }

    if (inserted.is_err()) {
      if (logger_) {
        logger_->warn(name, "scheduler", "submit_rejected",
                      inserted.error().message);
      }
      return inserted;
    }

    if (logger_) {
      logger_->debug(name, "scheduler", "task_submitted",
                     "priority=" + std::to_string(spec.priority));
    }
    // Queued only after Pending went out, so no worker can report Running
    // first.
    state_->dispatch({{name, TaskState::Pending}});
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      queue_unless_started_locked(name, spec.priority);
    }
    state_->work_cv.notify_all();
    return inserted;
  }

  bool start_all() override {
    if (state_->cancel_token->is_canceled()) {
      if (logger_) {
        logger_->warn("scheduler", "scheduler", "start_skipped",
                      "Cancel flag set; start_all skipped");
      }
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->admission_open = true;
    }
    state_->work_cv.notify_all();
    return true;
  }

  Result<bool, SchedulerError> start(const std::string &name) override {
    if (state_->cancel_token->is_canceled()) {
      if (logger_) {
        logger_->warn(name, "scheduler", "start_skipped",
                      "Cancel flag set; start of " + name + " skipped");
      }
      return Result<bool, SchedulerError>::Err(SchedulerError::Canceled(
          "Cancel flag set; start of " + name + " skipped"));
    }

    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      auto record = state_->registry.get(name);
      if (record.is_err()) {
        return Result<bool, SchedulerError>::Err(record.error());
      }
      if (record.value().state != TaskState::Pending ||
          state_->started.contains(name)) {
        return Result<bool, SchedulerError>::Ok(false);
      }
      state_->queue.remove(name);
      state_->started.push(name, record.value().priority);
    }

    if (logger_) {
      logger_->debug(name, "scheduler", "task_started", "Started on request");
    }
    state_->work_cv.notify_all();
    return Result<bool, SchedulerError>::Ok(true);
  }

  std::vector<std::string> join(JoinTimeout timeout) override {
    const auto poll = std::chrono::milliseconds(config_.poll_interval_ms);
    std::unique_lock<std::mutex> lock(state_->mutex);

    if (!timeout.has_value()) {
      while (!state_->drained_locked()) {
        state_->idle_cv.wait_for(lock, poll);
      }
    } else if (timeout->count() > 0) {
      const auto deadline = Clock::now() + *timeout;
      while (!state_->drained_locked()) {
        const auto now = Clock::now();
        if (now >= deadline) {
          break;
        }
        state_->idle_cv.wait_until(lock, std::min(deadline, now + poll));
      }
    }

    return state_->registry.unfinished_names();
  }

  std::vector<std::string> run(JoinTimeout timeout) override {
    start_all();
    auto remaining = join(timeout);
    if (logger_) {
      if (remaining.empty()) {
        logger_->info("scheduler", "scheduler", "drained",
                      "All tasks finished");
      } else {
        logger_->warn("scheduler", "scheduler", "drain_incomplete",
                      "Still pending or running: " + join_names(remaining));
      }
    }
    return remaining;
  }

  Result<TaskStatus, SchedulerError>
  status(const std::string &name) const override {
    auto record = get(name);
    if (record.is_err()) {
      return Result<TaskStatus, SchedulerError>::Err(record.error());
    }
    const TaskRecord &r = record.value();
    TaskStatus out;
    out.state = r.state;
    out.progress = r.progress;
    out.failure = r.failure;
    return Result<TaskStatus, SchedulerError>::Ok(std::move(out));
  }

  Result<TaskRecord, SchedulerError>
  get(const std::string &name) const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.get(name);
  }

  Result<TaskResult, SchedulerError> result(const std::string &name,
                                            bool rethrow) const override {
    auto record = get(name);
    if (record.is_err()) {
      return Result<TaskResult, SchedulerError>::Err(record.error());
    }

    const TaskRecord &r = record.value();
    if (r.state == TaskState::Failed && r.failure.has_value()) {
      if (rethrow && r.failure->cause) {
        std::rethrow_exception(r.failure->cause);
      }
      if (r.failure->canceled) {
        return Result<TaskResult, SchedulerError>::Err(
            SchedulerError::Canceled("Task " + name + " was canceled"));
      }
      return Result<TaskResult, SchedulerError>::Err(
          SchedulerError::TaskFailure(name, r.failure->message));
    }
    return Result<TaskResult, SchedulerError>::Ok(
        r.result.value_or(TaskResult{}));
  }

  std::map<std::string, TaskResult> results() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.results();
  }

  std::map<std::string, TaskFailure> failures() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.failures();
  }

  std::vector<std::string> all_names() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.all_names();
  }

  std::vector<std::string> active_names() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.active_names();
  }

  std::vector<std::string> pending_names() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.pending_names();
  }

  std::vector<std::string> remove_finished() override {
    std::vector<std::string> removed;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      removed = state_->registry.remove_finished();
    }
    if (logger_ && !removed.empty()) {
      logger_->debug("scheduler", "scheduler", "removed_finished",
                     join_names(removed));
    }
    return removed;
  }

  std::vector<RetryTicket> retry_failed() override {
    if (state_->cancel_token->is_canceled()) {
      if (logger_) {
        logger_->warn("scheduler", "scheduler", "retry_skipped",
                      "Cancel flag set; retry_failed skipped");
      }
      return {};
    }

    std::vector<RetryTicket> tickets;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      tickets = state_->retry.resubmit_failed(state_->registry);
    }
    if (tickets.empty()) {
      return tickets;
    }

    std::vector<StateEvent> events;
    events.reserve(tickets.size());
    for (const auto &ticket : tickets) {
      events.push_back({ticket.retry, TaskState::Pending});
    }
    state_->dispatch(events);
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      for (const auto &ticket : tickets) {
        queue_unless_started_locked(ticket.retry, ticket.priority);
      }
    }
    state_->work_cv.notify_all();
    return tickets;
  }

  void cancel() override {
    if (logger_ && !state_->cancel_token->is_canceled()) {
      logger_->warn("scheduler", "scheduler", "cancel_requested",
                    "Cooperative cancellation requested");
    }
    // The on_cancel listener wakes workers and joiners.
    state_->cancel_token->request_cancel();
  }

  bool is_canceled() const override {
    return state_->cancel_token->is_canceled();
  }

  std::shared_ptr<CancelToken> cancel_token() const override {
    return state_->cancel_token;
  }

  bool is_all_done() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->registry.unfinished_names().empty();
  }

  int running_count() const override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
  }

  void on_state_change(StateCallback cb) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->state_callbacks.push_back(std::move(cb));
  }

  void on_progress(ProgressObserver observer) override {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->progress_observers.push_back(std::move(observer));
  }

private:
  static SchedulerConfig normalize_config(SchedulerConfig config) {
    if (config.poll_interval_ms <= 0) {
      config.poll_interval_ms = kDefaultPollIntervalMs;
    }
    if (config.shutdown_timeout_ms < 0) {
      config.shutdown_timeout_ms = 0;
    }
    return config;
  }

  // start(name) may have claimed the task between insert and queueing.
  void queue_unless_started_locked(const std::string &name, int priority) {
    if (!state_->started.contains(name)) {
      state_->queue.push(name, priority);
    }
  }

  // Returns the names still running when the wait ends.
  std::vector<std::string>
  wait_for_running(std::chrono::milliseconds timeout) {
    const auto poll = std::chrono::milliseconds(config_.poll_interval_ms);
    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (state_->running > 0) {
      const auto now = Clock::now();
      if (now >= deadline) {
        break;
      }
      state_->idle_cv.wait_until(lock, std::min(deadline, now + poll));
    }
    if (state_->running == 0) {
      return {};
    }
    auto names = state_->registry.active_names();
    if (names.empty()) {
      // Bodies returned; completion observers are still running.
      names.push_back(std::to_string(state_->running) + " finishing task(s)");
    }
    return names;
  }

  SchedulerConfig config_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<CancelToken> parent_token_;
  CancelToken::ListenerId parent_listener_ = 0;
  std::shared_ptr<SchedulerState> state_;
  WorkerPool pool_;
};

} // namespace

Result<std::unique_ptr<IScheduler>, SchedulerError>
create_thread_pool_scheduler(const SchedulerConfig &config,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<CancelToken> cancel_token) {
  if (config.max_workers <= 0) {
    if (logger) {
      logger->error("scheduler", "scheduler", "config_invalid",
                    "max_workers must be positive, got " +
                        std::to_string(config.max_workers));
    }
    return Result<std::unique_ptr<IScheduler>, SchedulerError>::Err(
        SchedulerError::Configuration("max_workers must be positive, got " +
                                      std::to_string(config.max_workers)));
  }

  return Result<std::unique_ptr<IScheduler>, SchedulerError>::Ok(
      std::make_unique<ThreadPoolScheduler>(config, std::move(logger),
                                            std::move(cancel_token)));
}

} // namespace easythreads::core
