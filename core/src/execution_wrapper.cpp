#include "core/execution_wrapper.h"

#include "core/logger.h"

#include <exception>
#include <utility>

namespace easythreads::core {

ExecutionWrapper::ExecutionWrapper(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {}

TaskOutcome ExecutionWrapper::run(const TaskFn &fn, TaskContext &ctx) const {
  TaskOutcome outcome;
  try {
    outcome.result = fn(ctx);
  } catch (const TaskCanceled &e) {
    outcome.failure = TaskFailure{e.what(), std::current_exception(), true};
  } catch (const std::exception &e) {
    outcome.failure = TaskFailure{e.what(), std::current_exception(), false};
  } catch (...) {
    // Foreign exception types are still recorded with their cause so a
    // caller can re-raise them from result(name, true).
    outcome.failure =
        TaskFailure{"non-standard exception", std::current_exception(), false};
  }

  if (logger_ && outcome.failure.has_value()) {
    if (outcome.failure->canceled) {
      logger_->warn(ctx.name, "wrapper", "task_canceled",
                    outcome.failure->message);
    } else {
      logger_->error(ctx.name, "wrapper", "task_failed",
                     "Task " + ctx.name + " raised: " + outcome.failure->message);
    }
  }
  return outcome;
}

void ExecutionWrapper::notify(const std::vector<ProgressObserver> &observers,
                              const std::string &name, int completed,
                              int total) const {
  for (const auto &observer : observers) {
    if (!observer) {
      continue;
    }
    try {
      observer(name, completed, total);
    } catch (const std::exception &e) {
      if (logger_) {
        logger_->warn(name, "wrapper", "observer_failed", e.what());
      }
    } catch (...) {
      if (logger_) {
        logger_->warn(name, "wrapper", "observer_failed",
                      "non-standard exception");
      }
    }
  }
}

} // namespace easythreads::core
