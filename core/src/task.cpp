#include "core/task.h"

#include <algorithm>

namespace easythreads::core {

const char *to_string(TaskState state) {
  switch (state) {
  case TaskState::Pending:
    return "Pending";
  case TaskState::Running:
    return "Running";
  case TaskState::Succeeded:
    return "Succeeded";
  case TaskState::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool is_terminal(TaskState state) {
  return state == TaskState::Succeeded || state == TaskState::Failed;
}

Result<void, SchedulerError> TaskRecord::transition_to(TaskState new_state) {
  bool legal = false;
  switch (state) {
  case TaskState::Pending:
    legal = new_state == TaskState::Running;
    break;
  case TaskState::Running:
    legal = new_state == TaskState::Succeeded || new_state == TaskState::Failed;
    break;
  case TaskState::Succeeded:
  case TaskState::Failed:
    // Terminal. A retry is a new record, never a revisit.
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, SchedulerError>::Err(SchedulerError::InvalidState(
        std::string("Illegal state transition: ") + to_string(state) + " -> " +
        to_string(new_state) + " (name=" + name + ")"));
  }

  state = new_state;
  if (new_state == TaskState::Running) {
    started_at = Clock::now();
  }
  if (is_terminal(new_state)) {
    finished_at = Clock::now();
  }
  return Result<void, SchedulerError>::Ok();
}

Result<void, SchedulerError> TaskRecord::complete(TaskOutcome outcome) {
  const TaskState target =
      outcome.succeeded() ? TaskState::Succeeded : TaskState::Failed;
  auto moved = transition_to(target);
  if (moved.is_err()) {
    return moved;
  }

  if (outcome.failure.has_value()) {
    failure = std::move(outcome.failure);
  } else {
    result = std::move(outcome.result);
  }
  progress.completed = progress.total;
  return Result<void, SchedulerError>::Ok();
}

void TaskRecord::set_progress(int completed, int total) {
  progress.total = std::max(1, total);
  progress.completed = std::clamp(completed, 0, progress.total);
}

std::optional<TaskRecord::Clock::duration> TaskRecord::duration() const {
  if (!started_at.has_value()) {
    return std::nullopt;
  }
  const TimePoint end = finished_at.value_or(Clock::now());
  return end - *started_at;
}

} // namespace easythreads::core
