#include "core/status_registry.h"

#include <algorithm>
#include <utility>

namespace easythreads::core {

std::string disambiguate_name(
    const std::string &base,
    const std::function<bool(const std::string &)> &taken) {
  if (!taken(base)) {
    return base;
  }
  for (int suffix = 2;; ++suffix) {
    std::string candidate = base + "-" + std::to_string(suffix);
    if (!taken(candidate)) {
      return candidate;
    }
  }
}

Result<TaskHandle, SchedulerError> StatusRegistry::insert(TaskRecord record) {
  if (contains(record.name)) {
    return Result<TaskHandle, SchedulerError>::Err(
        SchedulerError::DuplicateName(record.name));
  }

  record.sequence = next_sequence_++;
  const std::string name = record.name;

  Entry entry;
  entry.record = std::move(record);
  entry.done = entry.completion.get_future().share();
  TaskHandle handle(name, entry.done);

  entries_.emplace(name, std::move(entry));
  order_.push_back(name);
  return Result<TaskHandle, SchedulerError>::Ok(std::move(handle));
}

bool StatusRegistry::contains(const std::string &name) const {
  return entries_.find(name) != entries_.end();
}

Result<TaskRecord, SchedulerError>
StatusRegistry::get(const std::string &name) const {
  const Entry *entry = find(name);
  if (entry == nullptr) {
    return Result<TaskRecord, SchedulerError>::Err(
        SchedulerError::NotFound(name));
  }
  return Result<TaskRecord, SchedulerError>::Ok(entry->record);
}

std::string StatusRegistry::unique_name(const std::string &base) const {
  return disambiguate_name(
      base, [this](const std::string &candidate) { return contains(candidate); });
}

std::vector<std::string> StatusRegistry::all_names() const { return order_; }

std::vector<std::string> StatusRegistry::active_names() const {
  std::vector<std::string> out;
  for (const auto &name : order_) {
    if (entries_.at(name).record.state == TaskState::Running) {
      out.push_back(name);
    }
  }
  return out;
}

std::vector<std::string> StatusRegistry::pending_names() const {
  std::vector<std::string> out;
  for (const auto &name : order_) {
    if (entries_.at(name).record.state == TaskState::Pending) {
      out.push_back(name);
    }
  }
  return out;
}

std::vector<std::string> StatusRegistry::unfinished_names() const {
  std::vector<std::string> out;
  for (const auto &name : order_) {
    if (!is_terminal(entries_.at(name).record.state)) {
      out.push_back(name);
    }
  }
  return out;
}

std::map<std::string, TaskResult> StatusRegistry::results() const {
  std::map<std::string, TaskResult> out;
  for (const auto &[name, entry] : entries_) {
    out.emplace(name, entry.record.result.value_or(TaskResult{}));
  }
  return out;
}

std::map<std::string, TaskFailure> StatusRegistry::failures() const {
  std::map<std::string, TaskFailure> out;
  for (const auto &[name, entry] : entries_) {
    if (entry.record.state == TaskState::Failed && entry.record.failure) {
      out.emplace(name, *entry.record.failure);
    }
  }
  return out;
}

std::vector<TaskRecord> StatusRegistry::records_in_state(TaskState state) const {
  std::vector<TaskRecord> out;
  for (const auto &name : order_) {
    const auto &record = entries_.at(name).record;
    if (record.state == state) {
      out.push_back(record);
    }
  }
  return out;
}

bool StatusRegistry::has_retry_of(const std::string &name) const {
  return std::any_of(entries_.begin(), entries_.end(), [&name](const auto &kv) {
    return kv.second.record.retry_of == name;
  });
}

std::vector<std::string> StatusRegistry::remove_finished() {
  std::vector<std::string> removed;
  for (const auto &name : order_) {
    if (is_terminal(entries_.at(name).record.state)) {
      removed.push_back(name);
    }
  }
  for (const auto &name : removed) {
    entries_.erase(name);
  }
  order_.erase(std::remove_if(order_.begin(), order_.end(),
                              [this](const std::string &name) {
                                return !contains(name);
                              }),
               order_.end());
  return removed;
}

Result<TaskRecord, SchedulerError>
StatusRegistry::mark_running(const std::string &name) {
  Entry *entry = find(name);
  if (entry == nullptr) {
    return Result<TaskRecord, SchedulerError>::Err(
        SchedulerError::NotFound(name));
  }
  auto moved = entry->record.transition_to(TaskState::Running);
  if (moved.is_err()) {
    return Result<TaskRecord, SchedulerError>::Err(moved.error());
  }
  entry->record.progress.completed = 0;
  return Result<TaskRecord, SchedulerError>::Ok(entry->record);
}

Result<void, SchedulerError> StatusRegistry::complete(const std::string &name,
                                                      TaskOutcome outcome) {
  Entry *entry = find(name);
  if (entry == nullptr) {
    return Result<void, SchedulerError>::Err(SchedulerError::NotFound(name));
  }
  auto completed = entry->record.complete(std::move(outcome));
  if (completed.is_err()) {
    return completed;
  }
  // complete() only succeeds on the single Running -> terminal edge, so the
  // promise is fulfilled exactly once.
  entry->completion.set_value();
  return Result<void, SchedulerError>::Ok();
}

Result<TaskProgress, SchedulerError>
StatusRegistry::set_progress(const std::string &name, int completed,
                             int total) {
  Entry *entry = find(name);
  if (entry == nullptr) {
    return Result<TaskProgress, SchedulerError>::Err(
        SchedulerError::NotFound(name));
  }
  if (entry->record.state != TaskState::Running) {
    return Result<TaskProgress, SchedulerError>::Err(
        SchedulerError::InvalidState("Progress reported for task not running: " +
                                     name));
  }
  entry->record.set_progress(completed, total);
  return Result<TaskProgress, SchedulerError>::Ok(entry->record.progress);
}

std::size_t StatusRegistry::count(TaskState state) const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(), [state](const auto &kv) {
        return kv.second.record.state == state;
      }));
}

StatusRegistry::Entry *StatusRegistry::find(const std::string &name) {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

const StatusRegistry::Entry *StatusRegistry::find(const std::string &name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

} // namespace easythreads::core
