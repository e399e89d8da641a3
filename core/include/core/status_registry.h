#pragma once

#include "core/result.h"
#include "core/scheduler_error.h"
#include "core/task.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace easythreads::core {

/// Deterministic name disambiguation: `base` if free, else the first free
/// of `base-2`, `base-3`, ...
std::string disambiguate_name(const std::string &base,
                              const std::function<bool(const std::string &)> &taken);

/// Name -> TaskRecord map; the single owner of all task records.
///
/// Not internally synchronized. Every call must hold the scheduler state
/// mutex.
class StatusRegistry {
public:
  /// Registers a Pending record and assigns its sequence number.
  /// Err(DuplicateName) if the name is already held.
  Result<TaskHandle, SchedulerError> insert(TaskRecord record);

  [[nodiscard]] bool contains(const std::string &name) const;

  /// Copy of the record. Err(NotFound) for unknown names.
  [[nodiscard]] Result<TaskRecord, SchedulerError>
  get(const std::string &name) const;

  [[nodiscard]] std::string unique_name(const std::string &base) const;

  // All name lists are in submission order.
  [[nodiscard]] std::vector<std::string> all_names() const;
  [[nodiscard]] std::vector<std::string> active_names() const;
  [[nodiscard]] std::vector<std::string> pending_names() const;
  [[nodiscard]] std::vector<std::string> unfinished_names() const;

  /// Every record; an empty TaskResult where no result is stored.
  [[nodiscard]] std::map<std::string, TaskResult> results() const;

  /// Failed records only.
  [[nodiscard]] std::map<std::string, TaskFailure> failures() const;

  [[nodiscard]] std::vector<TaskRecord> records_in_state(TaskState state) const;

  /// True if some record was derived from `name` by a retry.
  [[nodiscard]] bool has_retry_of(const std::string &name) const;

  /// Evicts every terminal record. Returns the evicted names.
  std::vector<std::string> remove_finished();

  /// Pending -> Running. Returns the record so the caller can launch it.
  Result<TaskRecord, SchedulerError> mark_running(const std::string &name);

  /// Running -> terminal with the captured outcome, then fires the record's
  /// completion signal.
  Result<void, SchedulerError> complete(const std::string &name,
                                        TaskOutcome outcome);

  /// Applies only while the record is Running. Returns the stored
  /// (clamped) progress.
  Result<TaskProgress, SchedulerError> set_progress(const std::string &name,
                                                    int completed, int total);

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t count(TaskState state) const;

private:
  struct Entry {
    TaskRecord record;
    std::promise<void> completion;
    std::shared_future<void> done;
  };

  Entry *find(const std::string &name);
  const Entry *find(const std::string &name) const;

  std::unordered_map<std::string, Entry> entries_;
  std::vector<std::string> order_;
  std::uint64_t next_sequence_ = 0;
};

} // namespace easythreads::core
