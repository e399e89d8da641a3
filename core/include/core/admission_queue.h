#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace easythreads::core {

/// Priority-ordered holding area for tasks that have not started.
///
/// Holds only (priority, name) keys; the registry owns the records.
/// Smaller priority pops first, equal priorities pop in push order.
/// All operations are thread-safe.
class AdmissionQueue {
public:
  void push(std::string name, int priority);

  /// Next name in admission order, or nullopt when empty. Never blocks.
  std::optional<std::string> pop();

  /// Drops the entry for `name`. Returns false if it was not queued.
  bool remove(const std::string &name);

  [[nodiscard]] bool contains(const std::string &name) const;

  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;

  /// Snapshot of queued names in the order they would be popped.
  [[nodiscard]] std::vector<std::string> names() const;

  void clear();

private:
  struct Entry {
    int priority = 0;
    std::uint64_t sequence = 0;
    std::string name;
  };

  // priority_queue is a max-heap; "later" entries compare greater.
  struct AdmitsLater {
    bool operator()(const Entry &lhs, const Entry &rhs) const {
      if (lhs.priority != rhs.priority) {
        return lhs.priority > rhs.priority;
      }
      return lhs.sequence > rhs.sequence;
    }
  };

  mutable std::mutex mutex_;
  std::priority_queue<Entry, std::vector<Entry>, AdmitsLater> heap_;
  std::uint64_t next_sequence_ = 0;
};

} // namespace easythreads::core
