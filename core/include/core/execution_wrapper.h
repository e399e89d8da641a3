#pragma once

#include "core/task.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace easythreads::core {

class ILogger;

/// Progress observer: (name, completed_units, total_units).
using ProgressObserver =
    std::function<void(const std::string &name, int completed, int total)>;

/// Per-task supervisor. Runs one task body with capture semantics and
/// shields the scheduler from both task and observer failures.
class ExecutionWrapper {
public:
  explicit ExecutionWrapper(std::shared_ptr<ILogger> logger);

  /// Invokes `fn` exactly once. A normal return is captured as the result;
  /// any exception is captured as the failure and never escapes.
  TaskOutcome run(const TaskFn &fn, TaskContext &ctx) const;

  /// Invokes every observer. An observer that throws is logged and skipped;
  /// task state is unaffected.
  void notify(const std::vector<ProgressObserver> &observers,
              const std::string &name, int completed, int total) const;

private:
  std::shared_ptr<ILogger> logger_;
};

} // namespace easythreads::core
