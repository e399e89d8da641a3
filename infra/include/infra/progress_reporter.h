#pragma once

#include "core/execution_wrapper.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace easythreads::core {
class ILogger;
}

namespace easythreads::infra {

/// Renders task progress through the logger as `[#####.....] 50% (5/10)`.
class ProgressReporter {
public:
  explicit ProgressReporter(std::shared_ptr<core::ILogger> logger,
                            int bar_width = 20);

  /// Observer to register with IScheduler::on_progress(). The reporter must
  /// outlive the scheduler it is registered with.
  core::ProgressObserver observer();

  void report(const std::string &name, int completed, int total);

  /// Last percentage rendered for `name`, -1 if never reported.
  [[nodiscard]] int last_percent(const std::string &name) const;

  [[nodiscard]] std::string render_bar(int completed, int total) const;

private:
  std::shared_ptr<core::ILogger> logger_;
  int bar_width_;
  mutable std::mutex mutex_;
  std::map<std::string, int> last_percent_;
};

} // namespace easythreads::infra
