#include "infra/progress_reporter.h"

#include "core/logger.h"

#include <algorithm>
#include <utility>

namespace easythreads::infra {

ProgressReporter::ProgressReporter(std::shared_ptr<core::ILogger> logger,
                                   int bar_width)
    : logger_(std::move(logger)), bar_width_(std::max(1, bar_width)) {}

core::ProgressObserver ProgressReporter::observer() {
  return [this](const std::string &name, int completed, int total) {
    report(name, completed, total);
  };
}

void ProgressReporter::report(const std::string &name, int completed,
                              int total) {
  total = std::max(1, total);
  completed = std::clamp(completed, 0, total);
  const int percent =
      static_cast<int>(static_cast<long long>(completed) * 100 / total);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_percent_.find(name);
    // Only repaint when the bar actually moves.
    if (it != last_percent_.end() && it->second == percent) {
      return;
    }
    last_percent_[name] = percent;
  }

  if (logger_) {
    logger_->info(name, "progress", "progress",
                  render_bar(completed, total) + " " +
                      std::to_string(percent) + "% (" +
                      std::to_string(completed) + "/" + std::to_string(total) +
                      ")");
  }
}

int ProgressReporter::last_percent(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_percent_.find(name);
  return it == last_percent_.end() ? -1 : it->second;
}

std::string ProgressReporter::render_bar(int completed, int total) const {
  total = std::max(1, total);
  completed = std::clamp(completed, 0, total);
  const int filled = static_cast<int>(
      static_cast<long long>(completed) * bar_width_ / total);
  return "[" + std::string(static_cast<size_t>(filled), '#') +
         std::string(static_cast<size_t>(bar_width_ - filled), '.') + "]";
}

} // namespace easythreads::infra
