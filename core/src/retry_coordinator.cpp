#include "core/retry_coordinator.h"

#include "core/logger.h"
#include "core/status_registry.h"

#include <utility>

namespace easythreads::core {

RetryCoordinator::RetryCoordinator(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {}

std::vector<RetryTicket>
RetryCoordinator::resubmit_failed(StatusRegistry &registry) const {
  std::vector<RetryTicket> tickets;

  for (const auto &failed : registry.records_in_state(TaskState::Failed)) {
    if (registry.has_retry_of(failed.name)) {
      continue;
    }

    TaskRecord retry;
    retry.name = registry.unique_name(failed.name);
    retry.priority = failed.priority;
    retry.fn = failed.fn;
    retry.attempt = failed.attempt + 1;
    retry.retry_of = failed.name;
    retry.progress.total = failed.progress.total;

    const std::string retry_name = retry.name;
    auto inserted = registry.insert(std::move(retry));
    if (inserted.is_err()) {
      if (logger_) {
        logger_->error(failed.name, "retry", "retry_rejected",
                       inserted.error().message);
      }
      continue;
    }

    tickets.push_back(RetryTicket{failed.name, retry_name, failed.priority});

    if (logger_) {
      logger_->info(failed.name, "retry", "retry_scheduled",
                    "Retrying as " + retry_name + " (attempt " +
                        std::to_string(failed.attempt + 1) + ")");
    }
  }

  return tickets;
}

} // namespace easythreads::core
