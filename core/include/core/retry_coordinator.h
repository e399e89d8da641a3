#pragma once

#include <memory>
#include <string>
#include <vector>

namespace easythreads::core {

class ILogger;
class StatusRegistry;

/// One failed record re-submitted as a new record.
struct RetryTicket {
  std::string original;
  std::string retry;
  int priority = 0;
};

/// Re-submits failed tasks as fresh records.
class RetryCoordinator {
public:
  explicit RetryCoordinator(std::shared_ptr<ILogger> logger);

  /// For every record Failed right now that has not been retried yet:
  /// registers a Pending copy of its body, priority and progress total
  /// under a disambiguated name. Originals stay untouched.
  ///
  /// Retries are registered, not queued: the caller queues each ticket once
  /// its Pending notification went out. The caller must hold the lock that
  /// guards `registry`.
  std::vector<RetryTicket> resubmit_failed(StatusRegistry &registry) const;

private:
  std::shared_ptr<ILogger> logger_;
};

} // namespace easythreads::core
