#include <gtest/gtest.h>

#include "core/retry_coordinator.h"
#include "core/status_registry.h"
#include "test_support.h"

#include <any>
#include <memory>
#include <stdexcept>
#include <string>

using namespace easythreads::core;
using easythreads::testing::RecordingLogger;

namespace {

void insert_finished(StatusRegistry &registry, const std::string &name,
                     int priority, bool failed) {
  TaskRecord record;
  record.name = name;
  record.priority = priority;
  record.progress.total = 3;
  record.fn = [name](TaskContext &) -> TaskResult { return name; };
  registry.insert(std::move(record));
  registry.mark_running(name);

  TaskOutcome outcome;
  if (failed) {
    outcome.failure = TaskFailure{
        "failed", std::make_exception_ptr(std::runtime_error("failed")), false};
  }
  registry.complete(name, std::move(outcome));
}

} // namespace

TEST(RetryCoordinator, ResubmitsOnlyFailedRecords) {
  auto logger = std::make_shared<RecordingLogger>();
  RetryCoordinator retry(logger);
  StatusRegistry registry;

  insert_finished(registry, "ok", 0, false);
  insert_finished(registry, "broken", 4, true);

  auto tickets = retry.resubmit_failed(registry);
  ASSERT_EQ(tickets.size(), 1u);
  ASSERT_EQ(tickets[0].original, "broken");
  ASSERT_EQ(tickets[0].retry, "broken-2");
  ASSERT_EQ(tickets[0].priority, 4);

  auto copy = registry.get("broken-2").value();
  ASSERT_EQ(copy.state, TaskState::Pending);
  ASSERT_EQ(copy.priority, 4);
  ASSERT_EQ(copy.attempt, 2);
  ASSERT_EQ(copy.retry_of, "broken");
  ASSERT_EQ(copy.progress.total, 3);
  ASSERT_EQ(copy.progress.completed, 0);

  TaskContext ctx;
  ASSERT_EQ(std::any_cast<std::string>(copy.fn(ctx)), "broken");

  ASSERT_EQ(registry.get("broken").value().state, TaskState::Failed);
  ASSERT_TRUE(logger->has_event("retry_scheduled"));
}

TEST(RetryCoordinator, SecondCallDoesNotDuplicateRetries) {
  RetryCoordinator retry(nullptr);
  StatusRegistry registry;
  insert_finished(registry, "a", 0, true);

  ASSERT_EQ(retry.resubmit_failed(registry).size(), 1u);
  ASSERT_TRUE(retry.resubmit_failed(registry).empty());
  ASSERT_EQ(registry.pending_names(), (std::vector<std::string>{"a-2"}));
}

TEST(RetryCoordinator, NoFailuresNoTickets) {
  RetryCoordinator retry(nullptr);
  StatusRegistry registry;
  insert_finished(registry, "fine", 0, false);

  ASSERT_TRUE(retry.resubmit_failed(registry).empty());
  ASSERT_EQ(registry.size(), 1u);
}

TEST(RetryCoordinator, FailedRetryGetsNextSuffix) {
  RetryCoordinator retry(nullptr);
  StatusRegistry registry;
  insert_finished(registry, "x", 0, true);

  retry.resubmit_failed(registry);
  registry.mark_running("x-2");
  TaskOutcome outcome;
  outcome.failure = TaskFailure{"again", nullptr, false};
  registry.complete("x-2", std::move(outcome));

  auto tickets = retry.resubmit_failed(registry);
  ASSERT_EQ(tickets.size(), 1u);
  ASSERT_EQ(tickets[0].original, "x-2");
  ASSERT_EQ(tickets[0].retry, "x-2-2");
  ASSERT_EQ(registry.get("x-2-2").value().attempt, 3);
}
