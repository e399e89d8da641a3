#include "core/logger.h"
#include "core/scheduler.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/progress_reporter.h"
#include "infra/safe_file_writer.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace easythreads;

constexpr int kUnitsPerTask = 4;

/// Appends one line per unit of work. The task named `flaky` throws on its
/// first attempt so the demo exercises retry_failed().
core::TaskFn make_writer_task(std::shared_ptr<infra::SafeFileWriter> writer,
                              std::string message, bool flaky,
                              std::shared_ptr<std::atomic<int>> attempts) {
  return [writer, message, flaky, attempts](core::TaskContext &ctx)
             -> core::TaskResult {
    const int attempt = attempts->fetch_add(1) + 1;
    for (int unit = 1; unit <= kUnitsPerTask; ++unit) {
      ctx.cancel_token->throw_if_canceled();
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      if (flaky && attempt == 1 && unit == kUnitsPerTask / 2) {
        throw std::runtime_error("simulated failure in " + ctx.name);
      }
      writer->write(message + " (" + std::to_string(unit) + "/" +
                    std::to_string(kUnitsPerTask) + ")");
      ctx.report_progress(unit, kUnitsPerTask);
    }
    return message;
  };
}

void log_status_table(core::IScheduler &scheduler,
                      const std::shared_ptr<core::ILogger> &logger) {
  for (const auto &name : scheduler.all_names()) {
    auto status = scheduler.status(name);
    if (status.is_err()) {
      continue;
    }
    const auto &s = status.value();
    std::string line = std::string(core::to_string(s.state)) + " " +
                       std::to_string(s.progress.completed) + "/" +
                       std::to_string(s.progress.total);
    if (s.failure.has_value()) {
      line += " error=" + s.failure->message;
    }
    logger->info(name, "app", "status", line);
  }
}

} // namespace

int main() {
  std::shared_ptr<core::ILogger> logger =
      infra::create_console_logger(infra::LogConfig::from_environment());

  const auto config = infra::AppConfig::from_environment(logger);
  logger->info("startup", "app", "config",
               "max_workers=" + std::to_string(config.scheduler.max_workers) +
                   " tasks=" + std::to_string(config.task_count) +
                   " output=" + config.output_path);

  // Declared before the scheduler so it outlives the workers.
  infra::ProgressReporter reporter(logger);

  auto created = core::create_thread_pool_scheduler(config.scheduler, logger);
  if (created.is_err()) {
    logger->error("startup", "app", "scheduler_create_failed",
                  created.error().message);
    return 1;
  }
  auto scheduler = std::move(created).value();

  scheduler->on_progress(reporter.observer());
  scheduler->on_state_change([logger](const std::string &name,
                                      core::TaskState state) {
    logger->debug(name, "app", "state_changed", core::to_string(state));
  });

  auto writer = std::make_shared<infra::SafeFileWriter>(config.output_path);
  for (int i = 0; i < config.task_count; ++i) {
    const bool flaky = i == config.task_count / 2;
    core::TaskSpec spec;
    spec.name = flaky ? "flaky" : "writer-" + std::to_string(i);
    spec.priority = i % 3;
    spec.total_units = kUnitsPerTask;
    spec.fn = make_writer_task(writer, "Message " + std::to_string(i), flaky,
                               std::make_shared<std::atomic<int>>(0));

    auto submitted = scheduler->submit(std::move(spec));
    if (submitted.is_err()) {
      logger->error("startup", "app", "submit_failed",
                    submitted.error().message);
      return 1;
    }
  }

  scheduler->run(std::nullopt);

  std::vector<core::RetryTicket> tickets;
  if (!scheduler->failures().empty()) {
    tickets = scheduler->retry_failed();
    logger->info("scheduler", "app", "retrying",
                 std::to_string(tickets.size()) + " failed task(s)");
    scheduler->run(std::nullopt);
  }

  log_status_table(*scheduler, logger);

  std::size_t unresolved = 0;
  for (const auto &ticket : tickets) {
    const auto retried = scheduler->status(ticket.retry);
    if (retried.is_err() ||
        retried.value().state != core::TaskState::Succeeded) {
      ++unresolved;
    }
  }
  logger->info("scheduler", "app", "done",
               "Output written to " + writer->path());
  return unresolved == 0 ? 0 : 2;
}
