#pragma once

#include "core/scheduler.h"

#include <memory>
#include <string>

namespace easythreads::infra {

/// Demo process configuration.
struct AppConfig {
  core::SchedulerConfig scheduler;
  std::string output_path = "output.txt";
  int task_count = 5;

  /// Reads the EASYTHREADS_* variables. An invalid value logs
  /// `config_invalid` and keeps the default.
  static AppConfig
  from_environment(const std::shared_ptr<core::ILogger> &logger);
};

/// hardware_concurrency() - 1, clamped to [2, 8].
int auto_worker_count();

/// Integer from the environment, or `fallback` when unset or invalid.
int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger);

/// Accepts 1/true/yes and 0/false/no, case-insensitive.
bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<core::ILogger> &logger);

} // namespace easythreads::infra
