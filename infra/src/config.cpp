#include "infra/config.h"

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

namespace easythreads::infra {
namespace {

void warn_invalid(const std::shared_ptr<core::ILogger> &logger,
                  const char *name, const std::string &raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

int auto_worker_count() {
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  if (hw <= 0) {
    return 4;
  }
  return std::clamp(hw - 1, 2, 8);
}

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }

  return static_cast<int>(value);
}

bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  const std::string value = lowercase(raw);
  if (value == "1" || value == "true" || value == "yes") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no") {
    return false;
  }
  warn_invalid(logger, name, raw, fallback ? "true" : "false");
  return fallback;
}

AppConfig
AppConfig::from_environment(const std::shared_ptr<core::ILogger> &logger) {
  AppConfig config;
  config.scheduler.max_workers = parse_env_int(
      "EASYTHREADS_MAX_WORKERS", auto_worker_count(), false, logger);
  config.scheduler.daemon =
      parse_env_bool("EASYTHREADS_DAEMON", config.scheduler.daemon, logger);
  config.scheduler.poll_interval_ms =
      parse_env_int("EASYTHREADS_POLL_INTERVAL_MS",
                    config.scheduler.poll_interval_ms, false, logger);
  config.scheduler.shutdown_timeout_ms =
      parse_env_int("EASYTHREADS_SHUTDOWN_TIMEOUT_MS",
                    config.scheduler.shutdown_timeout_ms, true, logger);
  config.task_count = parse_env_int("EASYTHREADS_TASK_COUNT",
                                    config.task_count, true, logger);

  const char *output = std::getenv("EASYTHREADS_OUTPUT_FILE");
  if (output && output[0] != 0) {
    config.output_path = output;
  }
  return config;
}

} // namespace easythreads::infra
