#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace easythreads::infra {

/// Logging backend settings.
struct LogConfig {
  std::string level = "info"; // spdlog level name: trace, debug, info, ...
  std::string file_path;      // Empty: console only
  std::string pattern = "[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v";

  /// Reads EASYTHREADS_LOG_LEVEL and EASYTHREADS_LOG_FILE.
  static LogConfig from_environment();
};

/// spdlog-backed ILogger. Format: [ts] [level] [task] [component] event: msg
std::unique_ptr<core::ILogger> create_console_logger(const LogConfig &config);

} // namespace easythreads::infra
