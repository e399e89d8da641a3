#include "infra/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <utility>
#include <vector>

namespace easythreads::infra {
namespace {

constexpr const char *kLoggerName = "easythreads";

std::string env_or(const char *name, const std::string &fallback) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }
  return raw;
}

/// spdlog-based structured logger.
class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  void debug(const std::string &task, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", task, component, event, msg);
  }

  void info(const std::string &task, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", task, component, event, msg);
  }

  void warn(const std::string &task, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", task, component, event, msg);
  }

  void error(const std::string &task, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", task, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

std::shared_ptr<spdlog::logger> build_logger(const LogConfig &config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.file_path, false));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                                 sinks.end());
  logger->set_pattern(config.pattern);
  logger->set_level(spdlog::level::from_str(config.level));
  logger->flush_on(spdlog::level::warn);
  return logger;
}

} // namespace

LogConfig LogConfig::from_environment() {
  LogConfig config;
  config.level = env_or("EASYTHREADS_LOG_LEVEL", config.level);
  config.file_path = env_or("EASYTHREADS_LOG_FILE", config.file_path);
  return config;
}

std::unique_ptr<core::ILogger> create_console_logger(const LogConfig &config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = build_logger(config);
    spdlog::register_logger(logger);
  }
  return std::make_unique<ConsoleLogger>(std::move(logger));
}

} // namespace easythreads::infra
