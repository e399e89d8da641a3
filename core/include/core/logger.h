#pragma once

#include <string>

namespace easythreads::core {

/// Logger interface used by the scheduler core.
/// Concrete implementations live in infra; a null logger disables logging.
///
/// `task` is the task name the event concerns (or a scope such as
/// "scheduler" for pool-wide events).
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &task, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &task, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &task, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &task, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace easythreads::core
