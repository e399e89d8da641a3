#pragma once

#include "core/logger.h"
#include "core/task.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace easythreads::testing {

/// ILogger that keeps every event for later assertions.
class RecordingLogger : public core::ILogger {
public:
  struct Entry {
    std::string level;
    std::string task;
    std::string component;
    std::string event;
    std::string msg;
  };

  void debug(const std::string &task, const std::string &component,
             const std::string &event, const std::string &msg) override {
    record("debug", task, component, event, msg);
  }
  void info(const std::string &task, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record("info", task, component, event, msg);
  }
  void warn(const std::string &task, const std::string &component,
            const std::string &event, const std::string &msg) override {
    record("warn", task, component, event, msg);
  }
  void error(const std::string &task, const std::string &component,
             const std::string &event, const std::string &msg) override {
    record("error", task, component, event, msg);
  }

  bool has_event(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&event](const Entry &e) { return e.event == event; });
  }

  int count_event(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(
        std::count_if(entries_.begin(), entries_.end(),
                      [&event](const Entry &e) { return e.event == event; }));
  }

  std::vector<Entry> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

private:
  void record(const char *level, const std::string &task,
              const std::string &component, const std::string &event,
              const std::string &msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({level, task, component, event, msg});
  }

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

/// Tracks how many bodies run at once and the highest count observed.
class RunningGuard {
public:
  RunningGuard(std::atomic<int> &running, std::atomic<int> &max_running)
      : running_(running) {
    const int now = running_.fetch_add(1) + 1;
    int observed = max_running.load();
    while (observed < now &&
           !max_running.compare_exchange_weak(observed, now)) {
    }
  }

  ~RunningGuard() { running_.fetch_sub(1); }

  RunningGuard(const RunningGuard &) = delete;
  RunningGuard &operator=(const RunningGuard &) = delete;

private:
  std::atomic<int> &running_;
};

/// State change log shared with scheduler callbacks.
struct EventLog {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::pair<std::string, core::TaskState>> events;

  void push(const std::string &name, core::TaskState state) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      events.emplace_back(name, state);
    }
    cv.notify_all();
  }

  int first_index(const std::string &name, core::TaskState state) {
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < events.size(); ++i) {
      if (events[i].first == name && events[i].second == state) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  /// Every state `name` went through, in delivery order.
  std::vector<core::TaskState> states_of(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<core::TaskState> out;
    for (const auto &[n, s] : events) {
      if (n == name) {
        out.push_back(s);
      }
    }
    return out;
  }

  /// Names in the order they entered `state`.
  std::vector<std::string> names_in(core::TaskState state) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    for (const auto &[name, s] : events) {
      if (s == state) {
        out.push_back(name);
      }
    }
    return out;
  }
};

/// Blocks task bodies until released by the test.
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  bool wait(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return open_; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
};

} // namespace easythreads::testing
