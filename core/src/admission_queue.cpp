#include "core/admission_queue.h"

#include <utility>

namespace easythreads::core {

void AdmissionQueue::push(std::string name, int priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  heap_.push(Entry{priority, next_sequence_++, std::move(name)});
}

std::optional<std::string> AdmissionQueue::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (heap_.empty()) {
    return std::nullopt;
  }
  std::string name = heap_.top().name;
  heap_.pop();
  return name;
}

bool AdmissionQueue::remove(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Entry> kept;
  kept.reserve(heap_.size());
  bool found = false;
  while (!heap_.empty()) {
    if (!found && heap_.top().name == name) {
      found = true;
    } else {
      kept.push_back(heap_.top());
    }
    heap_.pop();
  }
  for (auto &entry : kept) {
    heap_.push(std::move(entry));
  }
  return found;
}

bool AdmissionQueue::contains(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto copy = heap_;
  while (!copy.empty()) {
    if (copy.top().name == name) {
      return true;
    }
    copy.pop();
  }
  return false;
}

bool AdmissionQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.empty();
}

std::size_t AdmissionQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.size();
}

std::vector<std::string> AdmissionQueue::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto copy = heap_;
  std::vector<std::string> out;
  out.reserve(copy.size());
  while (!copy.empty()) {
    out.push_back(copy.top().name);
    copy.pop();
  }
  return out;
}

void AdmissionQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  heap_ = {};
}

} // namespace easythreads::core
