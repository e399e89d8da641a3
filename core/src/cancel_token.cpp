#include "core/cancel_token.h"
#include "core/scheduler_error.h"

#include <algorithm>
#include <utility>

namespace easythreads::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }

  std::vector<std::pair<ListenerId, Listener>> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners.swap(listeners_);
  }
  for (auto &entry : listeners) {
    if (!entry.second) {
      continue;
    }
    try {
      entry.second();
    } catch (...) {
      // request_cancel() is noexcept; remaining listeners still run.
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

void CancelToken::throw_if_canceled() const {
  if (is_canceled()) {
    throw TaskCanceled();
  }
}

CancelToken::ListenerId CancelToken::on_cancel(Listener listener) {
  if (!listener) {
    return 0;
  }
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (!is_canceled()) {
      const ListenerId id = next_id_++;
      listeners_.emplace_back(id, std::move(listener));
      return id;
    }
  }
  listener();
  return 0;
}

void CancelToken::remove_listener(ListenerId id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto &entry) {
                                    return entry.first == id;
                                  }),
                   listeners_.end());
}

std::size_t CancelToken::listener_count() const {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  return listeners_.size();
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace easythreads::core
