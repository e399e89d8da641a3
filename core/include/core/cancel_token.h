#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace easythreads::core {

/// Shared cooperative cancellation signal.
///
/// The scheduler polls it at admission boundaries; task bodies may poll it
/// through TaskContext. Setting it never interrupts running work.
///
///   TaskResult body(TaskContext &ctx) {
///     for (int i = 0; i < n; ++i) {
///       ctx.cancel_token->throw_if_canceled();
///       ...
///     }
///   }
class CancelToken {
public:
  CancelToken() = default;
  CancelToken(const CancelToken &) = delete;
  CancelToken &operator=(const CancelToken &) = delete;

  /// Thread-safe, idempotent. Listeners run once, on the first call.
  void request_cancel() noexcept;

  [[nodiscard]] bool is_canceled() const noexcept;

  /// Throws TaskCanceled once cancellation has been requested.
  void throw_if_canceled() const;

  /// Listener invoked synchronously from the first request_cancel(), or
  /// immediately if the token is already canceled. Returns an id for
  /// remove_listener(); 0 when the listener already ran.
  using Listener = std::function<void()>;
  using ListenerId = std::uint64_t;
  ListenerId on_cancel(Listener listener);

  /// Drops a listener that has not run yet. Unknown ids are ignored.
  void remove_listener(ListenerId id);

  [[nodiscard]] std::size_t listener_count() const;

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  mutable std::mutex listeners_mutex_;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_id_ = 1;
};

} // namespace easythreads::core
