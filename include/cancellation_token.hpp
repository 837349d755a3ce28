#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace loadplus {

/**
 * Cooperative stop flag shared by every virtual user of one run.
 *
 * Users poll isCancelled() at their loop head. Callbacks let the owner of
 * pending waits wake them early; they run on the thread that calls cancel()
 * and must not block.
 */
class CancellationToken {
public:
  using Callback = std::function<void()>;
  using CallbackId = std::size_t;

  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  // Idempotent
  void cancel();
  bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Invoked immediately when the token is already cancelled
  CallbackId addCallback(Callback callback);

  // After this returns the callback is never invoked again
  void removeCallback(CallbackId id);

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  CallbackId nextId_ = 1;
  std::map<CallbackId, Callback> callbacks_;
};

} // namespace loadplus
