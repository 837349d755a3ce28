#include "cancellation_token.hpp"

namespace loadplus {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    for (auto& [id, callback] : callbacks_) {
        callback();
    }
}

CancellationToken::CallbackId CancellationToken::addCallback(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    CallbackId id = nextId_++;
    if (cancelled_.load(std::memory_order_acquire)) {
        callback();
    }
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void CancellationToken::removeCallback(CallbackId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

} // namespace loadplus
