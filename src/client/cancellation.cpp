#include "chunkfs/client/cancellation.h"

#include <utility>

namespace chunkfs::client {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() {
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        handler = std::move(state_->handler);
        state_->handler = nullptr;
    }
    if (handler) {
        handler();
    }
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::OnCancel(std::function<void()> handler) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            state_->handler = std::move(handler);
            return;
        }
    }
    handler();
}

}  // namespace chunkfs::client
