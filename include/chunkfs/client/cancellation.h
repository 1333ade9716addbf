#pragma once

#include <functional>
#include <memory>
#include <mutex>

namespace chunkfs::client {

/// @brief Shared cancellation flag for one in-flight transfer.
///
/// Copies share state. The handler registered with OnCancel runs exactly once, on the
/// thread that calls Cancel (or immediately if the token was already cancelled).
class CancellationToken {
public:
    CancellationToken();

    void Cancel();
    bool cancelled() const;
    void OnCancel(std::function<void()> handler);

private:
    struct State {
        mutable std::mutex mutex;
        bool cancelled{false};
        std::function<void()> handler;
    };

    std::shared_ptr<State> state_;
};

}  // namespace chunkfs::client
