#pragma once

#include <atomic>

namespace foresight {

// Cooperative cancellation flag polled by long-running batch jobs
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token)
{
    return token != nullptr && token->cancelled();
}

}  // namespace foresight
