#pragma once
#include <atomic>

namespace FeedScout {

// Shared between a caller and the workers of one discovery call.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}
