#pragma once

#include <atomic>
#include <cstdint>

namespace hr {

// Opens after kOpenThreshold consecutive inference failures. While open,
// callers skip the model; after kHalfOpenDelayMs one attempt is let through.
struct EncoderCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;
    static constexpr int kHalfOpenDelayMs = 30000;

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

} // namespace hr
