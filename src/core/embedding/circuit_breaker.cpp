#include "core/embedding/circuit_breaker.h"

#include <chrono>

namespace hr {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // anonymous namespace

bool EncoderCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EncoderCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EncoderCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

} // namespace hr
