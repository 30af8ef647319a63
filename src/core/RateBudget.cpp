/**
 * @file RateBudget.cpp
 * @brief Token-bucket byte budget implementation
 */

#include "wharf/RateBudget.h"

#include <algorithm>

namespace Wharf {

RateBudget::RateBudget()
    : m_rate(0)
    , m_capacity(0)
    , m_tokens(0.0)
    , m_lastRefill(Clock::now())
{
}

RateBudget::RateBudget(uint64_t bytesPerSecond, uint64_t capacity, Clock::time_point now)
    : m_rate(bytesPerSecond)
    , m_capacity(capacity != 0 ? capacity : bytesPerSecond)
    , m_tokens(static_cast<double>(capacity != 0 ? capacity : bytesPerSecond))
    , m_lastRefill(now)
{
}

void RateBudget::refill(Clock::time_point now) {
    if (isUnlimited()) {
        return;
    }

    // Clock readings taken before the last refill add nothing.
    if (now <= m_lastRefill) {
        return;
    }

    const double elapsedSeconds =
        std::chrono::duration<double>(now - m_lastRefill).count();
    m_tokens = std::min(static_cast<double>(m_capacity),
                        m_tokens + elapsedSeconds * static_cast<double>(m_rate));
    m_lastRefill = now;
}

uint64_t RateBudget::available(Clock::time_point now) {
    if (isUnlimited()) {
        return UNLIMITED;
    }
    refill(now);
    return static_cast<uint64_t>(m_tokens);
}

void RateBudget::consume(uint64_t bytes) {
    if (isUnlimited()) {
        return;
    }
    m_tokens = std::max(0.0, m_tokens - static_cast<double>(bytes));
}

uint64_t RateBudget::clamp(uint64_t wanted,
                           RateBudget* first,
                           RateBudget* second,
                           Clock::time_point now)
{
    uint64_t allowed = wanted;
    if (first) {
        allowed = std::min(allowed, first->available(now));
    }
    if (second) {
        allowed = std::min(allowed, second->available(now));
    }
    return allowed;
}

void RateBudget::consumeAll(uint64_t bytes, RateBudget* first, RateBudget* second) {
    if (first) {
        first->consume(bytes);
    }
    if (second) {
        second->consume(bytes);
    }
}

}  // namespace Wharf
