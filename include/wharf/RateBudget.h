/**
 * @file RateBudget.h
 * @brief Token-bucket byte budget for transfer rate limiting
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace Wharf {

/**
 * @class RateBudget
 * @brief Token bucket refilled continuously at a fixed byte rate
 *
 * The bucket holds at most capacity() tokens (one token per byte) and gains
 * rate() tokens per second. A transfer chunk may only move as many bytes as
 * there are tokens; consumed bytes are removed from the bucket. Over any
 * window of W seconds at most capacity() + rate() * W bytes pass.
 *
 * A budget constructed with rate 0 is unlimited: available() returns
 * UNLIMITED and consume() is a no-op.
 *
 * Thread Safety:
 * - Not synchronized. Budgets are touched only on the reactor thread that
 *   owns the sessions using them.
 *
 * Time is passed in explicitly so tests can drive the bucket with a
 * synthetic clock.
 */
class RateBudget {
public:
    using Clock = std::chrono::steady_clock;

    /// Returned by available() for unlimited budgets
    static constexpr uint64_t UNLIMITED = UINT64_MAX;

    /**
     * @brief Construct an unlimited budget
     */
    RateBudget();

    /**
     * @brief Construct a limited budget
     * @param bytesPerSecond Refill rate; 0 means unlimited
     * @param capacity Burst capacity in bytes; 0 selects one second of rate
     * @param now Time of construction (the bucket starts full)
     */
    explicit RateBudget(uint64_t bytesPerSecond,
                        uint64_t capacity = 0,
                        Clock::time_point now = Clock::now());

    bool isUnlimited() const { return m_rate == 0; }
    uint64_t rate() const { return m_rate; }
    uint64_t capacity() const { return m_capacity; }

    /**
     * @brief Add the tokens accrued since the last refill, up to capacity
     */
    void refill(Clock::time_point now);

    /**
     * @brief Refill, then return the whole tokens currently available
     */
    uint64_t available(Clock::time_point now);

    /**
     * @brief Remove bytes from the bucket (never below zero)
     */
    void consume(uint64_t bytes);

    /**
     * @brief Clamp a wanted byte count to every non-null budget
     * @param wanted Bytes the caller would like to move
     * @param first  First budget (may be nullptr)
     * @param second Second budget (may be nullptr)
     * @return min(wanted, tokens of each budget); the stricter budget wins
     */
    static uint64_t clamp(uint64_t wanted,
                          RateBudget* first,
                          RateBudget* second,
                          Clock::time_point now);

    /**
     * @brief Charge bytes to every non-null budget
     */
    static void consumeAll(uint64_t bytes, RateBudget* first, RateBudget* second);

private:
    uint64_t m_rate;
    uint64_t m_capacity;
    double m_tokens;
    Clock::time_point m_lastRefill;
};

}  // namespace Wharf
