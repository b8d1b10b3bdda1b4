#pragma once
/**
 * @file CancelToken.h
 * @brief Cooperative cancellation flag polled by an actuation slot.
 */

#include <stdint.h>
#include <atomic>

enum class CancelReason : uint8_t {
    None = 0,
    Stop,
    Tramline,
    Superseded
};

/**
 * @brief Cancellation signal for one actuation slot.
 *
 * Raised from command handling, observed at the slot's next tick. The first
 * reason raised wins until `reset`.
 */
class CancelToken {
public:
    void reset()
    {
        reason_.store((uint8_t)CancelReason::None, std::memory_order_relaxed);
        flag_.store(false, std::memory_order_release);
    }

    void cancel(CancelReason reason)
    {
        uint8_t expected = (uint8_t)CancelReason::None;
        (void)reason_.compare_exchange_strong(expected, (uint8_t)reason, std::memory_order_relaxed);
        flag_.store(true, std::memory_order_release);
    }

    bool cancelled() const { return flag_.load(std::memory_order_acquire); }
    CancelReason reason() const { return (CancelReason)reason_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
    std::atomic<uint8_t> reason_{(uint8_t)CancelReason::None};
};
