#pragma once
/**
 * @file FlowCounter.h
 * @brief Flow-meter pulse accumulator shared between an ISR and the irrigation task.
 */

#include <stdint.h>
#include <atomic>

/**
 * @brief Monotonic pulse counter with atomic read-and-reset.
 *
 * `increment` is safe from interrupt context. `readAndReset` is a single
 * atomic exchange, so a pulse landing during the read is counted exactly once,
 * either in this read or in the next one.
 */
class FlowCounter {
public:
    void increment() { count_.fetch_add(1U, std::memory_order_relaxed); }
    void add(uint32_t pulses) { count_.fetch_add(pulses, std::memory_order_relaxed); }

    uint32_t readAndReset() { return count_.exchange(0U, std::memory_order_acq_rel); }
    uint32_t peek() const { return count_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint32_t> count_{0};
};
