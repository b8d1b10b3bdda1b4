#pragma once
/**
 * @file DelayEstimator.h
 * @brief Adaptive group-B delay derived from recent press cadence.
 */

#include <stdint.h>
#include "Modules/IrrigationModule/IrrigationTypes.h"
#include "Modules/IrrigationModule/Inputs/PressTracker.h"

/**
 * @brief Periodic estimator of the diamond B delay.
 *
 * Disabled: `max(0, manual + geom)`.
 * Enabled: half the mean interval between the presses inside the window,
 * plus `geom`; with fewer than `minSamples` presses it falls back to
 * `manual + geom`. The result is never negative.
 */
class DelayEstimator {
public:
    /** @brief Period between recomputations (0 disables the periodic gate). */
    void setTickMs(uint32_t tickMs) { tickMs_ = tickMs; }
    void setMinSamples(uint8_t n) { minSamples_ = (n < 2) ? 2 : n; }
    /** @brief Seed the published value (boot value, no change notification). */
    void setCurrentMs(int32_t currentMs) { currentMs_ = (currentMs < 0) ? 0 : currentMs; }

    int32_t currentMs() const { return currentMs_; }
    uint8_t lastSampleCount() const { return lastSamples_; }

    /** @brief Pure computation, no state change. */
    int32_t compute(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs) const;

    /**
     * @brief Recompute now and store the result.
     * @return true only when the value differs from the previous one.
     */
    bool update(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs);

    /** @brief `update` gated by the tick period. */
    bool tick(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs);

private:
    int32_t computeWithCount_(const AutoDelayConfig& cfg, const PressHistory& history,
                              uint32_t nowMs, uint8_t& samplesOut) const;

    uint32_t tickMs_ = 500;
    uint32_t lastTickMs_ = 0;
    bool ticked_ = false;
    uint8_t minSamples_ = 3;
    uint8_t lastSamples_ = 0;
    int32_t currentMs_ = 500;
};
