/**
 * @file DelayEstimator.cpp
 * @brief Implementation file.
 */

#include "Modules/IrrigationModule/Timing/DelayEstimator.h"
#include <math.h>

static int32_t clampNonNegative_(int64_t v)
{
    if (v < 0) return 0;
    if (v > INT32_MAX) return INT32_MAX;
    return (int32_t)v;
}

int32_t DelayEstimator::computeWithCount_(const AutoDelayConfig& cfg, const PressHistory& history,
                                          uint32_t nowMs, uint8_t& samplesOut) const
{
    samplesOut = 0;
    const int64_t fallback = (int64_t)cfg.manualMs + (int64_t)cfg.geomLeadMs;
    if (!cfg.enabled) return clampNonNegative_(fallback);

    /// presses strictly inside the trailing window, oldest first
    bool haveFirst = false;
    uint32_t first = 0;
    uint32_t last = 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < history.count(); ++i) {
        const uint32_t ts = history.at(i);
        const uint32_t age = nowMs - ts;
        if ((int32_t)age < 0 || age >= history.windowMs()) continue;
        if (!haveFirst) {
            first = ts;
            haveFirst = true;
        }
        last = ts;
        ++n;
    }
    samplesOut = n;

    if (n < minSamples_) return clampNonNegative_(fallback);

    /// sum of consecutive intervals telescopes to last - first
    const double meanInterval = (double)(uint32_t)(last - first) / (double)(n - 1);
    const int64_t half = (int64_t)lround(meanInterval / 2.0);
    return clampNonNegative_(half + (int64_t)cfg.geomLeadMs);
}

int32_t DelayEstimator::compute(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs) const
{
    uint8_t samples = 0;
    return computeWithCount_(cfg, history, nowMs, samples);
}

bool DelayEstimator::update(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs)
{
    const int32_t next = computeWithCount_(cfg, history, nowMs, lastSamples_);
    if (next == currentMs_) return false;
    currentMs_ = next;
    return true;
}

bool DelayEstimator::tick(const AutoDelayConfig& cfg, const PressHistory& history, uint32_t nowMs)
{
    if (ticked_ && tickMs_ > 0 && (uint32_t)(nowMs - lastTickMs_) < tickMs_) return false;
    ticked_ = true;
    lastTickMs_ = nowMs;
    return update(cfg, history, nowMs);
}
