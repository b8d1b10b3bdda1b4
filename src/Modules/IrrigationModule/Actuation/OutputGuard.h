#pragma once
/**
 * @file OutputGuard.h
 * @brief Scoped ownership of one asserted hardware output.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/IrrigationModule/Actuation/HardwareIO.h"

/**
 * @brief Holds an asserted output and deasserts it on release or destruction.
 *
 * `unitId` 0 designates the buzzer. A failed `release` keeps the guard armed so
 * the caller can retry; destruction of an armed guard retries the deassert up
 * to `HwRetryCount` times.
 */
class OutputGuard {
public:
    static constexpr uint8_t BuzzerId = 0;

    OutputGuard() = default;
    ~OutputGuard() { releaseOnDestroy_(); }

    OutputGuard(const OutputGuard&) = delete;
    OutputGuard& operator=(const OutputGuard&) = delete;

    /** @brief Take ownership of an output that was just asserted. */
    void arm(HardwareIO* hw, uint8_t unitId)
    {
        hw_ = hw;
        unitId_ = unitId;
        armed_ = (hw != nullptr);
    }

    bool armed() const { return armed_; }
    uint8_t unitId() const { return unitId_; }

    /** @brief One deassert attempt. Returns true once the output is released. */
    bool release()
    {
        if (!armed_) return true;
        const bool ok = (unitId_ == BuzzerId) ? hw_->driveBuzzer(false) : hw_->deassertOutput(unitId_);
        if (ok) armed_ = false;
        return ok;
    }

private:
    void releaseOnDestroy_()
    {
        for (uint8_t i = 0; armed_ && i < Limits::Irrigation::HwRetryCount; ++i) {
            (void)release();
        }
    }

    HardwareIO* hw_ = nullptr;
    uint8_t unitId_ = 0;
    bool armed_ = false;
};
