#pragma once
/**
 * @file FakeHardwareIO.h
 * @brief Recording HardwareIO double for host tests.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/IrrigationModule/Actuation/HardwareIO.h"

class FakeHardwareIO : public HardwareIO {
public:
    bool assertOutput(uint8_t unitId) override
    {
        ++assertCalls;
        if (assertFailuresLeft > 0) {
            --assertFailuresLeft;
            return false;
        }
        if (unitId <= Limits::Irrigation::MaxUnits) {
            on[unitId] = true;
            ++asserts[unitId];
        }
        return true;
    }

    bool deassertOutput(uint8_t unitId) override
    {
        ++deassertCalls;
        if (deassertFailuresLeft > 0) {
            --deassertFailuresLeft;
            return false;
        }
        if (unitId <= Limits::Irrigation::MaxUnits) {
            if (on[unitId]) ++deasserts[unitId];
            on[unitId] = false;
        }
        return true;
    }

    bool driveBuzzer(bool level) override
    {
        if (level && buzzerFailuresLeft > 0) {
            --buzzerFailuresLeft;
            return false;
        }
        if (level && !buzzer) ++buzzerOnCount;
        buzzer = level;
        return true;
    }

    uint32_t readAndResetPulses(uint8_t sourceId) override
    {
        if (sourceId >= Limits::Irrigation::MaxFlowSources) return 0;
        const uint32_t n = pulses[sourceId];
        pulses[sourceId] = 0;
        ++pulseReads[sourceId];
        return n;
    }

    /// index 0 unused for outputs
    bool on[Limits::Irrigation::MaxUnits + 1]{};
    uint32_t asserts[Limits::Irrigation::MaxUnits + 1]{};
    uint32_t deasserts[Limits::Irrigation::MaxUnits + 1]{};
    uint32_t assertCalls = 0;
    uint32_t deassertCalls = 0;
    uint8_t assertFailuresLeft = 0;
    uint8_t deassertFailuresLeft = 0;

    bool buzzer = false;
    uint32_t buzzerOnCount = 0;
    uint8_t buzzerFailuresLeft = 0;

    uint32_t pulses[Limits::Irrigation::MaxFlowSources]{};
    uint32_t pulseReads[Limits::Irrigation::MaxFlowSources]{};
};
