#pragma once
/**
 * @file HardwareIO.h
 * @brief Output/pulse capability consumed by the actuation core.
 */

#include <stdint.h>

/**
 * @brief Hardware boundary of the irrigation core.
 *
 * Implemented by the GPIO driver on target and by a fake in host tests.
 * Every call is made from the irrigation task only.
 */
class HardwareIO {
public:
    virtual ~HardwareIO() = default;

    /** @brief Energize the valve output of `unitId` (1..MaxUnits). */
    virtual bool assertOutput(uint8_t unitId) = 0;
    /** @brief De-energize the valve output of `unitId`. */
    virtual bool deassertOutput(uint8_t unitId) = 0;
    virtual bool driveBuzzer(bool on) = 0;
    /** @brief Pulses counted on `sourceId` since the previous call. */
    virtual uint32_t readAndResetPulses(uint8_t sourceId) = 0;
};
