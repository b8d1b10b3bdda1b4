#pragma once
/**
 * @file GpioHardwareIO.h
 * @brief ESP32 GPIO implementation of the irrigation hardware boundary.
 */

#include <stdint.h>
#include "Board/BoardLayout.h"
#include "Modules/IrrigationModule/Actuation/HardwareIO.h"
#include "Modules/IrrigationModule/Inputs/FlowCounter.h"

/** @brief Called from interrupt context on a switch falling edge. */
using SwitchEdgeCallback = void (*)(void* ctx, uint8_t switchId, uint32_t tsMs);

/**
 * @brief Unit outputs, buzzer, switch inputs and flow meters on plain GPIO.
 *
 * Output writes are verified by reading the pin level back; a mismatch is
 * reported as a failed assert/deassert. Switch and flow inputs use external
 * pull-ups (GPIO 34..39 have no internal ones) and trigger on falling edges.
 * Single instance: the ISRs reach it through a static pointer.
 */
class GpioHardwareIO : public HardwareIO {
public:
    GpioHardwareIO() = default;

    /** @brief Configure every pin and drive all outputs to their off level. */
    bool begin();
    /** @brief Attach switch and flow interrupts. Call after the edge consumer is ready. */
    bool attachInputs(SwitchEdgeCallback onEdge, void* ctx);

    bool assertOutput(uint8_t unitId) override;
    bool deassertOutput(uint8_t unitId) override;
    bool driveBuzzer(bool on) override;
    uint32_t readAndResetPulses(uint8_t sourceId) override;

private:
    static bool writeVerified_(const UnitOutDef& def, bool on);
    static const UnitOutDef* unitDef_(uint8_t unitId);

    static void onSwitch_(uint8_t switchId);
    static void isrSwitch1_();
    static void isrSwitch2_();
    static void isrSwitch3_();
    static void isrFlow0_();
    static void isrFlow1_();

    static GpioHardwareIO* instance_;

    FlowCounter flow_[Limits::Irrigation::MaxFlowSources];
    SwitchEdgeCallback onEdge_ = nullptr;
    void* edgeCtx_ = nullptr;
    bool begun_ = false;
};
