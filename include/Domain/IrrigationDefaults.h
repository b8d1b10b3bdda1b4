#pragma once
/**
 * @file IrrigationDefaults.h
 * @brief Factory values of the irrigation settings.
 */

#include <stdint.h>

namespace IrrigationDefaults {

constexpr uint8_t EnabledUnitCount = 4;
constexpr uint8_t DefaultMomentary = 1;
constexpr int32_t PulsesPerCycle = 100;
constexpr int32_t PulsesPerLiter = 450;
constexpr float MsPerMl = 5.0f;

constexpr float TargetMl = 100.0f;
constexpr float CalibrationFlowTargetMl = 1000.0f;
constexpr uint32_t CalibrationTimedMs = 5000;
constexpr uint32_t CalibrationMaxMs = 600000;

constexpr bool AutoDelayEnabled = true;
constexpr int32_t ManualDelayMs = 500;
constexpr int32_t GeomLeadMs = 0;
constexpr uint32_t EstimatorTickMs = 500;

constexpr uint32_t PressWindowMs = 15000;
constexpr uint8_t PressMinSamples = 3;
constexpr uint32_t HardwareDebounceMs = 10;
constexpr uint32_t SimulatedReleaseMs = 50;

constexpr int32_t DiagonalStepMs = 80;
constexpr float FlowCeilingMultiplier = 3.0f;

constexpr uint32_t SimPressMinIntervalMs = 1000;
constexpr uint32_t SimPressMaxIntervalMs = 1500;

constexpr uint32_t MaintenanceBeepMs = 300;

constexpr float MinTargetMl = 1.0f;
constexpr float MinMsPerMl = 0.1f;

/// Accepted ranges of planner inputs, wider values are clamped
constexpr float MaxTargetMl = 100000.0f;
constexpr float MaxMsPerMl = 1000.0f;
constexpr int32_t MaxDiagonalStepMs = 60000;
constexpr int32_t MaxUnitDelayMs = 60000;
constexpr int32_t MaxAutoDelayMs = 60000;
constexpr int32_t MaxPulsesPerLiter = 100000;
constexpr float DeviationOkPct = 0.05f;
constexpr float DeviationWarnPct = 0.10f;
constexpr float DeviationInspectPct = 0.15f;

}  // namespace IrrigationDefaults
