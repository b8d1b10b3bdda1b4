#pragma once
/**
 * @file IrrigationModuleDataModel.h
 * @brief Irrigation runtime data model contribution.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

/** @brief Live and last-completion view of one unit. */
struct IrrigationUnitRuntime {
    uint8_t state = 0;            ///< TaskState
    bool outputOn = false;
    bool faulted = false;
    bool tramlined = false;
    uint8_t lastOutcome = 0;      ///< ActuationOutcome
    uint8_t lastMode = 0;         ///< DeliveryMode
    uint8_t lastStatus = 0;       ///< DeliveryStatus
    uint32_t lastActiveMs = 0;
    uint32_t lastPulses = 0;
    float lastDeliveredMl = 0.0f;
    float lastDeviation = 0.0f;
};

/** @brief Summary of the last planned cycle. */
struct IrrigationPlanRuntime {
    uint32_t cycleId = 0;
    uint32_t pressMs = 0;
    uint8_t count = 0;
    uint8_t accepted = 0;
    uint8_t unitIds[Limits::Irrigation::MaxUnits]{};
    int32_t offsetsMs[Limits::Irrigation::MaxUnits]{};
};

struct IrrigationCountersRuntime {
    uint32_t presses = 0;
    uint32_t bounced = 0;
    uint32_t droppedEdges = 0;    ///< ISR edges lost on a full command queue
    uint32_t conflicts = 0;
    uint32_t lateStarts = 0;
    uint32_t tramlineRejects = 0;
    uint32_t faults = 0;
    uint32_t completed = 0;
    uint32_t flowCeilings = 0;
    uint32_t cancelled = 0;
    uint32_t superseded = 0;
};

struct IrrigationRuntimeData {
    bool running = false;
    bool simulating = false;
    int32_t delayMs = 0;
    uint8_t delaySamples = 0;
    uint16_t tramlineMask = 0;
    IrrigationPlanRuntime plan{};
    IrrigationCountersRuntime counters{};
    IrrigationUnitRuntime units[Limits::Irrigation::MaxUnits]{};
};

// MODULE_DATA_MODEL: IrrigationRuntimeData irrigation
