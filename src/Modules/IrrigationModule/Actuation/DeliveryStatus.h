#pragma once
/**
 * @file DeliveryStatus.h
 * @brief Classification of a finished delivery against its target volume.
 */

#include <stdint.h>
#include <math.h>
#include "Domain/IrrigationDefaults.h"
#include "Modules/IrrigationModule/Actuation/ActuationManager.h"

enum class DeliveryStatus : uint8_t { Ok = 0, Warn, Inspect, Blocked };

static inline const char* deliveryStatusStr(DeliveryStatus s)
{
    switch (s) {
    case DeliveryStatus::Ok: return "OK";
    case DeliveryStatus::Warn: return "WARN";
    case DeliveryStatus::Inspect: return "INSPECT";
    case DeliveryStatus::Blocked:
    default: return "BLOCKED";
    }
}

/** @brief Volume in ml for `pulses` at `pulsesPerLiter` (K-factor, floored at 1). */
static inline float estimateDeliveredMl(uint32_t pulses, int32_t pulsesPerLiter)
{
    const int32_t k = (pulsesPerLiter < 1) ? 1 : pulsesPerLiter;
    return (float)((double)pulses * 1000.0 / (double)k);
}

/** @brief Relative deviation `(delivered - target) / target`, 0 for a zero target. */
static inline float deliveryDeviation(float deliveredMl, float targetMl)
{
    if (!(targetMl > 0.0f)) return 0.0f;
    return (deliveredMl - targetMl) / targetMl;
}

static inline DeliveryStatus classifyDeviation(float deviation)
{
    const float a = fabsf(deviation);
    if (a <= IrrigationDefaults::DeviationOkPct) return DeliveryStatus::Ok;
    if (a <= IrrigationDefaults::DeviationWarnPct) return DeliveryStatus::Warn;
    if (a <= IrrigationDefaults::DeviationInspectPct) return DeliveryStatus::Inspect;
    return DeliveryStatus::Blocked;
}

struct DeliveryAssessment {
    float deliveredMl = 0.0f;
    float deviation = 0.0f;
    DeliveryStatus status = DeliveryStatus::Blocked;
};

/**
 * @brief Assess a finished actuation.
 *
 * Flow: estimate from pulses and classify. Timed completion: target assumed
 * delivered. Anything that did not complete is BLOCKED.
 */
static inline DeliveryAssessment assessDelivery(const ActuationReport& r, int32_t pulsesPerLiter)
{
    DeliveryAssessment a;
    const bool finished = (r.outcome == ActuationOutcome::Completed) ||
                          (r.outcome == ActuationOutcome::FlowCeiling);

    if (r.mode == DeliveryMode::Flow) {
        a.deliveredMl = estimateDeliveredMl(r.pulses, pulsesPerLiter);
        a.deviation = deliveryDeviation(a.deliveredMl, r.targetMl);
        a.status = finished ? classifyDeviation(a.deviation) : DeliveryStatus::Blocked;
        return a;
    }

    if (r.outcome == ActuationOutcome::Completed) {
        a.deliveredMl = r.targetMl;
        a.deviation = 0.0f;
        a.status = DeliveryStatus::Ok;
    }
    return a;
}
