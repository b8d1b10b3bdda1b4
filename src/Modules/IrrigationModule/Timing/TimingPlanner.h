#pragma once
/**
 * @file TimingPlanner.h
 * @brief Deterministic cycle planning: when and how long each unit fires.
 */

#include <stdint.h>
#include "Modules/IrrigationModule/IrrigationTypes.h"

/**
 * @brief Build the schedule of one cycle triggered by a press at `pressMs`.
 *
 * Disabled, tramlined and out-of-range units are skipped. Entries are sorted by
 * (start offset, unit id); the order is informational only, firing follows the
 * absolute start times.
 *
 * @return Number of entries written to `out`.
 */
uint8_t planCycle(const IrrigationSnapshot& snap, uint32_t pressMs, TimingPattern pattern, CyclePlan& out);

/** @brief Pattern base offset for a unit (before momentary and per-unit trims). */
int32_t patternBaseMs(TimingPattern pattern, const UnitConfig& unit, int32_t currentDelayMs, int32_t diagonalStepMs);

/** @brief Offset contributed by the unit's bound momentary switch (0..1000 ms). */
int32_t momentaryOffsetMs(const IrrigationSnapshot& snap, const UnitConfig& unit);

/** @brief Per-unit delay after the diamond clamps (A >= 0, B >= -currentMs). */
int32_t clampedUnitDelayMs(TimingPattern pattern, const UnitConfig& unit, int32_t currentDelayMs);

/** @brief Effective delivery mode (unit override or global default). */
DeliveryMode effectiveDeliveryMode(const IrrigationSnapshot& snap, const UnitConfig& unit);

/** @brief Target volume floored at MinTargetMl and capped at MaxTargetMl (NaN gives the floor). */
float clampTargetMl(float targetMl);

/** @brief Fill duration and mode descriptor of an entry for `targetMl`. */
void fillDelivery(ScheduleEntry& e, const UnitConfig& unit, DeliveryMode mode, float targetMl, bool capPulses);
