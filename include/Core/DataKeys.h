#pragma once
/**
 * @file DataKeys.h
 * @brief Central registry and reserved ranges for DataStore keys.
 */

#include <stdint.h>

#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"

namespace DataKeys {

/** @brief Irrigation runtime key: current adaptive B delay (`IrrigationRuntime`). */
constexpr DataKey IrrigationDelay = 1;
/** @brief Irrigation runtime key: RUN/STOP state (`IrrigationRuntime`). */
constexpr DataKey IrrigationRunning = 2;
/** @brief Irrigation runtime key: last planned cycle summary (`IrrigationRuntime`). */
constexpr DataKey IrrigationPlan = 3;
/** @brief Irrigation runtime key: conflict/late/drop counters (`IrrigationRuntime`). */
constexpr DataKey IrrigationCounters = 4;
/** @brief Irrigation runtime key: tramline mask (`IrrigationRuntime`). */
constexpr DataKey IrrigationTramline = 5;

/** @brief Reserved base for per-unit runtime keys (`IrrigationRuntime`). */
constexpr DataKey IrrigationUnitBase = 16;
/** @brief Reserved per-unit key count: supports unit indexes `[0..MaxUnits-1]`. */
constexpr uint8_t IrrigationUnitReservedCount = 16;
/** @brief End-exclusive bound for per-unit runtime key range. */
constexpr DataKey IrrigationUnitEndExclusive = IrrigationUnitBase + IrrigationUnitReservedCount;

/** @brief Upper bound for currently reserved keys. */
constexpr DataKey ReservedMax = 63;

static_assert(IrrigationTramline < IrrigationUnitBase, "Irrigation fixed keys overlap unit key range");
static_assert(Limits::Irrigation::MaxUnits <= IrrigationUnitReservedCount, "Unit key range too small");
static_assert(IrrigationUnitEndExclusive <= ReservedMax, "Unit key range exceeds reserved max");

}  // namespace DataKeys
