#pragma once
/**
 * @file IrrigationRuntime.h
 * @brief Irrigation runtime helpers over the DataStore.
 */
#include <string.h>

#include "Core/DataKeys.h"
#include "Core/DataStore/DataStore.h"
#include "Core/EventBus/EventPayloads.h"
#include "Modules/IrrigationModule/IrrigationModuleDataModel.h"

// RUNTIME_PUBLIC

static inline bool sameUnitRuntime(const IrrigationUnitRuntime& a, const IrrigationUnitRuntime& b)
{
    return a.state == b.state &&
           a.outputOn == b.outputOn &&
           a.faulted == b.faulted &&
           a.tramlined == b.tramlined &&
           a.lastOutcome == b.lastOutcome &&
           a.lastMode == b.lastMode &&
           a.lastStatus == b.lastStatus &&
           a.lastActiveMs == b.lastActiveMs &&
           a.lastPulses == b.lastPulses &&
           a.lastDeliveredMl == b.lastDeliveredMl &&
           a.lastDeviation == b.lastDeviation;
}

static inline IrrigationUnitRuntime irrigationUnitRuntime(const DataStore& ds, uint8_t unitId)
{
    if (unitId < 1 || unitId > Limits::Irrigation::MaxUnits) return IrrigationUnitRuntime{};
    return ds.data().irrigation.units[unitId - 1];
}

static inline void setIrrigationUnitRuntime(DataStore& ds, uint8_t unitId, const IrrigationUnitRuntime& v)
{
    if (unitId < 1 || unitId > Limits::Irrigation::MaxUnits) return;
    IrrigationUnitRuntime& cur = ds.dataMutable().irrigation.units[unitId - 1];
    if (sameUnitRuntime(cur, v)) return;

    cur = v;
    ds.notifyChanged((DataKey)(DataKeys::IrrigationUnitBase + unitId - 1), DIRTY_UNITS);
}

static inline void setIrrigationDelay(DataStore& ds, int32_t delayMs, uint8_t samples)
{
    IrrigationRuntimeData& rt = ds.dataMutable().irrigation;
    if (rt.delayMs == delayMs && rt.delaySamples == samples) return;
    rt.delayMs = delayMs;
    rt.delaySamples = samples;
    ds.notifyChanged(DataKeys::IrrigationDelay, DIRTY_IRRIGATION);
}

static inline void setIrrigationRunning(DataStore& ds, bool running, bool simulating)
{
    IrrigationRuntimeData& rt = ds.dataMutable().irrigation;
    if (rt.running == running && rt.simulating == simulating) return;
    rt.running = running;
    rt.simulating = simulating;
    ds.notifyChanged(DataKeys::IrrigationRunning, DIRTY_IRRIGATION);
}

static inline void setIrrigationTramline(DataStore& ds, uint16_t mask)
{
    IrrigationRuntimeData& rt = ds.dataMutable().irrigation;
    if (rt.tramlineMask == mask) return;
    rt.tramlineMask = mask;
    ds.notifyChanged(DataKeys::IrrigationTramline, DIRTY_IRRIGATION);
}

static inline void setIrrigationPlan(DataStore& ds, const IrrigationPlanRuntime& plan)
{
    ds.dataMutable().irrigation.plan = plan;
    ds.notifyChanged(DataKeys::IrrigationPlan, DIRTY_PLAN);
}

static inline void setIrrigationCounters(DataStore& ds, const IrrigationCountersRuntime& c)
{
    // all uint32_t, no padding
    IrrigationCountersRuntime& cur = ds.dataMutable().irrigation.counters;
    if (memcmp(&cur, &c, sizeof(c)) == 0) return;
    cur = c;
    ds.notifyChanged(DataKeys::IrrigationCounters, DIRTY_COUNTERS);
}
