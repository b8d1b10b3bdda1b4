/**
 * @file TimingPlanner.cpp
 * @brief Implementation file.
 */

#include "Modules/IrrigationModule/Timing/TimingPlanner.h"
#include "Domain/IrrigationDefaults.h"
#include <math.h>
#include <stdint.h>

static int32_t maxI32_(int32_t a, int32_t b) { return (a > b) ? a : b; }

static int32_t clampI32_(int32_t v, int32_t lo, int32_t hi)
{
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

static int32_t saturateI32_(int64_t v)
{
    if (v > INT32_MAX) return INT32_MAX;
    if (v < INT32_MIN) return INT32_MIN;
    return (int32_t)v;
}

float clampTargetMl(float targetMl)
{
    /// NaN fails every comparison, so it lands on the floor as well
    if (!(targetMl >= IrrigationDefaults::MinTargetMl)) return IrrigationDefaults::MinTargetMl;
    if (targetMl > IrrigationDefaults::MaxTargetMl) return IrrigationDefaults::MaxTargetMl;
    return targetMl;
}

static bool entryBefore_(const ScheduleEntry& a, const ScheduleEntry& b)
{
    if (a.offsetMs != b.offsetMs) return a.offsetMs < b.offsetMs;
    return a.unitId < b.unitId;
}

int32_t patternBaseMs(TimingPattern pattern, const UnitConfig& unit, int32_t currentDelayMs, int32_t diagonalStepMs)
{
    switch (pattern) {
    case TimingPattern::Diamond:
        if (unit.group == (uint8_t)UnitGroup::B) return maxI32_(0, currentDelayMs);
        return 0;
    case TimingPattern::Diagonal:
        return ((int32_t)unit.id - 1) * clampI32_(diagonalStepMs, 0, IrrigationDefaults::MaxDiagonalStepMs);
    case TimingPattern::Line:
    default:
        return 0;
    }
}

int32_t momentaryOffsetMs(const IrrigationSnapshot& snap, const UnitConfig& unit)
{
    if (unit.momentary == MOMENTARY_NONE) return 0;
    if (unit.momentary > Limits::Irrigation::MaxSwitches) return 0;
    const MomentaryConfig& m = snap.momentary[unit.momentary - 1];
    if (!m.enabled) return 0;
    const int32_t pct = (m.offsetPct > 100) ? 100 : (int32_t)m.offsetPct;
    return pct * 10;
}

int32_t clampedUnitDelayMs(TimingPattern pattern, const UnitConfig& unit, int32_t currentDelayMs)
{
    int32_t per = clampI32_(unit.perDelayMs, -IrrigationDefaults::MaxUnitDelayMs, IrrigationDefaults::MaxUnitDelayMs);
    if (pattern != TimingPattern::Diamond) return per;

    if (unit.group == (uint8_t)UnitGroup::B) {
        const int32_t minNeg = -maxI32_(0, currentDelayMs);
        if (per < minNeg) per = minNeg;
    } else {
        if (per < 0) per = 0;
    }
    return per;
}

DeliveryMode effectiveDeliveryMode(const IrrigationSnapshot& snap, const UnitConfig& unit)
{
    if (unit.mode == (uint8_t)UnitDeliveryMode::Flow) return DeliveryMode::Flow;
    if (unit.mode == (uint8_t)UnitDeliveryMode::Timed) return DeliveryMode::Timed;
    return (snap.deliveryMode == (uint8_t)DeliveryMode::Timed) ? DeliveryMode::Timed : DeliveryMode::Flow;
}

void fillDelivery(ScheduleEntry& e, const UnitConfig& unit, DeliveryMode mode, float targetMl, bool capPulses)
{
    const float target = clampTargetMl(targetMl);
    float msPerMl = (unit.msPerMl >= IrrigationDefaults::MinMsPerMl) ? unit.msPerMl : IrrigationDefaults::MinMsPerMl;
    if (msPerMl > IrrigationDefaults::MaxMsPerMl) msPerMl = IrrigationDefaults::MaxMsPerMl;

    e.mode = mode;
    if (mode == DeliveryMode::Timed) {
        e.hasDuration = true;
        e.durationMs = (uint32_t)lround((double)target * (double)msPerMl);
        e.desc.timed.msPerMl = msPerMl;
        e.desc.timed.targetMl = target;
        return;
    }

    const int32_t ppc = (unit.pulsesPerCycle < 1) ? 1 : unit.pulsesPerCycle;
    const int32_t kFactor = clampI32_(unit.pulsesPerLiter, 1, IrrigationDefaults::MaxPulsesPerLiter);

    long pulses = lround((double)target * (double)kFactor / 1000.0);
    if (capPulses && pulses > ppc) pulses = ppc;
    if (pulses < 1) pulses = 1;

    e.hasDuration = false;
    e.durationMs = 0;
    e.desc.flow.targetPulses = (uint32_t)pulses;
    e.desc.flow.targetMl = target;
    e.desc.flow.msPerPulse = msPerMl * 1000.0f / (float)kFactor;
    e.desc.flow.source = (unit.flowSource < Limits::Irrigation::MaxFlowSources) ? unit.flowSource : 0;
}

uint8_t planCycle(const IrrigationSnapshot& snap, uint32_t pressMs, TimingPattern pattern, CyclePlan& out)
{
    out.pressMs = pressMs;
    out.count = 0;

    const int32_t currentMs = clampI32_(snap.autoDelay.currentMs, 0, IrrigationDefaults::MaxAutoDelayMs);
    const uint8_t unitCount = (snap.unitCount > Limits::Irrigation::MaxUnits)
        ? Limits::Irrigation::MaxUnits : snap.unitCount;

    for (uint8_t i = 0; i < unitCount; ++i) {
        const UnitConfig& u = snap.units[i];
        if (!u.enabled) continue;
        if (u.id < 1 || u.id > Limits::Irrigation::MaxUnits) continue;
        if (snap.tramlineMask & (uint16_t)(1u << (u.id - 1))) continue;

        ScheduleEntry e{};
        e.unitId = u.id;
        const int64_t offset = (int64_t)patternBaseMs(pattern, u, currentMs, snap.diagonalStepMs)
                             + (int64_t)momentaryOffsetMs(snap, u)
                             + (int64_t)clampedUnitDelayMs(pattern, u, currentMs);
        e.offsetMs = saturateI32_(offset);
        e.startMs = pressMs + (uint32_t)e.offsetMs;
        fillDelivery(e, u, effectiveDeliveryMode(snap, u), snap.targetMl, true);

        /// insertion keeps the list ordered by (offset, id)
        uint8_t pos = out.count;
        while (pos > 0 && entryBefore_(e, out.entries[pos - 1])) {
            out.entries[pos] = out.entries[pos - 1];
            --pos;
        }
        out.entries[pos] = e;
        ++out.count;
    }

    return out.count;
}
