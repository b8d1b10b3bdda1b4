#pragma once
/**
 * @file IrrigationTypes.h
 * @brief Settings and schedule types shared by the irrigation core.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

enum class UnitGroup : uint8_t { A = 0, B = 1 };
enum class DeliveryMode : uint8_t { Flow = 0, Timed = 1 };
enum class UnitDeliveryMode : uint8_t { Inherit = 0, Flow = 1, Timed = 2 };
enum class TimingPattern : uint8_t { Diamond = 0, Diagonal = 1, Line = 2 };

/** @brief Unit not bound to any momentary switch. */
constexpr uint8_t MOMENTARY_NONE = 0;

/**
 * @brief Per-unit settings.
 *
 * Fields keep the raw ConfigStore storage types; the planner clamps
 * out-of-range values when it reads them.
 */
struct UnitConfig {
    uint8_t id = 0;                       ///< 1..MaxUnits
    bool enabled = false;
    uint8_t group = (uint8_t)UnitGroup::A;
    uint8_t momentary = MOMENTARY_NONE;   ///< 0 none, 1..3 = M1..M3
    uint8_t legacyOffsetPct = 0;          ///< kept for export only
    int32_t perDelayMs = 0;
    uint8_t mode = (uint8_t)UnitDeliveryMode::Inherit;
    int32_t pulsesPerCycle = 100;
    int32_t pulsesPerLiter = 450;
    float msPerMl = 5.0f;
    uint8_t flowSource = 0;
};

struct MomentaryConfig {
    bool enabled = false;
    uint8_t offsetPct = 0;                ///< 0..100 mapped to 0..1000 ms
};

struct AutoDelayConfig {
    bool enabled = true;
    int32_t manualMs = 500;
    int32_t geomLeadMs = 0;
    int32_t currentMs = 500;              ///< written by DelayEstimator only
};

/**
 * @brief Consistent view of everything one planning pass reads.
 *
 * Copied out of the settings storage under the ConfigStore lock; never
 * mutated while a pass runs.
 */
struct IrrigationSnapshot {
    UnitConfig units[Limits::Irrigation::MaxUnits];
    uint8_t unitCount = Limits::Irrigation::MaxUnits;
    MomentaryConfig momentary[Limits::Irrigation::MaxSwitches];
    AutoDelayConfig autoDelay{};
    float targetMl = 100.0f;
    uint8_t deliveryMode = (uint8_t)DeliveryMode::Flow;
    uint8_t pattern = (uint8_t)TimingPattern::Diamond;
    int32_t diagonalStepMs = 80;
    uint16_t tramlineMask = 0;            ///< bit (id - 1) set = unit forced off
};

/** @brief True if `switchId` names a switch (1..MaxSwitches) whose config is enabled. */
static inline bool momentaryEnabled(const MomentaryConfig* configs, uint8_t switchId)
{
    if (!configs || switchId < 1 || switchId > Limits::Irrigation::MaxSwitches) return false;
    return configs[switchId - 1].enabled;
}

/** @brief Timed delivery descriptor. */
struct TimedDesc {
    float msPerMl;
    float targetMl;
};

/** @brief Flow delivery descriptor. */
struct FlowDesc {
    uint32_t targetPulses;
    float targetMl;
    float msPerPulse;                     ///< nominal, used for the safety ceiling
    uint8_t source;
};

/** @brief One unit's firing instruction for a cycle. */
struct ScheduleEntry {
    uint8_t unitId = 0;
    uint32_t startMs = 0;                 ///< absolute, millis() time base
    int32_t offsetMs = 0;                 ///< startMs - press time
    bool hasDuration = false;
    uint32_t durationMs = 0;
    DeliveryMode mode = DeliveryMode::Timed;
    union {
        TimedDesc timed;
        FlowDesc flow;
    } desc;
};

/** @brief Planner output, ordered by (offset, unit id). */
struct CyclePlan {
    uint32_t pressMs = 0;
    uint8_t count = 0;
    ScheduleEntry entries[Limits::Irrigation::MaxUnits];
};

static inline const char* deliveryModeStr(DeliveryMode m)
{
    return (m == DeliveryMode::Timed) ? "timed" : "flow";
}

static inline const char* patternStr(TimingPattern p)
{
    if (p == TimingPattern::Diagonal) return "diagonal";
    if (p == TimingPattern::Line) return "line";
    return "diamond";
}
