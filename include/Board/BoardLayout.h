#pragma once

#include <stdint.h>

#include "Board/BoardPinMap.h"
#include "Core/SystemLimits.h"

struct UnitOutDef {
    uint8_t unitId;
    uint8_t pin;
    bool activeHigh;
};

struct DigitalInDef {
    const char* name;
    uint8_t pin;
};

namespace BoardLayout {

constexpr UnitOutDef Units[] = {
    {1, Board::Unit::U1, true},
    {2, Board::Unit::U2, true},
    {3, Board::Unit::U3, true},
    {4, Board::Unit::U4, true},
    {5, Board::Unit::U5, true},
    {6, Board::Unit::U6, true},
    {7, Board::Unit::U7, true},
    {8, Board::Unit::U8, true},
    {9, Board::Unit::U9, true},
    {10, Board::Unit::U10, true},
    {11, Board::Unit::U11, true},
};

/// Switch inputs are indexed by switch id - 1 (M1..M3).
constexpr DigitalInDef Switches[] = {
    {"M1", Board::Switch::M1},
    {"M2", Board::Switch::M2},
    {"M3", Board::Switch::M3},
};

/// Flow inputs are indexed by flow source id.
constexpr DigitalInDef FlowMeters[] = {
    {"flow0", Board::Flow::Meter0},
    {"flow1", Board::Flow::Meter1},
};

constexpr UnitOutDef Buzzer = {0, Board::DO::Buzzer, true};

constexpr uint8_t UnitCount = (uint8_t)(sizeof(Units) / sizeof(Units[0]));
constexpr uint8_t SwitchCount = (uint8_t)(sizeof(Switches) / sizeof(Switches[0]));
constexpr uint8_t FlowMeterCount = (uint8_t)(sizeof(FlowMeters) / sizeof(FlowMeters[0]));

static_assert(UnitCount == Limits::Irrigation::MaxUnits, "Board unit table must cover every unit");
static_assert(SwitchCount == Limits::Irrigation::MaxSwitches, "Board switch table must cover M1..M3");
static_assert(FlowMeterCount == Limits::Irrigation::MaxFlowSources, "Board flow table must cover every source");

}  // namespace BoardLayout
