#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // DataStore (runtime model changes)
    DataChanged = 50,
    DataSnapshotAvailable = 51,

    // Configuration
    ConfigChanged = 100,

    // Irrigation core
    PressAccepted = 400,
    DelayChanged = 401,
    CycleScheduled = 402,
    UnitActuationCompleted = 403,
    UnitFault = 404,
    TramlineChanged = 405,
    RunningChanged = 406,
};
