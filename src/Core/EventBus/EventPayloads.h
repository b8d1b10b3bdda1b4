#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char module[16];
    char nvsKey[16];
};

/** @brief Payload for PressAccepted events. */
struct PressAcceptedPayload {
    uint8_t switchId;   ///< 1..3
    uint8_t simulated;  ///< 0/1
    uint32_t tsMs;
};

/** @brief Payload for DelayChanged events. */
struct DelayChangedPayload {
    int32_t currentMs;
    uint8_t samples;    ///< presses used, 0 when the fallback applied
};

/**
 * @brief Payload for CycleScheduled events.
 *
 * Summary only; the full plan is published in the DataStore.
 */
struct CycleScheduledPayload {
    uint32_t cycleId;
    uint32_t pressMs;
    uint8_t count;
    uint8_t accepted;
    int32_t firstOffsetMs;
    int32_t lastOffsetMs;
};

/** @brief Payload for UnitActuationCompleted events. */
struct UnitActuationPayload {
    uint8_t unitId;
    uint8_t outcome;    ///< ActuationOutcome
    uint8_t mode;       ///< DeliveryMode
    uint8_t status;     ///< DeliveryStatus
    uint32_t activeMs;
    uint32_t pulses;
};

/** @brief Payload for UnitFault events (unitId 0 = buzzer). */
struct UnitFaultPayload {
    uint8_t unitId;
    uint8_t op;         ///< HardwareOp
};

/** @brief Payload for TramlineChanged events. */
struct TramlineChangedPayload {
    uint8_t unitId;
    uint8_t off;        ///< 0/1
    uint16_t mask;      ///< whole set after the change
};

/** @brief Payload for RunningChanged events. */
struct RunningChangedPayload {
    uint8_t running;    ///< 0/1
};

/** @brief Identifiers for DataStore values. */
using DataKey = uint16_t;

/** @brief Payload for data change events. */
struct DataChangedPayload {
    DataKey id;
};

/** @brief Dirty flags for snapshot payloads. */
enum DirtyFlags : uint32_t {
    DIRTY_NONE       = 0,
    DIRTY_IRRIGATION = 1 << 0,
    DIRTY_UNITS      = 1 << 1,
    DIRTY_PLAN       = 1 << 2,
    DIRTY_COUNTERS   = 1 << 3,
};

/** @brief Payload indicating a new data snapshot. */
struct DataSnapshotPayload {
    uint32_t dirtyFlags;
};
