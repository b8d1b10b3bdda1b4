#pragma once
/**
 * @file ActuationManager.h
 * @brief Per-unit actuation slots driven by an explicit millisecond clock.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/IrrigationModule/IrrigationTypes.h"
#include "Modules/IrrigationModule/TramlineSet.h"
#include "Modules/IrrigationModule/Actuation/HardwareIO.h"
#include "Modules/IrrigationModule/Actuation/CancelToken.h"
#include "Modules/IrrigationModule/Actuation/OutputGuard.h"

enum class TaskState : uint8_t {
    Idle = 0,
    Scheduled,
    Active,
    Cancelled
};

enum class ActuationOutcome : uint8_t {
    None = 0,
    Completed,
    FlowCeiling,   ///< flow delivery stopped by the safety ceiling
    Cancelled,     ///< explicit stop
    Superseded,    ///< replaced by a newer cycle
    Tramlined,     ///< unit forced off while scheduled or active
    Fault          ///< assert failed after retries, output left deasserted
};

enum class SubmitResult : uint8_t {
    Accepted = 0,
    Conflict,      ///< slot not idle, entry dropped
    Tramlined,
    InvalidUnit
};

enum class HardwareOp : uint8_t { Assert = 0, Deassert };

enum class BeepKind : uint8_t { Normal = 0, Maintenance };

struct ActuationReport {
    uint8_t unitId = 0;
    ActuationOutcome outcome = ActuationOutcome::None;
    DeliveryMode mode = DeliveryMode::Timed;
    uint32_t activeMs = 0;        ///< time the output was asserted
    uint32_t pulses = 0;          ///< flow mode only
    float targetMl = 0.0f;
    uint32_t targetPulses = 0;    ///< flow mode only
    bool late = false;            ///< start time was already past at submit
};

/** @brief Callbacks invoked from `tick`/`cancel` on the owning task. */
struct ActuationListener {
    void (*onCompleted)(void* ctx, const ActuationReport& report) = nullptr;
    void (*onFault)(void* ctx, uint8_t unitId, HardwareOp op) = nullptr;
    void* ctx = nullptr;
};

struct ActuationStats {
    uint32_t accepted = 0;
    uint32_t conflicts = 0;
    uint32_t lateStarts = 0;
    uint32_t tramlineRejects = 0;
    uint32_t faults = 0;
    uint32_t completed = 0;
    uint32_t flowCeilings = 0;
    uint32_t cancelled = 0;
    uint32_t superseded = 0;
};

static inline const char* taskStateStr(TaskState s)
{
    switch (s) {
    case TaskState::Scheduled: return "scheduled";
    case TaskState::Active: return "active";
    case TaskState::Cancelled: return "cancelled";
    case TaskState::Idle:
    default: return "idle";
    }
}

static inline const char* outcomeStr(ActuationOutcome o)
{
    switch (o) {
    case ActuationOutcome::Completed: return "completed";
    case ActuationOutcome::FlowCeiling: return "flow_ceiling";
    case ActuationOutcome::Cancelled: return "cancelled";
    case ActuationOutcome::Superseded: return "superseded";
    case ActuationOutcome::Tramlined: return "tramlined";
    case ActuationOutcome::Fault: return "fault";
    case ActuationOutcome::None:
    default: return "none";
    }
}

/**
 * @brief Cooperative scheduler of one actuation slot per unit.
 *
 * A slot moves Idle -> Scheduled -> Active -> Idle, or to Cancelled when a
 * cancellation is observed. A slot accepts a new entry only from Idle or
 * Cancelled. Waiting is done by polling from `tick`; no thread per unit.
 *
 * Every asserted output is owned by an OutputGuard. The output is released
 * before the slot leaves Active, whatever the exit path; a failed deassert
 * keeps the slot busy and is retried on each tick.
 *
 * Not thread-safe: all calls come from the irrigation task.
 */
class ActuationManager {
public:
    explicit ActuationManager(HardwareIO& hw) : hw_(hw) {}

    ActuationManager(const ActuationManager&) = delete;
    ActuationManager& operator=(const ActuationManager&) = delete;

    void setListener(const ActuationListener& listener) { listener_ = listener; }
    void setTramlineSet(const TramlineSet* tram) { tram_ = tram; }
    void setFlowCeilingMultiplier(float mult);
    void setBuzzerMute(bool muted, bool hardMute)
    {
        buzzerMuted_ = muted;
        buzzerHardMute_ = hardMute;
    }

    /** @brief Queue one entry. Starts it at once when `startMs` is not in the future. */
    SubmitResult submit(const ScheduleEntry& entry, uint32_t nowMs);

    /**
     * @brief Queue a whole planned cycle.
     * @param supersede Cancel unfinished actuations of the same units first.
     * @return Number of accepted entries.
     */
    uint8_t submitCycle(const CyclePlan& plan, uint32_t nowMs, bool supersede);

    /** @brief Cancel one unit. Returns true if the slot was busy. */
    bool cancel(uint8_t unitId, CancelReason reason, uint32_t nowMs);
    /** @brief Cancel every busy slot. Returns the number of slots affected. */
    uint8_t cancelAll(CancelReason reason, uint32_t nowMs);

    /** @brief Advance every slot and the buzzer to `nowMs`. */
    void tick(uint32_t nowMs);

    /**
     * @brief Drive the buzzer.
     * @param durationMs 0 holds the level until the next call.
     * @return false when muted or the hardware failed.
     */
    bool beep(bool on, uint32_t durationMs, BeepKind kind, uint32_t nowMs);
    bool buzzerOn() const { return buzzer_.armed(); }

    TaskState state(uint8_t unitId) const;
    bool isBusy(uint8_t unitId) const;
    bool faulted(uint8_t unitId) const;
    bool outputAsserted(uint8_t unitId) const;
    /** @brief Pulses credited so far to the running flow delivery. */
    uint32_t pulses(uint8_t unitId) const;
    uint8_t activeCount() const;

    const ActuationStats& stats() const { return stats_; }

private:
    struct Slot {
        TaskState state = TaskState::Idle;
        ScheduleEntry entry{};
        CancelToken token;
        OutputGuard guard;
        uint32_t activeSinceMs = 0;
        uint32_t ceilingMs = 0;
        uint32_t pulses = 0;
        bool late = false;
        bool faulted = false;
        bool releasePending = false;
        uint8_t releaseFailures = 0;
        ActuationOutcome pendingOutcome = ActuationOutcome::None;
    };

    static bool validUnit_(uint8_t unitId);
    Slot* slot_(uint8_t unitId);
    const Slot* slot_(uint8_t unitId) const;
    static bool busy_(const Slot& s);

    void service_(Slot& s, uint32_t nowMs);
    bool activate_(Slot& s, uint32_t nowMs);
    void beginRelease_(Slot& s, ActuationOutcome outcome, uint32_t nowMs);
    void retryRelease_(Slot& s, uint32_t nowMs);
    void finish_(Slot& s, ActuationOutcome outcome, uint32_t nowMs);
    void creditPulses_();
    bool flowSourceInUse_(uint8_t source, const Slot* except) const;
    void serviceBuzzer_(uint32_t nowMs);
    void notifyFault_(uint8_t unitId, HardwareOp op);

    static ActuationOutcome outcomeFor_(CancelReason reason);
    static bool isCancelOutcome_(ActuationOutcome o);

    HardwareIO& hw_;
    const TramlineSet* tram_ = nullptr;
    ActuationListener listener_{};
    ActuationStats stats_{};
    float ceilingMult_ = 3.0f;

    Slot slots_[Limits::Irrigation::MaxUnits];

    OutputGuard buzzer_;
    bool buzzerMuted_ = false;
    bool buzzerHardMute_ = false;
    bool buzzerTimed_ = false;
    uint32_t buzzerOffAtMs_ = 0;
    uint8_t buzzerReleaseFailures_ = 0;
};
