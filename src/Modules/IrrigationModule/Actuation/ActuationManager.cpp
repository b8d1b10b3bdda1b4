/**
 * @file ActuationManager.cpp
 * @brief Implementation file.
 */

#include "Modules/IrrigationModule/Actuation/ActuationManager.h"
#include <math.h>

static bool reached_(uint32_t nowMs, uint32_t atMs)
{
    return (int32_t)(nowMs - atMs) >= 0;
}

bool ActuationManager::validUnit_(uint8_t unitId)
{
    return unitId >= 1 && unitId <= Limits::Irrigation::MaxUnits;
}

ActuationManager::Slot* ActuationManager::slot_(uint8_t unitId)
{
    return validUnit_(unitId) ? &slots_[unitId - 1] : nullptr;
}

const ActuationManager::Slot* ActuationManager::slot_(uint8_t unitId) const
{
    return validUnit_(unitId) ? &slots_[unitId - 1] : nullptr;
}

bool ActuationManager::busy_(const Slot& s)
{
    return s.state == TaskState::Scheduled || s.state == TaskState::Active || s.releasePending;
}

ActuationOutcome ActuationManager::outcomeFor_(CancelReason reason)
{
    switch (reason) {
    case CancelReason::Tramline: return ActuationOutcome::Tramlined;
    case CancelReason::Superseded: return ActuationOutcome::Superseded;
    case CancelReason::Stop:
    case CancelReason::None:
    default: return ActuationOutcome::Cancelled;
    }
}

bool ActuationManager::isCancelOutcome_(ActuationOutcome o)
{
    return o == ActuationOutcome::Cancelled ||
           o == ActuationOutcome::Superseded ||
           o == ActuationOutcome::Tramlined;
}

void ActuationManager::setFlowCeilingMultiplier(float mult)
{
    /// below 1.0 the ceiling would cut a healthy delivery short
    ceilingMult_ = (mult >= 1.0f) ? mult : 1.0f;
}

SubmitResult ActuationManager::submit(const ScheduleEntry& entry, uint32_t nowMs)
{
    Slot* s = slot_(entry.unitId);
    if (!s) return SubmitResult::InvalidUnit;

    if (tram_ && tram_->contains(entry.unitId)) {
        ++stats_.tramlineRejects;
        return SubmitResult::Tramlined;
    }
    if (busy_(*s)) {
        ++stats_.conflicts;
        return SubmitResult::Conflict;
    }

    s->state = TaskState::Scheduled;
    s->entry = entry;
    s->token.reset();
    s->pulses = 0;
    s->activeSinceMs = 0;
    s->ceilingMs = 0;
    s->releaseFailures = 0;
    s->pendingOutcome = ActuationOutcome::None;
    s->late = ((int32_t)(entry.startMs - nowMs) < 0);
    if (s->late) ++stats_.lateStarts;
    ++stats_.accepted;

    service_(*s, nowMs);
    return SubmitResult::Accepted;
}

uint8_t ActuationManager::submitCycle(const CyclePlan& plan, uint32_t nowMs, bool supersede)
{
    uint8_t accepted = 0;
    for (uint8_t i = 0; i < plan.count && i < Limits::Irrigation::MaxUnits; ++i) {
        const ScheduleEntry& e = plan.entries[i];
        if (supersede) (void)cancel(e.unitId, CancelReason::Superseded, nowMs);
        if (submit(e, nowMs) == SubmitResult::Accepted) ++accepted;
    }
    return accepted;
}

bool ActuationManager::cancel(uint8_t unitId, CancelReason reason, uint32_t nowMs)
{
    Slot* s = slot_(unitId);
    if (!s) return false;
    if (s->state != TaskState::Scheduled && s->state != TaskState::Active) return false;

    s->token.cancel(reason);
    service_(*s, nowMs);
    return true;
}

uint8_t ActuationManager::cancelAll(CancelReason reason, uint32_t nowMs)
{
    uint8_t n = 0;
    for (uint8_t id = 1; id <= Limits::Irrigation::MaxUnits; ++id) {
        if (cancel(id, reason, nowMs)) ++n;
    }
    return n;
}

void ActuationManager::tick(uint32_t nowMs)
{
    creditPulses_();
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        service_(slots_[i], nowMs);
    }
    serviceBuzzer_(nowMs);
}

bool ActuationManager::flowSourceInUse_(uint8_t source, const Slot* except) const
{
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        const Slot& s = slots_[i];
        if (&s == except) continue;
        if (s.state != TaskState::Active || s.releasePending) continue;
        if (s.entry.mode != DeliveryMode::Flow) continue;
        if (s.entry.desc.flow.source == source) return true;
    }
    return false;
}

void ActuationManager::creditPulses_()
{
    for (uint8_t src = 0; src < Limits::Irrigation::MaxFlowSources; ++src) {
        if (!flowSourceInUse_(src, nullptr)) continue;

        /// one read per source per tick, credited to every unit sharing it
        const uint32_t n = hw_.readAndResetPulses(src);
        if (n == 0) continue;
        for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
            Slot& s = slots_[i];
            if (s.state != TaskState::Active || s.releasePending) continue;
            if (s.entry.mode != DeliveryMode::Flow) continue;
            if (s.entry.desc.flow.source != src) continue;
            s.pulses += n;
        }
    }
}

void ActuationManager::service_(Slot& s, uint32_t nowMs)
{
    if (s.releasePending) {
        retryRelease_(s, nowMs);
        return;
    }

    if (s.state == TaskState::Scheduled) {
        if (s.token.cancelled()) {
            finish_(s, outcomeFor_(s.token.reason()), nowMs);
            return;
        }
        if (tram_ && tram_->contains(s.entry.unitId)) {
            finish_(s, ActuationOutcome::Tramlined, nowMs);
            return;
        }
        if (!reached_(nowMs, s.entry.startMs)) return;
        if (!activate_(s, nowMs)) return;
    }

    if (s.state != TaskState::Active) return;

    if (s.token.cancelled()) {
        beginRelease_(s, outcomeFor_(s.token.reason()), nowMs);
        return;
    }
    if (tram_ && tram_->contains(s.entry.unitId)) {
        beginRelease_(s, ActuationOutcome::Tramlined, nowMs);
        return;
    }

    const uint32_t elapsed = nowMs - s.activeSinceMs;
    if (s.entry.mode == DeliveryMode::Timed) {
        if (elapsed >= s.entry.durationMs) beginRelease_(s, ActuationOutcome::Completed, nowMs);
        return;
    }

    if (s.pulses >= s.entry.desc.flow.targetPulses) {
        beginRelease_(s, ActuationOutcome::Completed, nowMs);
    } else if (elapsed >= s.ceilingMs) {
        beginRelease_(s, ActuationOutcome::FlowCeiling, nowMs);
    }
}

bool ActuationManager::activate_(Slot& s, uint32_t nowMs)
{
    const uint8_t id = s.entry.unitId;
    bool ok = false;
    for (uint8_t attempt = 0; attempt < Limits::Irrigation::HwRetryCount; ++attempt) {
        if (hw_.assertOutput(id)) {
            ok = true;
            break;
        }
        /// a half-driven output must not stay energized between attempts
        (void)hw_.deassertOutput(id);
    }

    if (!ok) {
        s.faulted = true;
        ++stats_.faults;
        notifyFault_(id, HardwareOp::Assert);
        finish_(s, ActuationOutcome::Fault, nowMs);
        return false;
    }

    /// stale pulses from before this delivery belong to nobody
    if (s.entry.mode == DeliveryMode::Flow && !flowSourceInUse_(s.entry.desc.flow.source, &s)) {
        (void)hw_.readAndResetPulses(s.entry.desc.flow.source);
    }

    s.guard.arm(&hw_, id);
    s.state = TaskState::Active;
    s.faulted = false;
    s.activeSinceMs = nowMs;
    s.pulses = 0;

    if (s.entry.mode == DeliveryMode::Flow) {
        const double nominal = (double)s.entry.desc.flow.targetPulses *
                               (double)s.entry.desc.flow.msPerPulse *
                               (double)ceilingMult_;
        const long rounded = lround(nominal);
        s.ceilingMs = (rounded > (long)Limits::Irrigation::FlowCeilingMinMs)
                          ? (uint32_t)rounded
                          : Limits::Irrigation::FlowCeilingMinMs;
    }
    return true;
}

void ActuationManager::beginRelease_(Slot& s, ActuationOutcome outcome, uint32_t nowMs)
{
    s.pendingOutcome = outcome;
    s.releasePending = true;
    s.releaseFailures = 0;
    retryRelease_(s, nowMs);
}

void ActuationManager::retryRelease_(Slot& s, uint32_t nowMs)
{
    if (s.guard.release()) {
        s.releasePending = false;
        finish_(s, s.pendingOutcome, nowMs);
        return;
    }

    if (s.releaseFailures < 0xFF) ++s.releaseFailures;
    if (s.releaseFailures == Limits::Irrigation::HwRetryCount) {
        s.faulted = true;
        ++stats_.faults;
        notifyFault_(s.entry.unitId, HardwareOp::Deassert);
    }
}

void ActuationManager::finish_(Slot& s, ActuationOutcome outcome, uint32_t nowMs)
{
    ActuationReport r;
    r.unitId = s.entry.unitId;
    r.outcome = outcome;
    r.mode = s.entry.mode;
    r.late = s.late;
    if (s.state == TaskState::Active) {
        r.activeMs = nowMs - s.activeSinceMs;
    }
    if (s.entry.mode == DeliveryMode::Flow) {
        r.pulses = s.pulses;
        r.targetPulses = s.entry.desc.flow.targetPulses;
        r.targetMl = s.entry.desc.flow.targetMl;
    } else {
        r.targetMl = s.entry.desc.timed.targetMl;
    }

    s.state = isCancelOutcome_(outcome) ? TaskState::Cancelled : TaskState::Idle;
    s.pendingOutcome = ActuationOutcome::None;

    switch (outcome) {
    case ActuationOutcome::Completed: ++stats_.completed; break;
    case ActuationOutcome::FlowCeiling: ++stats_.flowCeilings; break;
    case ActuationOutcome::Superseded: ++stats_.superseded; break;
    case ActuationOutcome::Cancelled:
    case ActuationOutcome::Tramlined: ++stats_.cancelled; break;
    default: break;
    }

    if (listener_.onCompleted) listener_.onCompleted(listener_.ctx, r);
}

void ActuationManager::notifyFault_(uint8_t unitId, HardwareOp op)
{
    if (listener_.onFault) listener_.onFault(listener_.ctx, unitId, op);
}

bool ActuationManager::beep(bool on, uint32_t durationMs, BeepKind kind, uint32_t nowMs)
{
    if (!on) {
        buzzerTimed_ = false;
        if (buzzer_.release()) {
            buzzerReleaseFailures_ = 0;
            return true;
        }
        ++buzzerReleaseFailures_;
        return false;
    }

    if (buzzerHardMute_) return false;
    if (buzzerMuted_ && kind == BeepKind::Normal) return false;

    if (!buzzer_.armed()) {
        bool ok = false;
        for (uint8_t attempt = 0; attempt < Limits::Irrigation::HwRetryCount; ++attempt) {
            if (hw_.driveBuzzer(true)) {
                ok = true;
                break;
            }
            (void)hw_.driveBuzzer(false);
        }
        if (!ok) {
            ++stats_.faults;
            notifyFault_(OutputGuard::BuzzerId, HardwareOp::Assert);
            return false;
        }
        buzzer_.arm(&hw_, OutputGuard::BuzzerId);
        buzzerReleaseFailures_ = 0;
    }

    buzzerTimed_ = (durationMs > 0);
    buzzerOffAtMs_ = nowMs + durationMs;
    return true;
}

void ActuationManager::serviceBuzzer_(uint32_t nowMs)
{
    if (!buzzer_.armed()) return;

    /// a pending release is retried every tick, a held beep waits for its deadline
    const bool releaseDue = (buzzerReleaseFailures_ > 0) || (buzzerTimed_ && reached_(nowMs, buzzerOffAtMs_));
    if (!releaseDue) return;

    buzzerTimed_ = false;
    if (buzzer_.release()) {
        buzzerReleaseFailures_ = 0;
        return;
    }
    if (buzzerReleaseFailures_ < 0xFF) ++buzzerReleaseFailures_;
    if (buzzerReleaseFailures_ == Limits::Irrigation::HwRetryCount) {
        ++stats_.faults;
        notifyFault_(OutputGuard::BuzzerId, HardwareOp::Deassert);
    }
}

TaskState ActuationManager::state(uint8_t unitId) const
{
    const Slot* s = slot_(unitId);
    return s ? s->state : TaskState::Idle;
}

bool ActuationManager::isBusy(uint8_t unitId) const
{
    const Slot* s = slot_(unitId);
    return s ? busy_(*s) : false;
}

bool ActuationManager::faulted(uint8_t unitId) const
{
    const Slot* s = slot_(unitId);
    return s ? s->faulted : false;
}

bool ActuationManager::outputAsserted(uint8_t unitId) const
{
    const Slot* s = slot_(unitId);
    return s ? s->guard.armed() : false;
}

uint32_t ActuationManager::pulses(uint8_t unitId) const
{
    const Slot* s = slot_(unitId);
    return s ? s->pulses : 0;
}

uint8_t ActuationManager::activeCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        if (slots_[i].state == TaskState::Active) ++n;
    }
    return n;
}
