/**
 * @file PressTracker.cpp
 * @brief Implementation file.
 */

#include "Modules/IrrigationModule/Inputs/PressTracker.h"

void PressHistory::configure(uint32_t windowMs, uint8_t cap)
{
    windowMs_ = (windowMs == 0) ? 1 : windowMs;
    if (cap == 0) cap = 1;
    if (cap > Limits::Irrigation::PressHistoryMax) cap = Limits::Irrigation::PressHistoryMax;

    /// shrinking the cap drops the oldest entries
    while (count_ > cap) {
        head_ = (uint8_t)((head_ + 1) % Limits::Irrigation::PressHistoryMax);
        --count_;
    }
    cap_ = cap;
}

void PressHistory::record(uint32_t tsMs)
{
    if (count_ >= cap_) {
        head_ = (uint8_t)((head_ + 1) % Limits::Irrigation::PressHistoryMax);
        --count_;
    }
    const uint8_t tail = (uint8_t)((head_ + count_) % Limits::Irrigation::PressHistoryMax);
    ts_[tail] = tsMs;
    ++count_;
}

void PressHistory::prune(uint32_t nowMs)
{
    while (count_ > 0) {
        const uint32_t age = nowMs - ts_[head_];
        if ((int32_t)age < 0 || age < windowMs_) break;
        head_ = (uint8_t)((head_ + 1) % Limits::Irrigation::PressHistoryMax);
        --count_;
    }
}

void PressHistory::clear()
{
    head_ = 0;
    count_ = 0;
}

uint32_t PressHistory::at(uint8_t idx) const
{
    if (idx >= count_) return 0;
    return ts_[(head_ + idx) % Limits::Irrigation::PressHistoryMax];
}

bool PressTracker::validSwitch_(uint8_t switchId)
{
    return switchId >= 1 && switchId <= Limits::Irrigation::MaxSwitches;
}

void PressTracker::configure(uint32_t debounceMs, uint32_t simReleaseMs, uint32_t windowMs, uint8_t cap)
{
    debounceMs_ = debounceMs;
    simReleaseMs_ = simReleaseMs;
    history_.configure(windowMs, cap);
}

void PressTracker::accept_(uint32_t tsMs)
{
    history_.prune(tsMs);
    history_.record(tsMs);
    ++accepted_;
}

PressResult PressTracker::onEdge(uint8_t switchId, uint32_t tsMs, bool switchEnabled)
{
    if (!validSwitch_(switchId)) return PressResult::InvalidSwitch;
    SwitchState& s = switches_[switchId - 1];

    if (s.seen && (uint32_t)(tsMs - s.lastAcceptedMs) < debounceMs_) {
        ++bounced_;
        return PressResult::Bounced;
    }
    /// debounce state also tracks disabled switches
    s.seen = true;
    s.lastAcceptedMs = tsMs;

    if (!switchEnabled) return PressResult::Disabled;
    accept_(tsMs);
    return PressResult::Accepted;
}

PressResult PressTracker::onSimulatedPress(uint8_t switchId, uint32_t nowMs, bool switchEnabled)
{
    if (!validSwitch_(switchId)) return PressResult::InvalidSwitch;
    SwitchState& s = switches_[switchId - 1];

    if (s.simHeld) return PressResult::Held;
    if (!switchEnabled) return PressResult::Disabled;

    s.simHeld = true;
    s.simReleaseAtMs = nowMs + simReleaseMs_;
    accept_(nowMs);
    return PressResult::Accepted;
}

void PressTracker::tick(uint32_t nowMs)
{
    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) {
        SwitchState& s = switches_[i];
        if (s.simHeld && (int32_t)(nowMs - s.simReleaseAtMs) >= 0) {
            s.simHeld = false;
        }
    }
    history_.prune(nowMs);
}

bool PressTracker::isHeld(uint8_t switchId) const
{
    if (!validSwitch_(switchId)) return false;
    return switches_[switchId - 1].simHeld;
}
