#pragma once
/**
 * @file PressTracker.h
 * @brief Switch debouncing and the windowed press history.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

/**
 * @brief Time-ordered press timestamps, windowed and hard-capped.
 *
 * Oldest entries are evicted first, either when they leave the trailing
 * window or when the cap is reached.
 */
class PressHistory {
public:
    /** @brief Set window and cap (cap is bounded by `Limits::Irrigation::PressHistoryMax`). */
    void configure(uint32_t windowMs, uint8_t cap);

    /** @brief Append a press; evicts the oldest entry when full. */
    void record(uint32_t tsMs);
    /** @brief Drop entries with `now - ts >= window`. */
    void prune(uint32_t nowMs);
    void clear();

    uint8_t count() const { return count_; }
    /** @brief Entry by age, 0 = oldest. */
    uint32_t at(uint8_t idx) const;
    uint32_t windowMs() const { return windowMs_; }
    uint8_t cap() const { return cap_; }

private:
    uint32_t ts_[Limits::Irrigation::PressHistoryMax]{};
    uint8_t head_ = 0;   ///< index of the oldest entry
    uint8_t count_ = 0;
    uint8_t cap_ = Limits::Irrigation::PressHistoryMax;
    uint32_t windowMs_ = 15000;
};

enum class PressResult : uint8_t {
    Accepted = 0,
    Bounced,          ///< hardware edge inside the debounce interval
    Held,             ///< simulated press while the previous one is still held
    Disabled,         ///< switch disabled in settings
    InvalidSwitch
};

/**
 * @brief Turns raw switch edges into logical presses.
 *
 * Hardware edges are accepted at most once per debounce interval. Simulated
 * presses are held for `simReleaseMs` and released by `tick`.
 * Owned and called by a single task.
 */
class PressTracker {
public:
    void configure(uint32_t debounceMs, uint32_t simReleaseMs, uint32_t windowMs, uint8_t cap);

    /** @brief Raw falling edge from a switch input (timestamp from the ISR). */
    PressResult onEdge(uint8_t switchId, uint32_t tsMs, bool switchEnabled);
    /** @brief Virtual press (command or simulator). */
    PressResult onSimulatedPress(uint8_t switchId, uint32_t nowMs, bool switchEnabled);

    /** @brief Release simulated presses whose hold time elapsed and prune the history. */
    void tick(uint32_t nowMs);

    /** @brief True while a simulated press of this switch is held down. */
    bool isHeld(uint8_t switchId) const;

    const PressHistory& history() const { return history_; }
    uint32_t acceptedCount() const { return accepted_; }
    uint32_t bouncedCount() const { return bounced_; }

private:
    struct SwitchState {
        bool seen = false;
        uint32_t lastAcceptedMs = 0;
        bool simHeld = false;
        uint32_t simReleaseAtMs = 0;
    };

    void accept_(uint32_t tsMs);
    static bool validSwitch_(uint8_t switchId);

    SwitchState switches_[Limits::Irrigation::MaxSwitches]{};
    PressHistory history_;
    uint32_t debounceMs_ = 10;
    uint32_t simReleaseMs_ = 50;
    uint32_t accepted_ = 0;
    uint32_t bounced_ = 0;
};
