#pragma once
/**
 * @file TramlineSet.h
 * @brief Set of unit ids temporarily forced off.
 */

#include <stdint.h>
#include "Core/SystemLimits.h"

/**
 * @brief Bitmask of suppressed units.
 *
 * Only ids currently suppressed are members: clearing an override removes the
 * entry, it never stores an "on" value.
 */
class TramlineSet {
public:
    /** @brief Set or remove an override. Returns true if the set changed. */
    bool set(uint8_t unitId, bool off)
    {
        if (!validId_(unitId)) return false;
        const uint16_t bit = bit_(unitId);
        const uint16_t next = off ? (uint16_t)(mask_ | bit) : (uint16_t)(mask_ & ~bit);
        if (next == mask_) return false;
        mask_ = next;
        return true;
    }

    /** @brief Replace the whole set (preset apply). Returns true if it changed. */
    bool assign(uint16_t mask)
    {
        const uint16_t next = (uint16_t)(mask & allMask_());
        if (next == mask_) return false;
        mask_ = next;
        return true;
    }

    bool clear() { return assign(0); }

    bool contains(uint8_t unitId) const
    {
        return validId_(unitId) && (mask_ & bit_(unitId)) != 0;
    }

    uint16_t mask() const { return mask_; }

    uint8_t count() const
    {
        uint8_t n = 0;
        for (uint16_t m = mask_; m != 0; m &= (uint16_t)(m - 1)) ++n;
        return n;
    }

private:
    static bool validId_(uint8_t unitId)
    {
        return unitId >= 1 && unitId <= Limits::Irrigation::MaxUnits;
    }
    static uint16_t bit_(uint8_t unitId) { return (uint16_t)(1u << (unitId - 1)); }
    static uint16_t allMask_() { return (uint16_t)((1u << Limits::Irrigation::MaxUnits) - 1u); }

    uint16_t mask_ = 0;
};
