#include <unity.h>

#include "Modules/IrrigationModule/Timing/TimingPlanner.h"
#include "Domain/IrrigationDefaults.h"
#include <stdint.h>

void setUp() {}
void tearDown() {}

/// units 1..4 enabled, odd ids in A, even ids in B, B delay 500 ms
static IrrigationSnapshot makeSnapshot()
{
    IrrigationSnapshot s{};
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        UnitConfig& u = s.units[i];
        u.id = (uint8_t)(i + 1);
        u.enabled = (u.id <= 4);
        u.group = (u.id % 2 == 1) ? (uint8_t)UnitGroup::A : (uint8_t)UnitGroup::B;
        u.momentary = MOMENTARY_NONE;
        u.msPerMl = 5.0f;
        u.pulsesPerLiter = 450;
        u.pulsesPerCycle = 100;
    }
    s.unitCount = Limits::Irrigation::MaxUnits;
    s.autoDelay.currentMs = 500;
    s.targetMl = 100.0f;
    s.deliveryMode = (uint8_t)DeliveryMode::Timed;
    s.diagonalStepMs = 80;
    return s;
}

static bool sortedByOffsetThenId(const CyclePlan& plan)
{
    for (uint8_t i = 1; i < plan.count; ++i) {
        const ScheduleEntry& a = plan.entries[i - 1];
        const ScheduleEntry& b = plan.entries[i];
        if (a.offsetMs > b.offsetMs) return false;
        if (a.offsetMs == b.offsetMs && a.unitId >= b.unitId) return false;
    }
    return true;
}

void test_diamond_places_group_b_after_current_delay()
{
    IrrigationSnapshot s = makeSnapshot();
    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 10000, TimingPattern::Diamond, plan));

    TEST_ASSERT_EQUAL_UINT8(1, plan.entries[0].unitId);
    TEST_ASSERT_EQUAL_UINT8(3, plan.entries[1].unitId);
    TEST_ASSERT_EQUAL_UINT8(2, plan.entries[2].unitId);
    TEST_ASSERT_EQUAL_UINT8(4, plan.entries[3].unitId);
    TEST_ASSERT_EQUAL_INT32(0, plan.entries[0].offsetMs);
    TEST_ASSERT_EQUAL_INT32(500, plan.entries[2].offsetMs);
    TEST_ASSERT_EQUAL_UINT32(10500, plan.entries[3].startMs);
    TEST_ASSERT_EQUAL_UINT32(10000, plan.pressMs);
}

void test_momentary_offset_is_clamped_percent_times_ten()
{
    IrrigationSnapshot s = makeSnapshot();
    s.units[0].momentary = 1;
    s.momentary[0].enabled = true;
    s.momentary[0].offsetPct = 30;
    TEST_ASSERT_EQUAL_INT32(300, momentaryOffsetMs(s, s.units[0]));

    s.momentary[0].offsetPct = 150;
    TEST_ASSERT_EQUAL_INT32(1000, momentaryOffsetMs(s, s.units[0]));

    s.momentary[0].enabled = false;
    TEST_ASSERT_EQUAL_INT32(0, momentaryOffsetMs(s, s.units[0]));

    s.units[1].momentary = MOMENTARY_NONE;
    TEST_ASSERT_EQUAL_INT32(0, momentaryOffsetMs(s, s.units[1]));
}

void test_diamond_clamps_per_unit_delays()
{
    IrrigationSnapshot s = makeSnapshot();
    s.units[0].perDelayMs = -200;   // A floored at 0
    s.units[1].perDelayMs = -800;   // B floored at -currentMs
    s.units[3].perDelayMs = -100;

    TEST_ASSERT_EQUAL_INT32(0, clampedUnitDelayMs(TimingPattern::Diamond, s.units[0], 500));
    TEST_ASSERT_EQUAL_INT32(-500, clampedUnitDelayMs(TimingPattern::Diamond, s.units[1], 500));
    TEST_ASSERT_EQUAL_INT32(-100, clampedUnitDelayMs(TimingPattern::Diamond, s.units[3], 500));

    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 0, TimingPattern::Diamond, plan));
    for (uint8_t i = 0; i < plan.count; ++i) {
        TEST_ASSERT_TRUE(plan.entries[i].offsetMs >= 0);
    }
    /// unit 2 pulled forward to A's zero
    TEST_ASSERT_EQUAL_UINT8(1, plan.entries[0].unitId);
    TEST_ASSERT_EQUAL_UINT8(2, plan.entries[1].unitId);
    TEST_ASSERT_EQUAL_INT32(0, plan.entries[1].offsetMs);
    TEST_ASSERT_EQUAL_UINT8(4, plan.entries[3].unitId);
    TEST_ASSERT_EQUAL_INT32(400, plan.entries[3].offsetMs);
}

void test_diagonal_steps_by_id_without_clamp()
{
    IrrigationSnapshot s = makeSnapshot();
    s.units[2].perDelayMs = -200;

    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 10000, TimingPattern::Diagonal, plan));
    TEST_ASSERT_TRUE(sortedByOffsetThenId(plan));

    TEST_ASSERT_EQUAL_UINT8(3, plan.entries[0].unitId);
    TEST_ASSERT_EQUAL_INT32(-40, plan.entries[0].offsetMs);
    TEST_ASSERT_EQUAL_UINT32(9960, plan.entries[0].startMs);
    TEST_ASSERT_EQUAL_UINT8(1, plan.entries[1].unitId);
    TEST_ASSERT_EQUAL_UINT8(2, plan.entries[2].unitId);
    TEST_ASSERT_EQUAL_INT32(80, plan.entries[2].offsetMs);
    TEST_ASSERT_EQUAL_UINT8(4, plan.entries[3].unitId);
    TEST_ASSERT_EQUAL_INT32(240, plan.entries[3].offsetMs);
}

void test_line_fires_everything_at_press_time()
{
    IrrigationSnapshot s = makeSnapshot();
    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 777, TimingPattern::Line, plan));
    for (uint8_t i = 0; i < plan.count; ++i) {
        TEST_ASSERT_EQUAL_UINT8(i + 1, plan.entries[i].unitId);
        TEST_ASSERT_EQUAL_UINT32(777, plan.entries[i].startMs);
    }
}

void test_disabled_and_tramlined_units_are_skipped()
{
    IrrigationSnapshot s = makeSnapshot();
    s.units[0].enabled = false;
    s.tramlineMask = (uint16_t)(1u << 1);   // unit 2
    s.units[9].enabled = true;              // unit 10, group B

    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(3, planCycle(s, 0, TimingPattern::Diamond, plan));
    for (uint8_t i = 0; i < plan.count; ++i) {
        TEST_ASSERT_TRUE(plan.entries[i].unitId != 1);
        TEST_ASSERT_TRUE(plan.entries[i].unitId != 2);
    }
    TEST_ASSERT_TRUE(sortedByOffsetThenId(plan));
}

void test_timed_target_100_at_5_ms_per_ml_lasts_500_ms()
{
    IrrigationSnapshot s = makeSnapshot();
    CyclePlan plan;
    planCycle(s, 0, TimingPattern::Line, plan);

    const ScheduleEntry& e = plan.entries[0];
    TEST_ASSERT_TRUE(e.mode == DeliveryMode::Timed);
    TEST_ASSERT_TRUE(e.hasDuration);
    TEST_ASSERT_EQUAL_UINT32(500, e.durationMs);
}

void test_unit_mode_overrides_global_mode()
{
    IrrigationSnapshot s = makeSnapshot();
    s.deliveryMode = (uint8_t)DeliveryMode::Flow;
    s.units[0].mode = (uint8_t)UnitDeliveryMode::Timed;

    TEST_ASSERT_TRUE(effectiveDeliveryMode(s, s.units[0]) == DeliveryMode::Timed);
    TEST_ASSERT_TRUE(effectiveDeliveryMode(s, s.units[1]) == DeliveryMode::Flow);

    s.deliveryMode = (uint8_t)DeliveryMode::Timed;
    s.units[1].mode = (uint8_t)UnitDeliveryMode::Flow;
    TEST_ASSERT_TRUE(effectiveDeliveryMode(s, s.units[1]) == DeliveryMode::Flow);
}

void test_flow_pulses_from_k_factor_capped_per_cycle()
{
    UnitConfig u{};
    u.id = 1;
    u.msPerMl = 5.0f;
    u.pulsesPerLiter = 450;
    u.pulsesPerCycle = 100;
    u.flowSource = 1;

    ScheduleEntry e{};
    fillDelivery(e, u, DeliveryMode::Flow, 100.0f, true);
    TEST_ASSERT_TRUE(e.mode == DeliveryMode::Flow);
    TEST_ASSERT_FALSE(e.hasDuration);
    TEST_ASSERT_EQUAL_UINT32(45, e.desc.flow.targetPulses);
    TEST_ASSERT_EQUAL_UINT8(1, e.desc.flow.source);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 11.11f, e.desc.flow.msPerPulse);

    u.pulsesPerCycle = 20;
    fillDelivery(e, u, DeliveryMode::Flow, 100.0f, true);
    TEST_ASSERT_EQUAL_UINT32(20, e.desc.flow.targetPulses);

    /// calibration runs uncapped
    fillDelivery(e, u, DeliveryMode::Flow, 1000.0f, false);
    TEST_ASSERT_EQUAL_UINT32(450, e.desc.flow.targetPulses);
}

void test_floors_apply_before_arithmetic()
{
    UnitConfig u{};
    u.id = 1;
    u.msPerMl = 5.0f;
    u.pulsesPerLiter = 450;
    u.pulsesPerCycle = 0;

    ScheduleEntry e{};
    fillDelivery(e, u, DeliveryMode::Timed, 0.2f, true);
    TEST_ASSERT_EQUAL_UINT32(5, e.durationMs);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.0f, e.desc.timed.targetMl);

    u.msPerMl = 0.0f;
    fillDelivery(e, u, DeliveryMode::Timed, 100.0f, true);
    TEST_ASSERT_EQUAL_UINT32(10, e.durationMs);

    /// pulses-per-cycle floored at 1
    u.msPerMl = 5.0f;
    fillDelivery(e, u, DeliveryMode::Flow, 100.0f, true);
    TEST_ASSERT_EQUAL_UINT32(1, e.desc.flow.targetPulses);
}

static int32_t offsetOf(const CyclePlan& plan, uint8_t unitId)
{
    for (uint8_t i = 0; i < plan.count; ++i) {
        if (plan.entries[i].unitId == unitId) return plan.entries[i].offsetMs;
    }
    TEST_FAIL_MESSAGE("unit missing from plan");
    return 0;
}

void test_out_of_range_inputs_are_clamped_before_arithmetic()
{
    IrrigationSnapshot s = makeSnapshot();
    s.units[10].enabled = true;
    s.diagonalStepMs = 300000000;
    s.units[0].perDelayMs = INT32_MAX;
    s.units[3].perDelayMs = INT32_MIN;

    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(5, planCycle(s, 10000, TimingPattern::Diagonal, plan));
    TEST_ASSERT_TRUE(sortedByOffsetThenId(plan));

    const int32_t step = IrrigationDefaults::MaxDiagonalStepMs;
    const int32_t maxDelay = IrrigationDefaults::MaxUnitDelayMs;
    TEST_ASSERT_EQUAL_INT32(maxDelay, offsetOf(plan, 1));
    TEST_ASSERT_EQUAL_INT32(step, offsetOf(plan, 2));
    TEST_ASSERT_EQUAL_INT32(2 * step, offsetOf(plan, 3));
    TEST_ASSERT_EQUAL_INT32(3 * step - maxDelay, offsetOf(plan, 4));
    TEST_ASSERT_EQUAL_INT32(10 * step, offsetOf(plan, 11));
    TEST_ASSERT_EQUAL_UINT8(11, plan.entries[plan.count - 1].unitId);
    TEST_ASSERT_EQUAL_UINT32(10000u + (uint32_t)(10 * step), plan.entries[plan.count - 1].startMs);

    /// an absurd adaptive delay is bounded as well
    s = makeSnapshot();
    s.autoDelay.currentMs = INT32_MAX;
    s.units[1].perDelayMs = maxDelay;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 10000, TimingPattern::Diamond, plan));
    TEST_ASSERT_EQUAL_INT32(IrrigationDefaults::MaxAutoDelayMs + maxDelay, offsetOf(plan, 2));
    TEST_ASSERT_EQUAL_INT32(IrrigationDefaults::MaxAutoDelayMs, offsetOf(plan, 4));
    TEST_ASSERT_EQUAL_UINT8(2, plan.entries[3].unitId);
}

void test_huge_target_is_capped_not_dropped()
{
    IrrigationSnapshot s = makeSnapshot();
    s.targetMl = 1e30f;

    CyclePlan plan;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 0, TimingPattern::Line, plan));
    TEST_ASSERT_TRUE(plan.entries[0].hasDuration);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)(IrrigationDefaults::MaxTargetMl * 5.0f), plan.entries[0].durationMs);

    s.deliveryMode = (uint8_t)DeliveryMode::Flow;
    TEST_ASSERT_EQUAL_UINT8(4, planCycle(s, 0, TimingPattern::Line, plan));
    TEST_ASSERT_EQUAL_UINT32(100, plan.entries[0].desc.flow.targetPulses);

    ScheduleEntry e{};
    UnitConfig u = s.units[0];
    u.pulsesPerLiter = INT32_MAX;
    fillDelivery(e, u, DeliveryMode::Flow, 1e30f, false);
    TEST_ASSERT_FLOAT_WITHIN(0.5f, IrrigationDefaults::MaxTargetMl, e.desc.flow.targetMl);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)(IrrigationDefaults::MaxTargetMl / 1000.0f) * (uint32_t)IrrigationDefaults::MaxPulsesPerLiter,
                             e.desc.flow.targetPulses);
    TEST_ASSERT_FLOAT_WITHIN(0.5f, IrrigationDefaults::MaxTargetMl, clampTargetMl(1e30f));
}

void test_momentary_enabled_lookup_checks_switch_range()
{
    MomentaryConfig m[Limits::Irrigation::MaxSwitches];
    m[0].enabled = true;
    m[1].enabled = false;
    m[2].enabled = true;

    TEST_ASSERT_TRUE(momentaryEnabled(m, 1));
    TEST_ASSERT_FALSE(momentaryEnabled(m, 2));
    TEST_ASSERT_TRUE(momentaryEnabled(m, 3));
    TEST_ASSERT_FALSE(momentaryEnabled(m, 0));
    TEST_ASSERT_FALSE(momentaryEnabled(m, Limits::Irrigation::MaxSwitches + 1));
    TEST_ASSERT_FALSE(momentaryEnabled(nullptr, 1));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_diamond_places_group_b_after_current_delay);
    RUN_TEST(test_momentary_offset_is_clamped_percent_times_ten);
    RUN_TEST(test_diamond_clamps_per_unit_delays);
    RUN_TEST(test_diagonal_steps_by_id_without_clamp);
    RUN_TEST(test_line_fires_everything_at_press_time);
    RUN_TEST(test_disabled_and_tramlined_units_are_skipped);
    RUN_TEST(test_timed_target_100_at_5_ms_per_ml_lasts_500_ms);
    RUN_TEST(test_unit_mode_overrides_global_mode);
    RUN_TEST(test_flow_pulses_from_k_factor_capped_per_cycle);
    RUN_TEST(test_floors_apply_before_arithmetic);
    RUN_TEST(test_out_of_range_inputs_are_clamped_before_arithmetic);
    RUN_TEST(test_huge_target_is_capped_not_dropped);
    RUN_TEST(test_momentary_enabled_lookup_checks_switch_range);
    return UNITY_END();
}
