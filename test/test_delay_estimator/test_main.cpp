#include <unity.h>

#include "Modules/IrrigationModule/Timing/DelayEstimator.h"

void setUp() {}
void tearDown() {}

static AutoDelayConfig autoCfg(bool enabled, int32_t manualMs, int32_t geomMs)
{
    AutoDelayConfig c{};
    c.enabled = enabled;
    c.manualMs = manualMs;
    c.geomLeadMs = geomMs;
    return c;
}

static PressHistory historyOf(const uint32_t* ts, uint8_t n)
{
    PressHistory h;
    h.configure(15000, 20);
    for (uint8_t i = 0; i < n; ++i) h.record(ts[i]);
    return h;
}

void test_three_presses_one_second_apart_converge_to_500()
{
    const uint32_t ts[] = {0, 1000, 2000};
    const PressHistory h = historyOf(ts, 3);

    DelayEstimator est;
    est.setCurrentMs(0);
    TEST_ASSERT_TRUE(est.update(autoCfg(true, 300, 0), h, 2000));
    TEST_ASSERT_EQUAL_INT32(500, est.currentMs());
    TEST_ASSERT_EQUAL_UINT8(3, est.lastSampleCount());
}

void test_disabled_reports_manual_plus_geom_regardless_of_history()
{
    const uint32_t ts[] = {0, 400, 800, 1200};
    const PressHistory h = historyOf(ts, 4);
    const PressHistory empty = historyOf(ts, 0);

    DelayEstimator est;
    TEST_ASSERT_EQUAL_INT32(550, est.compute(autoCfg(false, 500, 50), h, 1200));
    TEST_ASSERT_EQUAL_INT32(550, est.compute(autoCfg(false, 500, 50), empty, 99999));
    TEST_ASSERT_EQUAL_INT32(0, est.compute(autoCfg(false, 100, -400), h, 1200));
}

void test_too_few_samples_falls_back_to_manual()
{
    const uint32_t ts[] = {0, 1000};
    const PressHistory h = historyOf(ts, 2);

    DelayEstimator est;
    TEST_ASSERT_EQUAL_INT32(300, est.compute(autoCfg(true, 300, 0), h, 1000));
}

void test_presses_outside_window_are_ignored()
{
    const uint32_t ts[] = {0, 1000, 2000};
    const PressHistory h = historyOf(ts, 3);

    DelayEstimator est;
    /// ages 16500, 15500, 14500: only the last one is inside 15 s
    TEST_ASSERT_EQUAL_INT32(300, est.compute(autoCfg(true, 300, 0), h, 16500));
}

void test_geom_lead_added_and_result_never_negative()
{
    const uint32_t ts[] = {0, 600, 1200, 1800};
    const PressHistory h = historyOf(ts, 4);

    DelayEstimator est;
    TEST_ASSERT_EQUAL_INT32(400, est.compute(autoCfg(true, 0, 100), h, 1800));
    TEST_ASSERT_EQUAL_INT32(0, est.compute(autoCfg(true, 0, -1000), h, 1800));
}

void test_change_is_reported_once()
{
    const uint32_t ts[] = {0, 1000, 2000};
    const PressHistory h = historyOf(ts, 3);

    DelayEstimator est;
    est.setCurrentMs(0);
    TEST_ASSERT_TRUE(est.update(autoCfg(true, 300, 0), h, 2000));
    TEST_ASSERT_FALSE(est.update(autoCfg(true, 300, 0), h, 2100));
    TEST_ASSERT_EQUAL_INT32(500, est.currentMs());
}

void test_tick_respects_period()
{
    const PressHistory empty = historyOf(nullptr, 0);

    DelayEstimator est;
    est.setTickMs(500);
    TEST_ASSERT_TRUE(est.tick(autoCfg(false, 100, 0), empty, 0));
    TEST_ASSERT_EQUAL_INT32(100, est.currentMs());

    TEST_ASSERT_FALSE(est.tick(autoCfg(false, 200, 0), empty, 200));
    TEST_ASSERT_EQUAL_INT32(100, est.currentMs());

    TEST_ASSERT_TRUE(est.tick(autoCfg(false, 200, 0), empty, 500));
    TEST_ASSERT_EQUAL_INT32(200, est.currentMs());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_three_presses_one_second_apart_converge_to_500);
    RUN_TEST(test_disabled_reports_manual_plus_geom_regardless_of_history);
    RUN_TEST(test_too_few_samples_falls_back_to_manual);
    RUN_TEST(test_presses_outside_window_are_ignored);
    RUN_TEST(test_geom_lead_added_and_result_never_negative);
    RUN_TEST(test_change_is_reported_once);
    RUN_TEST(test_tick_respects_period);
    return UNITY_END();
}
