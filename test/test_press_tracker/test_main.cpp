#include <unity.h>

#include "Modules/IrrigationModule/Inputs/PressTracker.h"

void setUp() {}
void tearDown() {}

void test_edges_inside_debounce_are_bounced()
{
    PressTracker t;
    t.configure(10, 50, 15000, 20);

    TEST_ASSERT_TRUE(t.onEdge(1, 100, true) == PressResult::Accepted);
    TEST_ASSERT_TRUE(t.onEdge(1, 105, true) == PressResult::Bounced);
    TEST_ASSERT_TRUE(t.onEdge(1, 110, true) == PressResult::Accepted);
    /// debounce is per switch
    TEST_ASSERT_TRUE(t.onEdge(2, 111, true) == PressResult::Accepted);

    TEST_ASSERT_EQUAL_UINT32(3, t.acceptedCount());
    TEST_ASSERT_EQUAL_UINT32(1, t.bouncedCount());
    TEST_ASSERT_EQUAL_UINT8(3, t.history().count());
    TEST_ASSERT_EQUAL_UINT32(100, t.history().at(0));
    TEST_ASSERT_EQUAL_UINT32(111, t.history().at(2));
}

void test_disabled_switch_is_debounced_but_not_recorded()
{
    PressTracker t;
    t.configure(10, 50, 15000, 20);

    TEST_ASSERT_TRUE(t.onEdge(3, 0, false) == PressResult::Disabled);
    TEST_ASSERT_TRUE(t.onEdge(3, 5, true) == PressResult::Bounced);
    TEST_ASSERT_EQUAL_UINT8(0, t.history().count());
    TEST_ASSERT_EQUAL_UINT32(0, t.acceptedCount());
}

void test_invalid_switch_ids_are_rejected()
{
    PressTracker t;
    TEST_ASSERT_TRUE(t.onEdge(0, 0, true) == PressResult::InvalidSwitch);
    TEST_ASSERT_TRUE(t.onEdge(Limits::Irrigation::MaxSwitches + 1, 0, true) == PressResult::InvalidSwitch);
    TEST_ASSERT_TRUE(t.onSimulatedPress(9, 0, true) == PressResult::InvalidSwitch);
}

void test_simulated_press_is_held_until_release_delay()
{
    PressTracker t;
    t.configure(10, 50, 15000, 20);

    TEST_ASSERT_TRUE(t.onSimulatedPress(1, 1000, true) == PressResult::Accepted);
    TEST_ASSERT_TRUE(t.isHeld(1));
    TEST_ASSERT_TRUE(t.onSimulatedPress(1, 1020, true) == PressResult::Held);

    t.tick(1049);
    TEST_ASSERT_TRUE(t.isHeld(1));
    t.tick(1050);
    TEST_ASSERT_FALSE(t.isHeld(1));

    TEST_ASSERT_TRUE(t.onSimulatedPress(1, 1060, true) == PressResult::Accepted);
    TEST_ASSERT_EQUAL_UINT8(2, t.history().count());
}

void test_history_drops_entries_leaving_the_window()
{
    PressTracker t;
    t.configure(10, 50, 1000, 20);

    t.onEdge(1, 0, true);
    t.onEdge(1, 500, true);
    t.tick(999);
    TEST_ASSERT_EQUAL_UINT8(2, t.history().count());
    t.tick(1000);
    TEST_ASSERT_EQUAL_UINT8(1, t.history().count());
    TEST_ASSERT_EQUAL_UINT32(500, t.history().at(0));
}

void test_history_cap_evicts_oldest()
{
    PressHistory h;
    h.configure(100000, 3);
    for (uint32_t ts = 0; ts <= 400; ts += 100) h.record(ts);

    TEST_ASSERT_EQUAL_UINT8(3, h.count());
    TEST_ASSERT_EQUAL_UINT32(200, h.at(0));
    TEST_ASSERT_EQUAL_UINT32(400, h.at(2));

    h.configure(100000, 1);
    TEST_ASSERT_EQUAL_UINT8(1, h.count());
    TEST_ASSERT_EQUAL_UINT32(400, h.at(0));

    h.configure(100000, 0);
    TEST_ASSERT_EQUAL_UINT8(1, h.cap());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_edges_inside_debounce_are_bounced);
    RUN_TEST(test_disabled_switch_is_debounced_but_not_recorded);
    RUN_TEST(test_invalid_switch_ids_are_rejected);
    RUN_TEST(test_simulated_press_is_held_until_release_delay);
    RUN_TEST(test_history_drops_entries_leaving_the_window);
    RUN_TEST(test_history_cap_evicts_oldest);
    return UNITY_END();
}
