#include <unity.h>

#include "Modules/IrrigationModule/TramlineSet.h"

void setUp() {}
void tearDown() {}

void test_set_and_clear_single_units()
{
    TramlineSet t;
    TEST_ASSERT_TRUE(t.set(3, true));
    TEST_ASSERT_TRUE(t.contains(3));
    TEST_ASSERT_EQUAL_UINT16(0x0004, t.mask());

    TEST_ASSERT_TRUE(t.set(3, false));
    TEST_ASSERT_FALSE(t.contains(3));
    TEST_ASSERT_EQUAL_UINT8(0, t.count());
}

void test_repeated_changes_are_idempotent()
{
    TramlineSet t;
    TEST_ASSERT_FALSE(t.set(5, false));
    TEST_ASSERT_TRUE(t.set(5, true));
    TEST_ASSERT_FALSE(t.set(5, true));
    TEST_ASSERT_EQUAL_UINT8(1, t.count());
}

void test_out_of_range_ids_are_ignored()
{
    TramlineSet t;
    TEST_ASSERT_FALSE(t.set(0, true));
    TEST_ASSERT_FALSE(t.set(Limits::Irrigation::MaxUnits + 1, true));
    TEST_ASSERT_FALSE(t.contains(0));
    TEST_ASSERT_EQUAL_UINT16(0, t.mask());
}

void test_assign_masks_to_known_units()
{
    TramlineSet t;
    TEST_ASSERT_TRUE(t.assign(0xFFFF));
    TEST_ASSERT_EQUAL_UINT8(Limits::Irrigation::MaxUnits, t.count());
    TEST_ASSERT_FALSE(t.assign((uint16_t)((1u << Limits::Irrigation::MaxUnits) - 1u)));

    TEST_ASSERT_TRUE(t.clear());
    TEST_ASSERT_FALSE(t.clear());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_set_and_clear_single_units);
    RUN_TEST(test_repeated_changes_are_idempotent);
    RUN_TEST(test_out_of_range_ids_are_ignored);
    RUN_TEST(test_assign_masks_to_known_units);
    return UNITY_END();
}
