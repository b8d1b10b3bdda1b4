#include <unity.h>
#include <thread>

#include "Modules/IrrigationModule/Inputs/FlowCounter.h"

void setUp() {}
void tearDown() {}

void test_read_returns_count_since_previous_read()
{
    FlowCounter c;
    for (int i = 0; i < 7; ++i) c.increment();
    c.add(3);

    TEST_ASSERT_EQUAL_UINT32(10, c.peek());
    TEST_ASSERT_EQUAL_UINT32(10, c.readAndReset());
    TEST_ASSERT_EQUAL_UINT32(0, c.readAndReset());

    c.increment();
    TEST_ASSERT_EQUAL_UINT32(1, c.readAndReset());
}

void test_concurrent_increments_are_counted_exactly_once()
{
    static constexpr uint32_t kPulses = 200000;
    FlowCounter c;

    std::thread producer([&c]() {
        for (uint32_t i = 0; i < kPulses; ++i) c.increment();
    });

    uint64_t total = 0;
    for (int i = 0; i < 5000; ++i) total += c.readAndReset();
    producer.join();
    total += c.readAndReset();

    TEST_ASSERT_EQUAL_UINT32(kPulses, (uint32_t)total);
    TEST_ASSERT_EQUAL_UINT32(0, c.peek());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_read_returns_count_since_previous_read);
    RUN_TEST(test_concurrent_increments_are_counted_exactly_once);
    return UNITY_END();
}
