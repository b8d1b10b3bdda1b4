#include <unity.h>

#include "Modules/IrrigationModule/Actuation/DeliveryStatus.h"

void setUp() {}
void tearDown() {}

static ActuationReport flowReport(ActuationOutcome outcome, uint32_t pulses, float targetMl)
{
    ActuationReport r;
    r.unitId = 1;
    r.outcome = outcome;
    r.mode = DeliveryMode::Flow;
    r.pulses = pulses;
    r.targetMl = targetMl;
    return r;
}

void test_flow_delivery_graded_by_deviation()
{
    DeliveryAssessment a = assessDelivery(flowReport(ActuationOutcome::Completed, 45, 100.0f), 450);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 100.0f, a.deliveredMl);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Ok);

    a = assessDelivery(flowReport(ActuationOutcome::Completed, 48, 100.0f), 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Warn);

    a = assessDelivery(flowReport(ActuationOutcome::Completed, 51, 100.0f), 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Inspect);

    a = assessDelivery(flowReport(ActuationOutcome::Completed, 52, 100.0f), 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Blocked);
}

void test_stalled_or_cancelled_flow_is_blocked()
{
    DeliveryAssessment a = assessDelivery(flowReport(ActuationOutcome::FlowCeiling, 10, 100.0f), 450);
    TEST_ASSERT_TRUE(a.deviation < -0.5f);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Blocked);

    a = assessDelivery(flowReport(ActuationOutcome::Cancelled, 45, 100.0f), 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Blocked);
}

void test_timed_completion_assumes_target()
{
    ActuationReport r;
    r.outcome = ActuationOutcome::Completed;
    r.mode = DeliveryMode::Timed;
    r.targetMl = 80.0f;

    DeliveryAssessment a = assessDelivery(r, 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Ok);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 80.0f, a.deliveredMl);

    r.outcome = ActuationOutcome::Superseded;
    a = assessDelivery(r, 450);
    TEST_ASSERT_TRUE(a.status == DeliveryStatus::Blocked);
    TEST_ASSERT_EQUAL_STRING("BLOCKED", deliveryStatusStr(a.status));
}

void test_zero_k_factor_is_floored()
{
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 3000.0f, estimateDeliveredMl(3, 0));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, deliveryDeviation(10.0f, 0.0f));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_flow_delivery_graded_by_deviation);
    RUN_TEST(test_stalled_or_cancelled_flow_is_blocked);
    RUN_TEST(test_timed_completion_assumes_target);
    RUN_TEST(test_zero_k_factor_is_floored);
    return UNITY_END();
}
