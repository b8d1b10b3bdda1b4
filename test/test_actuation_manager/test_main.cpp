#include <unity.h>

#include "Modules/IrrigationModule/Actuation/ActuationManager.h"
#include "../support/FakeHardwareIO.h"

struct Recorder {
    uint32_t completedCalls = 0;
    ActuationReport last{};
    uint32_t faultCalls = 0;
    uint8_t faultUnit = 0xFF;
    HardwareOp faultOp = HardwareOp::Assert;
};

static Recorder rec;

static void onCompleted(void* ctx, const ActuationReport& r)
{
    Recorder* self = static_cast<Recorder*>(ctx);
    ++self->completedCalls;
    self->last = r;
}

static void onFault(void* ctx, uint8_t unitId, HardwareOp op)
{
    Recorder* self = static_cast<Recorder*>(ctx);
    ++self->faultCalls;
    self->faultUnit = unitId;
    self->faultOp = op;
}

static void attach(ActuationManager& m)
{
    ActuationListener l;
    l.onCompleted = onCompleted;
    l.onFault = onFault;
    l.ctx = &rec;
    m.setListener(l);
}

static ScheduleEntry timedEntry(uint8_t unitId, uint32_t startMs, uint32_t durationMs)
{
    ScheduleEntry e{};
    e.unitId = unitId;
    e.startMs = startMs;
    e.mode = DeliveryMode::Timed;
    e.hasDuration = true;
    e.durationMs = durationMs;
    e.desc.timed.msPerMl = 5.0f;
    e.desc.timed.targetMl = (float)durationMs / 5.0f;
    return e;
}

static ScheduleEntry flowEntry(uint8_t unitId, uint32_t startMs, uint32_t targetPulses, float msPerPulse, uint8_t source)
{
    ScheduleEntry e{};
    e.unitId = unitId;
    e.startMs = startMs;
    e.mode = DeliveryMode::Flow;
    e.desc.flow.targetPulses = targetPulses;
    e.desc.flow.targetMl = 0.0f;
    e.desc.flow.msPerPulse = msPerPulse;
    e.desc.flow.source = source;
    return e;
}

void setUp()
{
    rec = Recorder{};
}

void tearDown() {}

void test_timed_actuation_runs_for_exact_duration()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    TEST_ASSERT_TRUE(m.submit(timedEntry(1, 100, 500), 0) == SubmitResult::Accepted);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Scheduled);
    TEST_ASSERT_FALSE(hw.on[1]);

    m.tick(99);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Scheduled);
    m.tick(100);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Active);
    TEST_ASSERT_TRUE(hw.on[1]);
    TEST_ASSERT_TRUE(m.outputAsserted(1));

    m.tick(599);
    TEST_ASSERT_TRUE(hw.on[1]);
    m.tick(600);
    TEST_ASSERT_FALSE(hw.on[1]);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Idle);

    TEST_ASSERT_EQUAL_UINT32(1, rec.completedCalls);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Completed);
    TEST_ASSERT_EQUAL_UINT32(500, rec.last.activeMs);
    TEST_ASSERT_FALSE(rec.last.late);
    TEST_ASSERT_EQUAL_UINT32(1, hw.asserts[1]);
    TEST_ASSERT_EQUAL_UINT32(1, hw.deasserts[1]);
}

void test_busy_unit_rejects_new_entry()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);

    TEST_ASSERT_TRUE(m.submit(timedEntry(2, 100, 500), 0) == SubmitResult::Accepted);
    TEST_ASSERT_TRUE(m.submit(timedEntry(2, 200, 500), 0) == SubmitResult::Conflict);
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().conflicts);
    TEST_ASSERT_TRUE(m.submit(timedEntry(0, 0, 10), 0) == SubmitResult::InvalidUnit);
    TEST_ASSERT_TRUE(m.submit(timedEntry(12, 0, 10), 0) == SubmitResult::InvalidUnit);
}

void test_start_in_the_past_fires_immediately()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    TEST_ASSERT_TRUE(m.submit(timedEntry(3, 900, 100), 1000) == SubmitResult::Accepted);
    TEST_ASSERT_TRUE(m.state(3) == TaskState::Active);
    TEST_ASSERT_TRUE(hw.on[3]);
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().lateStarts);

    m.tick(1100);
    TEST_ASSERT_TRUE(rec.last.late);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Completed);
}

void test_cancel_active_deasserts_at_once()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    m.submit(timedEntry(1, 100, 5000), 0);
    m.tick(100);
    TEST_ASSERT_TRUE(hw.on[1]);

    TEST_ASSERT_TRUE(m.cancel(1, CancelReason::Stop, 250));
    TEST_ASSERT_FALSE(hw.on[1]);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Cancelled);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Cancelled);
    TEST_ASSERT_EQUAL_UINT32(150, rec.last.activeMs);
    TEST_ASSERT_EQUAL_UINT32(1, hw.deasserts[1]);

    TEST_ASSERT_FALSE(m.cancel(1, CancelReason::Stop, 260));
    m.tick(300);
    TEST_ASSERT_EQUAL_UINT32(1, hw.deasserts[1]);

    /// Cancelled accepts a new entry
    TEST_ASSERT_TRUE(m.submit(timedEntry(1, 400, 10), 300) == SubmitResult::Accepted);
}

void test_cancel_scheduled_never_touches_output()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    m.submit(timedEntry(4, 1000, 500), 0);
    TEST_ASSERT_TRUE(m.cancel(4, CancelReason::Stop, 10));
    TEST_ASSERT_TRUE(m.state(4) == TaskState::Cancelled);
    TEST_ASSERT_EQUAL_UINT32(0, hw.asserts[4]);
    TEST_ASSERT_EQUAL_UINT32(0, hw.deassertCalls);
    TEST_ASSERT_EQUAL_UINT32(0, rec.last.activeMs);

    m.tick(1000);
    TEST_ASSERT_FALSE(hw.on[4]);
}

void test_tramline_cancels_and_rejects()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    TramlineSet tram;
    m.setTramlineSet(&tram);
    attach(m);

    m.submit(timedEntry(5, 0, 5000), 0);
    TEST_ASSERT_TRUE(hw.on[5]);

    TEST_ASSERT_TRUE(tram.set(5, true));
    m.tick(10);
    TEST_ASSERT_FALSE(hw.on[5]);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Tramlined);

    TEST_ASSERT_TRUE(m.submit(timedEntry(5, 20, 100), 20) == SubmitResult::Tramlined);
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().tramlineRejects);

    /// re-tramlining is a no-op
    TEST_ASSERT_FALSE(tram.set(5, true));
}

void test_flow_completes_on_target_pulses()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    hw.pulses[0] = 99;   // stale, drained on activation
    m.submit(flowEntry(6, 0, 10, 11.0f, 0), 0);
    TEST_ASSERT_TRUE(hw.on[6]);
    TEST_ASSERT_EQUAL_UINT32(0, hw.pulses[0]);

    hw.pulses[0] = 4;
    m.tick(10);
    TEST_ASSERT_EQUAL_UINT32(4, m.pulses(6));
    TEST_ASSERT_TRUE(hw.on[6]);

    hw.pulses[0] = 6;
    m.tick(20);
    TEST_ASSERT_FALSE(hw.on[6]);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Completed);
    TEST_ASSERT_EQUAL_UINT32(10, rec.last.pulses);
    TEST_ASSERT_EQUAL_UINT32(10, rec.last.targetPulses);
}

void test_flow_ceiling_stops_a_stalled_meter()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    m.setFlowCeilingMultiplier(3.0f);
    attach(m);

    /// 10 x 11 x 3 = 330 ms, raised to the 1000 ms floor
    m.submit(flowEntry(7, 0, 10, 11.0f, 1), 0);
    m.tick(999);
    TEST_ASSERT_TRUE(hw.on[7]);
    m.tick(1000);
    TEST_ASSERT_FALSE(hw.on[7]);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::FlowCeiling);
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().flowCeilings);

    /// 100 x 10 x 3 = 3000 ms
    m.submit(flowEntry(7, 2000, 100, 10.0f, 1), 2000);
    m.tick(4999);
    TEST_ASSERT_TRUE(hw.on[7]);
    m.tick(5000);
    TEST_ASSERT_FALSE(hw.on[7]);
}

void test_shared_meter_credits_every_active_unit()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    m.submit(flowEntry(1, 0, 10, 11.0f, 0), 0);
    m.submit(flowEntry(2, 0, 10, 11.0f, 0), 0);
    TEST_ASSERT_EQUAL_UINT8(2, m.activeCount());

    hw.pulses[0] = 10;
    m.tick(10);
    TEST_ASSERT_FALSE(hw.on[1]);
    TEST_ASSERT_FALSE(hw.on[2]);
    TEST_ASSERT_EQUAL_UINT32(2, rec.completedCalls);
    TEST_ASSERT_EQUAL_UINT32(2, m.stats().completed);
}

void test_new_cycle_supersedes_unfinished_one()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    m.submit(timedEntry(1, 0, 1000), 0);

    CyclePlan plan;
    plan.pressMs = 500;
    plan.count = 1;
    plan.entries[0] = timedEntry(1, 500, 100);

    TEST_ASSERT_EQUAL_UINT8(0, m.submitCycle(plan, 500, false));
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().conflicts);

    TEST_ASSERT_EQUAL_UINT8(1, m.submitCycle(plan, 500, true));
    TEST_ASSERT_EQUAL_UINT32(1, m.stats().superseded);
    TEST_ASSERT_TRUE(m.state(1) == TaskState::Active);
    TEST_ASSERT_EQUAL_UINT32(2, hw.asserts[1]);
    TEST_ASSERT_EQUAL_UINT32(1, hw.deasserts[1]);
    TEST_ASSERT_TRUE(hw.on[1]);
}

void test_assert_failure_after_retries_marks_fault()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    hw.assertFailuresLeft = Limits::Irrigation::HwRetryCount;
    m.submit(timedEntry(8, 0, 100), 0);

    TEST_ASSERT_FALSE(hw.on[8]);
    TEST_ASSERT_TRUE(m.faulted(8));
    TEST_ASSERT_TRUE(m.state(8) == TaskState::Idle);
    TEST_ASSERT_TRUE(rec.last.outcome == ActuationOutcome::Fault);
    TEST_ASSERT_EQUAL_UINT32(1, rec.faultCalls);
    TEST_ASSERT_EQUAL_UINT8(8, rec.faultUnit);
    TEST_ASSERT_TRUE(rec.faultOp == HardwareOp::Assert);

    /// succeeds on the last attempt
    hw.assertFailuresLeft = Limits::Irrigation::HwRetryCount - 1;
    TEST_ASSERT_TRUE(m.submit(timedEntry(8, 10, 100), 10) == SubmitResult::Accepted);
    TEST_ASSERT_TRUE(hw.on[8]);
    TEST_ASSERT_FALSE(m.faulted(8));
}

void test_failed_deassert_is_retried_until_released()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);
    attach(m);

    m.submit(timedEntry(9, 0, 5000), 0);
    hw.deassertFailuresLeft = Limits::Irrigation::HwRetryCount;

    TEST_ASSERT_TRUE(m.cancel(9, CancelReason::Stop, 10));
    TEST_ASSERT_TRUE(hw.on[9]);
    TEST_ASSERT_TRUE(m.isBusy(9));
    TEST_ASSERT_TRUE(m.submit(timedEntry(9, 10, 10), 10) == SubmitResult::Conflict);

    m.tick(20);
    m.tick(30);
    TEST_ASSERT_EQUAL_UINT32(1, rec.faultCalls);
    TEST_ASSERT_TRUE(rec.faultOp == HardwareOp::Deassert);
    TEST_ASSERT_TRUE(m.faulted(9));

    m.tick(40);
    TEST_ASSERT_FALSE(hw.on[9]);
    TEST_ASSERT_FALSE(m.isBusy(9));
    TEST_ASSERT_TRUE(m.state(9) == TaskState::Cancelled);
    TEST_ASSERT_EQUAL_UINT32(1, hw.deasserts[9]);
}

void test_cancel_all_counts_busy_slots()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);

    m.submit(timedEntry(1, 0, 1000), 0);
    m.submit(timedEntry(2, 500, 1000), 0);
    m.submit(timedEntry(3, 0, 10), 0);
    m.tick(10);   // unit 3 done

    TEST_ASSERT_EQUAL_UINT8(2, m.cancelAll(CancelReason::Stop, 20));
    for (uint8_t id = 1; id <= Limits::Irrigation::MaxUnits; ++id) {
        TEST_ASSERT_FALSE(hw.on[id]);
    }
}

void test_buzzer_mute_flags()
{
    FakeHardwareIO hw;
    ActuationManager m(hw);

    TEST_ASSERT_TRUE(m.beep(true, 300, BeepKind::Normal, 0));
    TEST_ASSERT_TRUE(hw.buzzer);
    m.tick(299);
    TEST_ASSERT_TRUE(hw.buzzer);
    m.tick(300);
    TEST_ASSERT_FALSE(hw.buzzer);

    m.setBuzzerMute(true, false);
    TEST_ASSERT_FALSE(m.beep(true, 300, BeepKind::Normal, 400));
    TEST_ASSERT_FALSE(hw.buzzer);
    TEST_ASSERT_TRUE(m.beep(true, 300, BeepKind::Maintenance, 400));
    TEST_ASSERT_TRUE(hw.buzzer);
    TEST_ASSERT_TRUE(m.beep(false, 0, BeepKind::Maintenance, 450));
    TEST_ASSERT_FALSE(hw.buzzer);

    m.setBuzzerMute(false, true);
    TEST_ASSERT_FALSE(m.beep(true, 300, BeepKind::Maintenance, 500));
    TEST_ASSERT_FALSE(m.beep(true, 300, BeepKind::Normal, 500));
    TEST_ASSERT_FALSE(hw.buzzer);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_timed_actuation_runs_for_exact_duration);
    RUN_TEST(test_busy_unit_rejects_new_entry);
    RUN_TEST(test_start_in_the_past_fires_immediately);
    RUN_TEST(test_cancel_active_deasserts_at_once);
    RUN_TEST(test_cancel_scheduled_never_touches_output);
    RUN_TEST(test_tramline_cancels_and_rejects);
    RUN_TEST(test_flow_completes_on_target_pulses);
    RUN_TEST(test_flow_ceiling_stops_a_stalled_meter);
    RUN_TEST(test_shared_meter_credits_every_active_unit);
    RUN_TEST(test_new_cycle_supersedes_unfinished_one);
    RUN_TEST(test_assert_failure_after_retries_marks_fault);
    RUN_TEST(test_failed_deassert_is_retried_until_released);
    RUN_TEST(test_cancel_all_counts_busy_slots);
    RUN_TEST(test_buzzer_mute_flags);
    return UNITY_END();
}
