#include <unity.h>
#include <ArduinoJson.h>
#include <string.h>

#include "Modules/IrrigationModule/ControlCommand.h"
#include "Domain/IrrigationDefaults.h"

void setUp() {}
void tearDown() {}

static StaticJsonDocument<256> doc;

static JsonObjectConst argsOf(const char* json)
{
    doc.clear();
    if (deserializeJson(doc, json)) return JsonObjectConst();
    return doc.as<JsonObjectConst>();
}

void test_press_defaults_to_first_switch()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(parsePressArgs(JsonObjectConst(), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::SimulatePress);
    TEST_ASSERT_EQUAL_UINT8(1, c.u.press.switchId);

    TEST_ASSERT_TRUE(parsePressArgs(argsOf("{\"switch\":3}"), c, err));
    TEST_ASSERT_EQUAL_UINT8(3, c.u.press.switchId);

    TEST_ASSERT_FALSE(parsePressArgs(argsOf("{\"switch\":4}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::UnknownSwitch);
}

void test_run_requires_a_bool()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_FALSE(parseRunArgs(JsonObjectConst(), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::MissingValue);

    TEST_ASSERT_FALSE(parseRunArgs(argsOf("{\"on\":\"maybe\"}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::InvalidBool);

    TEST_ASSERT_TRUE(parseRunArgs(argsOf("{\"on\":\"on\"}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::SetRunning);
    TEST_ASSERT_TRUE(c.u.onOff.on);

    TEST_ASSERT_TRUE(parseRunArgs(argsOf("{\"on\":0}"), c, err));
    TEST_ASSERT_FALSE(c.u.onOff.on);
}

void test_stop_without_unit_targets_everything()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(parseStopArgs(JsonObjectConst(), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::Stop);
    TEST_ASSERT_EQUAL_UINT8(0, c.u.unit.unitId);

    TEST_ASSERT_TRUE(parseStopArgs(argsOf("{\"unit\":11}"), c, err));
    TEST_ASSERT_EQUAL_UINT8(11, c.u.unit.unitId);

    TEST_ASSERT_FALSE(parseStopArgs(argsOf("{\"unit\":12}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::BadUnit);
}

void test_tram_validates_unit_and_flag()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_FALSE(parseTramArgs(argsOf("{\"off\":true}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::MissingUnit);

    TEST_ASSERT_FALSE(parseTramArgs(argsOf("{\"unit\":0,\"off\":true}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::BadUnit);

    TEST_ASSERT_FALSE(parseTramArgs(argsOf("{\"unit\":\"two\",\"off\":true}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::BadUnit);

    TEST_ASSERT_FALSE(parseTramArgs(argsOf("{\"unit\":2}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::MissingValue);

    TEST_ASSERT_TRUE(parseTramArgs(argsOf("{\"unit\":2,\"off\":true}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::Tramline);
    TEST_ASSERT_EQUAL_UINT8(2, c.u.tram.unitId);
    TEST_ASSERT_TRUE(c.u.tram.off);
}

void test_tram_preset_sides()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(parseTramPresetArgs(argsOf("{\"side\":\"left\"}"), c, err));
    TEST_ASSERT_TRUE(c.u.preset.side == TramSide::Left);
    TEST_ASSERT_TRUE(parseTramPresetArgs(argsOf("{\"side\":\"none\"}"), c, err));
    TEST_ASSERT_TRUE(c.u.preset.side == TramSide::None);

    TEST_ASSERT_FALSE(parseTramPresetArgs(argsOf("{\"side\":\"up\"}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::InvalidMode);
    TEST_ASSERT_EQUAL_STRING("right", tramSideStr(TramSide::Right));
}

void test_calibration_modes_and_defaults()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":1}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::CalibrateTimed);
    TEST_ASSERT_EQUAL_UINT32(IrrigationDefaults::CalibrationTimedMs, c.u.calTimed.ms);

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":1,\"mode\":\"timed\",\"ms\":\"2500\"}"), c, err));
    TEST_ASSERT_EQUAL_UINT32(2500, c.u.calTimed.ms);

    /// out of range falls back to the default duration
    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":1,\"ms\":9999999}"), c, err));
    TEST_ASSERT_EQUAL_UINT32(IrrigationDefaults::CalibrationTimedMs, c.u.calTimed.ms);

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":4,\"mode\":\"flow\",\"ml\":250}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::CalibrateFlow);
    TEST_ASSERT_EQUAL_UINT8(4, c.u.calFlow.unitId);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 250.0f, c.u.calFlow.targetMl);

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":4,\"mode\":\"flow\",\"ml\":0}"), c, err));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, IrrigationDefaults::MinTargetMl, c.u.calFlow.targetMl);

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":4,\"mode\":\"flow\",\"ml\":1e300}"), c, err));
    TEST_ASSERT_FLOAT_WITHIN(0.5f, IrrigationDefaults::MaxTargetMl, c.u.calFlow.targetMl);

    TEST_ASSERT_TRUE(parseCalArgs(argsOf("{\"unit\":4,\"mode\":\"stop\"}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::CalibrateStop);

    TEST_ASSERT_FALSE(parseCalArgs(argsOf("{\"unit\":4,\"mode\":\"pulse\"}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::InvalidMode);
}

void test_buzzer_args()
{
    ControlCommand c{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(parseBuzzerArgs(argsOf("{\"on\":true,\"ms\":250,\"maintenance\":true}"), c, err));
    TEST_ASSERT_TRUE(c.kind == ControlKind::Buzzer);
    TEST_ASSERT_TRUE(c.u.buzzer.on);
    TEST_ASSERT_EQUAL_UINT32(250, c.u.buzzer.ms);
    TEST_ASSERT_TRUE(c.u.buzzer.maintenance);

    TEST_ASSERT_TRUE(parseBuzzerArgs(argsOf("{\"on\":false,\"ms\":-5}"), c, err));
    TEST_ASSERT_EQUAL_UINT32(0, c.u.buzzer.ms);
    TEST_ASSERT_FALSE(c.u.buzzer.maintenance);

    TEST_ASSERT_FALSE(parseBuzzerArgs(argsOf("{\"on\":true,\"maintenance\":\"loud\"}"), c, err));
    TEST_ASSERT_TRUE(err == ErrorCode::InvalidBool);
}

void test_factories_set_kind_and_name()
{
    const ControlCommand e = ControlCommand::switchEdge(2, 12345);
    TEST_ASSERT_TRUE(e.kind == ControlKind::SwitchEdge);
    TEST_ASSERT_EQUAL_UINT8(2, e.u.edge.switchId);
    TEST_ASSERT_EQUAL_UINT32(12345, e.u.edge.tsMs);
    TEST_ASSERT_EQUAL_STRING("switch_edge", controlKindStr(e.kind));

    TEST_ASSERT_EQUAL_STRING("tram_clear", controlKindStr(ControlCommand::tramlineClear().kind));
    TEST_ASSERT_EQUAL_STRING("simulate", controlKindStr(ControlCommand::simulate(true).kind));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_press_defaults_to_first_switch);
    RUN_TEST(test_run_requires_a_bool);
    RUN_TEST(test_stop_without_unit_targets_everything);
    RUN_TEST(test_tram_validates_unit_and_flag);
    RUN_TEST(test_tram_preset_sides);
    RUN_TEST(test_calibration_modes_and_defaults);
    RUN_TEST(test_buzzer_args);
    RUN_TEST(test_factories_set_kind_and_name);
    return UNITY_END();
}
