/**
 * @file ControlCommand.cpp
 * @brief Implementation file.
 */

#include "Modules/IrrigationModule/ControlCommand.h"
#include "Core/SystemLimits.h"
#include "Domain/IrrigationDefaults.h"
#include <math.h>
#include <stdlib.h>
#include <string.h>

ControlCommand ControlCommand::simulatePress(uint8_t switchId)
{
    ControlCommand c{};
    c.kind = ControlKind::SimulatePress;
    c.u.press.switchId = switchId;
    return c;
}

ControlCommand ControlCommand::setRunning(bool on)
{
    ControlCommand c{};
    c.kind = ControlKind::SetRunning;
    c.u.onOff.on = on;
    return c;
}

ControlCommand ControlCommand::stop(uint8_t unitId)
{
    ControlCommand c{};
    c.kind = ControlKind::Stop;
    c.u.unit.unitId = unitId;
    return c;
}

ControlCommand ControlCommand::tramline(uint8_t unitId, bool off)
{
    ControlCommand c{};
    c.kind = ControlKind::Tramline;
    c.u.tram.unitId = unitId;
    c.u.tram.off = off;
    return c;
}

ControlCommand ControlCommand::tramlineClear()
{
    ControlCommand c{};
    c.kind = ControlKind::TramlineClear;
    return c;
}

ControlCommand ControlCommand::tramlinePreset(TramSide side)
{
    ControlCommand c{};
    c.kind = ControlKind::TramlinePreset;
    c.u.preset.side = side;
    return c;
}

ControlCommand ControlCommand::calibrateTimed(uint8_t unitId, uint32_t ms)
{
    ControlCommand c{};
    c.kind = ControlKind::CalibrateTimed;
    c.u.calTimed.unitId = unitId;
    c.u.calTimed.ms = ms;
    return c;
}

ControlCommand ControlCommand::calibrateStop(uint8_t unitId)
{
    ControlCommand c{};
    c.kind = ControlKind::CalibrateStop;
    c.u.unit.unitId = unitId;
    return c;
}

ControlCommand ControlCommand::calibrateFlow(uint8_t unitId, float targetMl)
{
    ControlCommand c{};
    c.kind = ControlKind::CalibrateFlow;
    c.u.calFlow.unitId = unitId;
    c.u.calFlow.targetMl = targetMl;
    return c;
}

ControlCommand ControlCommand::buzzer(bool on, uint32_t ms, bool maintenance)
{
    ControlCommand c{};
    c.kind = ControlKind::Buzzer;
    c.u.buzzer.on = on;
    c.u.buzzer.ms = ms;
    c.u.buzzer.maintenance = maintenance;
    return c;
}

ControlCommand ControlCommand::simulate(bool on)
{
    ControlCommand c{};
    c.kind = ControlKind::Simulate;
    c.u.onOff.on = on;
    return c;
}

const char* controlKindStr(ControlKind kind)
{
    switch (kind) {
    case ControlKind::SwitchEdge: return "switch_edge";
    case ControlKind::SimulatePress: return "press";
    case ControlKind::SetRunning: return "run";
    case ControlKind::Stop: return "stop";
    case ControlKind::Tramline: return "tram";
    case ControlKind::TramlineClear: return "tram_clear";
    case ControlKind::TramlinePreset: return "tram_preset";
    case ControlKind::CalibrateTimed: return "cal_timed";
    case ControlKind::CalibrateStop: return "cal_stop";
    case ControlKind::CalibrateFlow: return "cal_flow";
    case ControlKind::Buzzer: return "buzzer";
    case ControlKind::Simulate: return "simulate";
    default: return "unknown";
    }
}

const char* tramSideStr(TramSide side)
{
    if (side == TramSide::Left) return "left";
    if (side == TramSide::Right) return "right";
    return "none";
}

static bool readBool_(JsonVariantConst v, bool& out)
{
    if (v.is<bool>()) {
        out = v.as<bool>();
        return true;
    }
    if (v.is<int32_t>()) {
        out = (v.as<int32_t>() != 0);
        return true;
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (!s) return false;
        if (strcmp(s, "true") == 0 || strcmp(s, "on") == 0 || strcmp(s, "1") == 0) {
            out = true;
            return true;
        }
        if (strcmp(s, "false") == 0 || strcmp(s, "off") == 0 || strcmp(s, "0") == 0) {
            out = false;
            return true;
        }
    }
    return false;
}

static bool readNumber_(JsonVariantConst v, double& out)
{
    if (v.is<int32_t>() || v.is<uint32_t>() || v.is<float>() || v.is<double>()) {
        out = v.as<double>();
        return isfinite(out);
    }
    if (v.is<const char*>()) {
        const char* s = v.as<const char*>();
        if (!s || s[0] == '\0') return false;
        char* end = nullptr;
        out = strtod(s, &end);
        return end && *end == '\0' && isfinite(out);
    }
    return false;
}

static bool readUnitId_(JsonObjectConst args, uint8_t& out, ErrorCode& err)
{
    if (!args.containsKey("unit")) {
        err = ErrorCode::MissingUnit;
        return false;
    }
    if (!args["unit"].is<uint8_t>()) {
        err = ErrorCode::BadUnit;
        return false;
    }
    const uint8_t id = args["unit"].as<uint8_t>();
    if (id < 1 || id > Limits::Irrigation::MaxUnits) {
        err = ErrorCode::BadUnit;
        return false;
    }
    out = id;
    return true;
}

static bool readRequiredBool_(JsonObjectConst args, const char* key, bool& out, ErrorCode& err)
{
    if (!args.containsKey(key)) {
        err = ErrorCode::MissingValue;
        return false;
    }
    if (!readBool_(args[key], out)) {
        err = ErrorCode::InvalidBool;
        return false;
    }
    return true;
}

bool parsePressArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    uint8_t sw = 1;
    if (!args.isNull() && args.containsKey("switch")) {
        if (!args["switch"].is<uint8_t>()) {
            err = ErrorCode::UnknownSwitch;
            return false;
        }
        sw = args["switch"].as<uint8_t>();
    }
    if (sw < 1 || sw > Limits::Irrigation::MaxSwitches) {
        err = ErrorCode::UnknownSwitch;
        return false;
    }
    out = ControlCommand::simulatePress(sw);
    return true;
}

bool parseRunArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    bool on = false;
    if (!readRequiredBool_(args, "on", on, err)) return false;
    out = ControlCommand::setRunning(on);
    return true;
}

bool parseStopArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    uint8_t id = 0;
    if (!args.isNull() && args.containsKey("unit")) {
        if (!readUnitId_(args, id, err)) return false;
    }
    out = ControlCommand::stop(id);
    return true;
}

bool parseTramArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    uint8_t id = 0;
    if (!readUnitId_(args, id, err)) return false;
    bool off = false;
    if (!readRequiredBool_(args, "off", off, err)) return false;
    out = ControlCommand::tramline(id, off);
    return true;
}

bool parseTramPresetArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    if (!args.containsKey("side")) {
        err = ErrorCode::MissingValue;
        return false;
    }
    const char* side = args["side"].as<const char*>();
    if (!side) {
        err = ErrorCode::InvalidMode;
        return false;
    }
    if (strcmp(side, "left") == 0) out = ControlCommand::tramlinePreset(TramSide::Left);
    else if (strcmp(side, "right") == 0) out = ControlCommand::tramlinePreset(TramSide::Right);
    else if (strcmp(side, "none") == 0) out = ControlCommand::tramlinePreset(TramSide::None);
    else {
        err = ErrorCode::InvalidMode;
        return false;
    }
    return true;
}

bool parseCalArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    uint8_t id = 0;
    if (!readUnitId_(args, id, err)) return false;

    const char* mode = "timed";
    if (args.containsKey("mode")) {
        mode = args["mode"].as<const char*>();
        if (!mode) {
            err = ErrorCode::InvalidMode;
            return false;
        }
    }

    if (strcmp(mode, "stop") == 0) {
        out = ControlCommand::calibrateStop(id);
        return true;
    }

    if (strcmp(mode, "timed") == 0) {
        uint32_t ms = IrrigationDefaults::CalibrationTimedMs;
        if (args.containsKey("ms")) {
            double v = 0.0;
            if (!readNumber_(args["ms"], v)) {
                err = ErrorCode::MissingValue;
                return false;
            }
            /// out-of-range durations fall back to the default
            if (v >= 1.0 && v <= (double)IrrigationDefaults::CalibrationMaxMs) ms = (uint32_t)lround(v);
        }
        out = ControlCommand::calibrateTimed(id, ms);
        return true;
    }

    if (strcmp(mode, "flow") == 0) {
        float ml = IrrigationDefaults::CalibrationFlowTargetMl;
        if (args.containsKey("ml")) {
            double v = 0.0;
            if (!readNumber_(args["ml"], v)) {
                err = ErrorCode::MissingValue;
                return false;
            }
            if (v < (double)IrrigationDefaults::MinTargetMl) ml = IrrigationDefaults::MinTargetMl;
            else if (v > (double)IrrigationDefaults::MaxTargetMl) ml = IrrigationDefaults::MaxTargetMl;
            else ml = (float)v;
        }
        out = ControlCommand::calibrateFlow(id, ml);
        return true;
    }

    err = ErrorCode::InvalidMode;
    return false;
}

bool parseBuzzerArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    bool on = false;
    if (!readRequiredBool_(args, "on", on, err)) return false;

    uint32_t ms = 0;
    if (args.containsKey("ms")) {
        double v = 0.0;
        if (!readNumber_(args["ms"], v)) {
            err = ErrorCode::MissingValue;
            return false;
        }
        ms = (v > 0.0) ? (uint32_t)lround(v) : 0U;
    }

    bool maintenance = false;
    if (args.containsKey("maintenance")) {
        if (!readBool_(args["maintenance"], maintenance)) {
            err = ErrorCode::InvalidBool;
            return false;
        }
    }

    out = ControlCommand::buzzer(on, ms, maintenance);
    return true;
}

bool parseSimulateArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err)
{
    bool on = false;
    if (!readRequiredBool_(args, "on", on, err)) return false;
    out = ControlCommand::simulate(on);
    return true;
}
