#pragma once
/**
 * @file ControlCommand.h
 * @brief Closed set of requests accepted by the irrigation actor.
 */

#include <stdint.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"

enum class ControlKind : uint8_t {
    SwitchEdge = 0,   ///< falling edge from a switch ISR
    SimulatePress,
    SetRunning,
    Stop,             ///< unitId 0 = every unit
    Tramline,
    TramlineClear,
    TramlinePreset,
    CalibrateTimed,
    CalibrateStop,
    CalibrateFlow,
    Buzzer,
    Simulate
};

enum class TramSide : uint8_t { None = 0, Left, Right };

struct SwitchEdgeArgs { uint8_t switchId; uint32_t tsMs; };
struct SwitchArgs { uint8_t switchId; };
struct OnOffArgs { bool on; };
struct UnitArgs { uint8_t unitId; };
struct TramlineArgs { uint8_t unitId; bool off; };
struct TramPresetArgs { TramSide side; };
struct CalTimedArgs { uint8_t unitId; uint32_t ms; };
struct CalFlowArgs { uint8_t unitId; float targetMl; };
struct BuzzerArgs { bool on; uint32_t ms; bool maintenance; };

/**
 * @brief Tagged request, trivially copyable so it fits a FreeRTOS queue item.
 *
 * Only the member matching `kind` is meaningful.
 */
struct ControlCommand {
    ControlKind kind;
    union {
        SwitchEdgeArgs edge;       ///< SwitchEdge
        SwitchArgs press;          ///< SimulatePress
        OnOffArgs onOff;           ///< SetRunning, Simulate
        UnitArgs unit;             ///< Stop, CalibrateStop
        TramlineArgs tram;         ///< Tramline
        TramPresetArgs preset;     ///< TramlinePreset
        CalTimedArgs calTimed;     ///< CalibrateTimed
        CalFlowArgs calFlow;       ///< CalibrateFlow
        BuzzerArgs buzzer;         ///< Buzzer
    } u;

    static ControlCommand switchEdge(uint8_t switchId, uint32_t tsMs);
    static ControlCommand simulatePress(uint8_t switchId);
    static ControlCommand setRunning(bool on);
    static ControlCommand stop(uint8_t unitId);
    static ControlCommand tramline(uint8_t unitId, bool off);
    static ControlCommand tramlineClear();
    static ControlCommand tramlinePreset(TramSide side);
    static ControlCommand calibrateTimed(uint8_t unitId, uint32_t ms);
    static ControlCommand calibrateStop(uint8_t unitId);
    static ControlCommand calibrateFlow(uint8_t unitId, float targetMl);
    static ControlCommand buzzer(bool on, uint32_t ms, bool maintenance);
    static ControlCommand simulate(bool on);
};

/// Inline: called from the switch ISR, must not land in flash.
inline ControlCommand ControlCommand::switchEdge(uint8_t switchId, uint32_t tsMs)
{
    ControlCommand c;
    c.kind = ControlKind::SwitchEdge;
    c.u.edge.switchId = switchId;
    c.u.edge.tsMs = tsMs;
    return c;
}

const char* controlKindStr(ControlKind kind);
const char* tramSideStr(TramSide side);

/**
 * @name Command argument parsers
 * Return true and fill `out` on success; on failure `err` names the rejected
 * field and `out` is left untouched.
 * @{
 */
bool parsePressArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseRunArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseStopArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseTramArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseTramPresetArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseCalArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseBuzzerArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
bool parseSimulateArgs(JsonObjectConst args, ControlCommand& out, ErrorCode& err);
/** @} */
