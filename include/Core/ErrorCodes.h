#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    UnknownCmd = 0,
    BadCmdJson,
    MissingCmd,
    CmdServiceUnavailable,
    ArgsTooLarge,
    CmdHandlerFailed,
    BadCfgJson,
    CfgServiceUnavailable,
    CfgApplyFailed,
    CfgTruncated,
    MissingArgs,
    MissingUnit,
    BadUnit,
    MissingValue,
    UnknownSwitch,
    InvalidMode,
    InvalidBool,
    NotReady,
    NotRunning,
    QueueFull,
    ActuationConflict,
    HardwareFault,
    Failed
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::BadCmdJson: return "BadCmdJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::CmdServiceUnavailable: return "CmdServiceUnavailable";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::CmdHandlerFailed: return "CmdHandlerFailed";
    case ErrorCode::BadCfgJson: return "BadCfgJson";
    case ErrorCode::CfgServiceUnavailable: return "CfgServiceUnavailable";
    case ErrorCode::CfgApplyFailed: return "CfgApplyFailed";
    case ErrorCode::CfgTruncated: return "CfgTruncated";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::MissingUnit: return "MissingUnit";
    case ErrorCode::BadUnit: return "BadUnit";
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::UnknownSwitch: return "UnknownSwitch";
    case ErrorCode::InvalidMode: return "InvalidMode";
    case ErrorCode::InvalidBool: return "InvalidBool";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::NotRunning: return "NotRunning";
    case ErrorCode::QueueFull: return "QueueFull";
    case ErrorCode::ActuationConflict: return "ActuationConflict";
    case ErrorCode::HardwareFault: return "HardwareFault";
    case ErrorCode::Failed: return "Failed";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::CfgServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::QueueFull:
    case ErrorCode::CfgTruncated:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}

static inline bool writeErrorJsonWithUnit(char* out, size_t outLen, ErrorCode code, const char* where, uint8_t unitId)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"unit\":%u,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        (unsigned)unitId,
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
