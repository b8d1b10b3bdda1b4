#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers a multi-module patch). */
constexpr size_t JsonConfigApplyBuf = 2048;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 192;
/** @brief Maximum number of distinct config modules listed by `ConfigStore::toJson`. */
constexpr uint8_t MaxConfigModules = 32;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Maximum number of log sinks registered in `LogSinkRegistry`. */
constexpr uint8_t MaxLogSinks = 4;
/** @brief Reply buffer of a command executed through `CommandRegistry`. */
constexpr size_t CmdReplyBuf = 768;
/** @brief FreeRTOS event queue length used by `EventBus` (`EventBus::QUEUE_LENGTH`). */
constexpr uint8_t EventQueueLen = 24;
/** @brief Period of the NVS write summary log emitted by `ConfigStore::logNvsWriteSummaryIfDue`. */
constexpr uint32_t NvsSummaryPeriodMs = 60000;
/** @brief Timeout used when a reader takes the `ConfigStore` lock to copy a settings snapshot. */
constexpr uint32_t ConfigLockTimeoutMs = 50;

/** @brief Serial console line protocol buffers (`SerialConsoleModule`). */
namespace Console {
/** @brief Longest accepted input line, terminator excluded. */
constexpr size_t LineBuf = 512;
/** @brief Command name copy. */
constexpr size_t CmdName = 48;
/** @brief Re-serialized `args` object handed to `CommandRegistry`. */
constexpr size_t CmdArgs = 256;
/** @brief Acknowledgement line wrapping a command reply. */
constexpr size_t AckBuf = CmdReplyBuf + 96;
}  // namespace Console

/** @brief Irrigation core capacities and timings. */
namespace Irrigation {

/** @brief Number of output units driven by `IrrigationModule` (ids `1..MaxUnits`). */
constexpr uint8_t MaxUnits = 11;
/** @brief Number of momentary switches (`M1..M3`). */
constexpr uint8_t MaxSwitches = 3;
/** @brief Number of independent flow-meter inputs read by `ActuationManager`. */
constexpr uint8_t MaxFlowSources = 2;
/** @brief Hard cap for `PressHistory` entries. */
constexpr uint8_t PressHistoryMax = 20;
/** @brief FreeRTOS queue length for `ControlCommand` items posted to `IrrigationModule`. */
constexpr uint8_t CmdQueueLen = 16;
/** @brief JSON capacity for command args parsing in `ControlCommand` helpers. */
constexpr size_t JsonCmdBuf = 256;
/** @brief Consecutive assert attempts before a unit is marked faulted. */
constexpr uint8_t HwRetryCount = 3;
/** @brief Lower bound of the flow-mode safety ceiling in ms. */
constexpr uint32_t FlowCeilingMinMs = 1000;
/** @brief Scheduler tick of the irrigation task loop in ms. */
constexpr uint32_t TickMs = 5;
/** @brief Irrigation task stack size returned by `IrrigationModule::taskStackSize`. */
constexpr uint16_t TaskStackSize = 6144;

}  // namespace Irrigation

}  // namespace Limits
