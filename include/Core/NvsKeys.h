#pragma once
/**
 * @file NvsKeys.h
 * @brief Centralized NVS key constants used by ConfigStore-registered variables.
 */

namespace NvsKeys {

/** @brief Preferences namespace opened at boot (`main.cpp`). */
constexpr char StorageNamespace[] = "evencrop"; // Preferences namespace name used at boot to open the firmware NVS partition.

namespace Irrigation {
constexpr char TargetMl[] = "ir_tgt"; // Irrigation module persisted key for field `target_ml`.
constexpr char DeliveryMode[] = "ir_dmode"; // Irrigation module persisted key for field `delivery_mode`.
constexpr char Pattern[] = "ir_pat"; // Irrigation module persisted key for field `pattern`.
constexpr char DiagonalStepMs[] = "ir_diag"; // Irrigation module persisted key for field `diag_step_ms`.
constexpr char Supersede[] = "ir_supsd"; // Irrigation module persisted key for field `supersede`.
constexpr char FlowCeilMult[] = "ir_fcmul"; // Irrigation module persisted key for field `flow_ceil_mult`.
constexpr char BuzzerMuted[] = "ir_bzmut"; // Irrigation module persisted key for field `bz_muted`.
constexpr char BuzzerHardMute[] = "ir_bzhmt"; // Irrigation module persisted key for field `bz_hard_mute`.
}  // namespace Irrigation

namespace AutoDelay {
constexpr char Enabled[] = "ad_en"; // Auto-delay persisted key for field `enabled`.
constexpr char ManualMs[] = "ad_man"; // Auto-delay persisted key for field `manual_ms`.
constexpr char GeomLeadMs[] = "ad_geom"; // Auto-delay persisted key for field `geom_lead_ms`.
constexpr char TickMs[] = "ad_tick"; // Auto-delay persisted key for field `tick_ms`.
}  // namespace AutoDelay

namespace Presses {
constexpr char WindowMs[] = "pr_win"; // Press tracker persisted key for field `window_ms`.
constexpr char Cap[] = "pr_cap"; // Press tracker persisted key for field `cap`.
constexpr char DebounceMs[] = "pr_deb"; // Press tracker persisted key for field `debounce_ms`.
constexpr char SimReleaseMs[] = "pr_simr"; // Press tracker persisted key for field `sim_release_ms`.
}  // namespace Presses

namespace TramPresets {
constexpr char LeftMask[] = "tp_left"; // Tramline preset persisted key for field `left_mask`.
constexpr char RightMask[] = "tp_right"; // Tramline preset persisted key for field `right_mask`.
}  // namespace TramPresets

namespace Momentary {
/** @brief Momentary switch key templates (`%u` = switch id 1..3). */
constexpr char EnabledFmt[] = "m%uen"; // Momentary switch key template; `%u` is replaced by switch id before NVS access.
constexpr char OffsetFmt[] = "m%uoff"; // Momentary switch key template; `%u` is replaced by switch id before NVS access.
}  // namespace Momentary

namespace Unit {
/** @brief Unit key templates (`%u` = unit id 1..11). */
constexpr char EnabledFmt[] = "u%uen"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char GroupFmt[] = "u%ugrp"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char MomentaryFmt[] = "u%umom"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char OffsetFmt[] = "u%uoff"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char DelayFmt[] = "u%udly"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char ModeFmt[] = "u%umode"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char PulsesPerCycleFmt[] = "u%uppc"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char KFactorFmt[] = "u%uk"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char MsPerMlFmt[] = "u%umspm"; // Unit key template; `%u` is replaced by unit id before NVS access.
constexpr char FlowSourceFmt[] = "u%ufsrc"; // Unit key template; `%u` is replaced by unit id before NVS access.
}  // namespace Unit

}  // namespace NvsKeys
