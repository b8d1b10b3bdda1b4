#pragma once
/**
 * @file IrrigationModule.h
 * @brief Irrigation actor: presses in, timed valve actuations out.
 */

#include <atomic>
#include "Core/Module.h"
#include "Core/CommandRegistry.h"
#include "Core/ConfigTypes.h"
#include "Core/NvsKeys.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Modules/IrrigationModule/IrrigationTypes.h"
#include "Modules/IrrigationModule/IrrigationModuleDataModel.h"
#include "Modules/IrrigationModule/ControlCommand.h"
#include "Modules/IrrigationModule/TramlineSet.h"
#include "Modules/IrrigationModule/Inputs/PressTracker.h"
#include "Modules/IrrigationModule/Timing/DelayEstimator.h"
#include "Modules/IrrigationModule/Actuation/ActuationManager.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

/**
 * @brief Single owner of press history, tramline set and actuation slots.
 *
 * Every mutation arrives as a ControlCommand on one FreeRTOS queue, from the
 * switch ISR or from command handlers running on other tasks, and is applied
 * by this module's task. Settings are read from ConfigStore under its lock,
 * one consistent snapshot per planning pass.
 */
class IrrigationModule : public Module {
public:
    explicit IrrigationModule(HardwareIO& hw);

    const char* moduleId() const override { return "irrigation"; }
    const char* taskName() const override { return "Irrigation"; }
    BaseType_t taskCore() const override { return 1; }
    UBaseType_t taskPriority() const override { return 3; }
    uint16_t taskStackSize() const override { return Limits::Irrigation::TaskStackSize; }
    uint32_t loopDelayMs() const override { return Limits::Irrigation::TickMs; }

    uint8_t dependencyCount() const override { return 5; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "eventbus";
        if (i == 2) return "datastore";
        if (i == 3) return "cmd";
        if (i == 4) return "config";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief Queue a command from task context. False when the queue is full. */
    bool post(const ControlCommand& cmd);

    /** @brief SwitchEdgeCallback for the GPIO driver (interrupt context). */
    static void onSwitchEdgeIsr(void* ctx, uint8_t switchId, uint32_t tsMs);

private:
    /// `irrigation` config module
    struct GlobalSettings {
        bool running = false;
        float targetMl = 0.0f;
        uint8_t deliveryMode = 0;
        uint8_t pattern = 0;
        int32_t diagStepMs = 0;
        bool supersede = true;
        float flowCeilMult = 0.0f;
        bool buzzerMuted = false;
        bool buzzerHardMute = false;
    };

    struct PressSettings {
        int32_t windowMs = 0;
        uint8_t cap = 0;
        int32_t debounceMs = 0;
        int32_t simReleaseMs = 0;
    };

    void registerConfig_(ConfigStore& cfg);
    void registerCommands_();
    void loadDefaults_();

    bool takeSnapshot_(IrrigationSnapshot& out) const;
    bool readAutoDelay_(AutoDelayConfig& out) const;
    void applySettings_(uint32_t nowMs);
    void applyRunning_(bool running, uint32_t nowMs);

    void handleCommand_(const ControlCommand& cmd, uint32_t nowMs);
    void onPress_(uint8_t switchId, uint32_t tsMs, bool simulated, uint32_t nowMs);
    void runCycle_(uint32_t pressMs, uint32_t nowMs);
    void setTramline_(uint8_t unitId, bool off, uint32_t nowMs);
    void applyTramMask_(uint16_t mask, uint32_t nowMs);
    void calibrate_(const ControlCommand& cmd, uint32_t nowMs);
    void tickSimulator_(uint32_t nowMs);
    void tickEstimator_(uint32_t nowMs);
    void publishSlots_();
    void publishCounters_();

    bool switchEnabled_(uint8_t switchId) const;
    bool unitConfig_(uint8_t unitId, UnitConfig& out) const;

    static void onConfigChangedStatic_(const Event& e, void* user);
    static void onCompletedStatic_(void* ctx, const ActuationReport& report);
    static void onFaultStatic_(void* ctx, uint8_t unitId, HardwareOp op);
    void onCompleted_(const ActuationReport& report);
    void onFault_(uint8_t unitId, HardwareOp op);

    bool postOrReply_(const ControlCommand& cmd, const char* where, char* reply, size_t replyLen);
    static bool replyQueued_(const ControlCommand& cmd, char* reply, size_t replyLen);

    using ArgsParser = bool (*)(JsonObjectConst, ControlCommand&, ErrorCode&);
    bool handleParsed_(const CommandRequest& req, ArgsParser parse, bool argsRequired,
                       const char* where, char* reply, size_t replyLen);

    static bool cmdPress_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdRun_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStop_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdTram_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdTramClear_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdTramPreset_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdCal_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdBuzzer_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSimulate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdStatus_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdPlan_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

    HardwareIO& hw_;
    ActuationManager actuation_;
    PressTracker presses_;
    DelayEstimator estimator_;
    TramlineSet tram_;

    QueueHandle_t cmdQueue_ = nullptr;
    std::atomic<uint32_t> droppedEdges_{0};
    std::atomic<bool> settingsDirty_{true};

    const LogHubService* logHub_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    EventBus* eventBus_ = nullptr;
    DataStore* dataStore_ = nullptr;
    ConfigStore* cfgStore_ = nullptr;

    bool lastRunning_ = false;
    bool simulating_ = false;
    uint32_t nextSimPressMs_ = 0;
    uint32_t cycleId_ = 0;

    /// settings storage, registered in ConfigStore
    GlobalSettings global_{};
    AutoDelayConfig autoDelay_{};
    int32_t estimatorTickMs_ = 0;
    PressSettings pressCfg_{};
    MomentaryConfig momentary_[Limits::Irrigation::MaxSwitches]{};
    UnitConfig units_[Limits::Irrigation::MaxUnits]{};
    int32_t tramLeftMask_ = 0;
    int32_t tramRightMask_ = 0;

    ConfigVariable<bool,0> runningVar_{
        nullptr, "running", "irrigation", ConfigType::Bool,
        &global_.running, ConfigPersistence::Runtime, 0
    };
    ConfigVariable<float,0> targetMlVar_{
        NVS_KEY(NvsKeys::Irrigation::TargetMl), "target_ml", "irrigation", ConfigType::Float,
        &global_.targetMl, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<uint8_t,0> deliveryModeVar_{
        NVS_KEY(NvsKeys::Irrigation::DeliveryMode), "delivery_mode", "irrigation", ConfigType::UInt8,
        &global_.deliveryMode, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<uint8_t,0> patternVar_{
        NVS_KEY(NvsKeys::Irrigation::Pattern), "pattern", "irrigation", ConfigType::UInt8,
        &global_.pattern, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> diagStepVar_{
        NVS_KEY(NvsKeys::Irrigation::DiagonalStepMs), "diag_step_ms", "irrigation", ConfigType::Int32,
        &global_.diagStepMs, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<bool,0> supersedeVar_{
        NVS_KEY(NvsKeys::Irrigation::Supersede), "supersede", "irrigation", ConfigType::Bool,
        &global_.supersede, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<float,0> flowCeilMultVar_{
        NVS_KEY(NvsKeys::Irrigation::FlowCeilMult), "flow_ceil_mult", "irrigation", ConfigType::Float,
        &global_.flowCeilMult, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<bool,0> buzzerMutedVar_{
        NVS_KEY(NvsKeys::Irrigation::BuzzerMuted), "bz_muted", "irrigation", ConfigType::Bool,
        &global_.buzzerMuted, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<bool,0> buzzerHardMuteVar_{
        NVS_KEY(NvsKeys::Irrigation::BuzzerHardMute), "bz_hard_mute", "irrigation", ConfigType::Bool,
        &global_.buzzerHardMute, ConfigPersistence::Persistent, 0
    };

    ConfigVariable<bool,0> adEnabledVar_{
        NVS_KEY(NvsKeys::AutoDelay::Enabled), "enabled", "autodelay", ConfigType::Bool,
        &autoDelay_.enabled, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> adManualVar_{
        NVS_KEY(NvsKeys::AutoDelay::ManualMs), "manual_ms", "autodelay", ConfigType::Int32,
        &autoDelay_.manualMs, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> adGeomVar_{
        NVS_KEY(NvsKeys::AutoDelay::GeomLeadMs), "geom_lead_ms", "autodelay", ConfigType::Int32,
        &autoDelay_.geomLeadMs, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> adTickVar_{
        NVS_KEY(NvsKeys::AutoDelay::TickMs), "tick_ms", "autodelay", ConfigType::Int32,
        &estimatorTickMs_, ConfigPersistence::Persistent, 0
    };

    ConfigVariable<int32_t,0> prWindowVar_{
        NVS_KEY(NvsKeys::Presses::WindowMs), "window_ms", "presses", ConfigType::Int32,
        &pressCfg_.windowMs, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<uint8_t,0> prCapVar_{
        NVS_KEY(NvsKeys::Presses::Cap), "cap", "presses", ConfigType::UInt8,
        &pressCfg_.cap, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> prDebounceVar_{
        NVS_KEY(NvsKeys::Presses::DebounceMs), "debounce_ms", "presses", ConfigType::Int32,
        &pressCfg_.debounceMs, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> prSimReleaseVar_{
        NVS_KEY(NvsKeys::Presses::SimReleaseMs), "sim_release_ms", "presses", ConfigType::Int32,
        &pressCfg_.simReleaseMs, ConfigPersistence::Persistent, 0
    };

    ConfigVariable<int32_t,0> tramLeftVar_{
        NVS_KEY(NvsKeys::TramPresets::LeftMask), "left_mask", "tram/presets", ConfigType::Int32,
        &tramLeftMask_, ConfigPersistence::Persistent, 0
    };
    ConfigVariable<int32_t,0> tramRightVar_{
        NVS_KEY(NvsKeys::TramPresets::RightMask), "right_mask", "tram/presets", ConfigType::Int32,
        &tramRightMask_, ConfigPersistence::Persistent, 0
    };

    /// per switch / per unit variables, names built in registerConfig_
    char momModuleName_[Limits::Irrigation::MaxSwitches][8]{};
    char nvsMomEnabledKey_[Limits::Irrigation::MaxSwitches][8]{};
    char nvsMomOffsetKey_[Limits::Irrigation::MaxSwitches][8]{};
    ConfigVariable<bool,0> momEnabledVar_[Limits::Irrigation::MaxSwitches]{};
    ConfigVariable<uint8_t,0> momOffsetVar_[Limits::Irrigation::MaxSwitches]{};

    char unitModuleName_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitEnabledKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitGroupKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitMomKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitOffsetKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitDelayKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitModeKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitPpcKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitKKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitMsPerMlKey_[Limits::Irrigation::MaxUnits][10]{};
    char nvsUnitFlowSrcKey_[Limits::Irrigation::MaxUnits][10]{};
    ConfigVariable<bool,0> unitEnabledVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<uint8_t,0> unitGroupVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<uint8_t,0> unitMomVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<uint8_t,0> unitOffsetVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<int32_t,0> unitDelayVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<uint8_t,0> unitModeVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<int32_t,0> unitPpcVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<int32_t,0> unitKVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<float,0> unitMsPerMlVar_[Limits::Irrigation::MaxUnits]{};
    ConfigVariable<uint8_t,0> unitFlowSrcVar_[Limits::Irrigation::MaxUnits]{};
};
