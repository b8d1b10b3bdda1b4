/**
 * @file IrrigationModule.cpp
 * @brief Implementation file.
 */

#include "IrrigationModule.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"
#include "Domain/IrrigationDefaults.h"
#include "Modules/IrrigationModule/IrrigationRuntime.h"
#include "Modules/IrrigationModule/Timing/TimingPlanner.h"
#include "Modules/IrrigationModule/Actuation/DeliveryStatus.h"
#include <Arduino.h>
#include <math.h>
#include <string.h>
#define LOG_TAG "Irrigatn"
#include "Core/ModuleLog.h"

static constexpr uint8_t kMaxCommandsPerTick = 8;

static uint16_t maskFromConfig_(int32_t raw)
{
    return (uint16_t)((uint32_t)raw & ((1u << Limits::Irrigation::MaxUnits) - 1u));
}

IrrigationModule::IrrigationModule(HardwareIO& hw)
    : hw_(hw), actuation_(hw)
{
    loadDefaults_();
}

void IrrigationModule::loadDefaults_()
{
    global_.running = false;
    global_.targetMl = IrrigationDefaults::TargetMl;
    global_.deliveryMode = (uint8_t)DeliveryMode::Flow;
    global_.pattern = (uint8_t)TimingPattern::Diamond;
    global_.diagStepMs = IrrigationDefaults::DiagonalStepMs;
    global_.supersede = true;
    global_.flowCeilMult = IrrigationDefaults::FlowCeilingMultiplier;
    global_.buzzerMuted = false;
    global_.buzzerHardMute = false;

    autoDelay_.enabled = IrrigationDefaults::AutoDelayEnabled;
    autoDelay_.manualMs = IrrigationDefaults::ManualDelayMs;
    autoDelay_.geomLeadMs = IrrigationDefaults::GeomLeadMs;
    autoDelay_.currentMs = IrrigationDefaults::ManualDelayMs;
    estimatorTickMs_ = (int32_t)IrrigationDefaults::EstimatorTickMs;

    pressCfg_.windowMs = (int32_t)IrrigationDefaults::PressWindowMs;
    pressCfg_.cap = Limits::Irrigation::PressHistoryMax;
    pressCfg_.debounceMs = (int32_t)IrrigationDefaults::HardwareDebounceMs;
    pressCfg_.simReleaseMs = (int32_t)IrrigationDefaults::SimulatedReleaseMs;

    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) {
        momentary_[i].enabled = (i == IrrigationDefaults::DefaultMomentary - 1);
        momentary_[i].offsetPct = 0;
    }

    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        UnitConfig& u = units_[i];
        u.id = (uint8_t)(i + 1);
        u.enabled = (u.id <= IrrigationDefaults::EnabledUnitCount);
        /// ids impairs en A, pairs en B
        u.group = (u.id % 2 == 1) ? (uint8_t)UnitGroup::A : (uint8_t)UnitGroup::B;
        u.momentary = IrrigationDefaults::DefaultMomentary;
        u.legacyOffsetPct = 0;
        u.perDelayMs = 0;
        u.mode = (uint8_t)UnitDeliveryMode::Inherit;
        u.pulsesPerCycle = IrrigationDefaults::PulsesPerCycle;
        u.pulsesPerLiter = IrrigationDefaults::PulsesPerLiter;
        u.msPerMl = IrrigationDefaults::MsPerMl;
        u.flowSource = 0;
    }

    tramLeftMask_ = 0;
    tramRightMask_ = 0;
}

void IrrigationModule::registerConfig_(ConfigStore& cfg)
{
    bool ok = true;
    ok &= cfg.registerVar(runningVar_);
    ok &= cfg.registerVar(targetMlVar_);
    ok &= cfg.registerVar(deliveryModeVar_);
    ok &= cfg.registerVar(patternVar_);
    ok &= cfg.registerVar(diagStepVar_);
    ok &= cfg.registerVar(supersedeVar_);
    ok &= cfg.registerVar(flowCeilMultVar_);
    ok &= cfg.registerVar(buzzerMutedVar_);
    ok &= cfg.registerVar(buzzerHardMuteVar_);

    ok &= cfg.registerVar(adEnabledVar_);
    ok &= cfg.registerVar(adManualVar_);
    ok &= cfg.registerVar(adGeomVar_);
    ok &= cfg.registerVar(adTickVar_);

    ok &= cfg.registerVar(prWindowVar_);
    ok &= cfg.registerVar(prCapVar_);
    ok &= cfg.registerVar(prDebounceVar_);
    ok &= cfg.registerVar(prSimReleaseVar_);

    ok &= cfg.registerVar(tramLeftVar_);
    ok &= cfg.registerVar(tramRightVar_);

    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) {
        const unsigned sw = (unsigned)(i + 1);
        snprintf(momModuleName_[i], sizeof(momModuleName_[i]), "irr/m%u", sw);
        snprintf(nvsMomEnabledKey_[i], sizeof(nvsMomEnabledKey_[i]), NvsKeys::Momentary::EnabledFmt, sw);
        snprintf(nvsMomOffsetKey_[i], sizeof(nvsMomOffsetKey_[i]), NvsKeys::Momentary::OffsetFmt, sw);

        momEnabledVar_[i].nvsKey = nvsMomEnabledKey_[i];
        momEnabledVar_[i].jsonName = "enabled";
        momEnabledVar_[i].moduleName = momModuleName_[i];
        momEnabledVar_[i].type = ConfigType::Bool;
        momEnabledVar_[i].value = &momentary_[i].enabled;
        momEnabledVar_[i].persistence = ConfigPersistence::Persistent;
        momEnabledVar_[i].size = 0;
        ok &= cfg.registerVar(momEnabledVar_[i]);

        momOffsetVar_[i].nvsKey = nvsMomOffsetKey_[i];
        momOffsetVar_[i].jsonName = "offset_pct";
        momOffsetVar_[i].moduleName = momModuleName_[i];
        momOffsetVar_[i].type = ConfigType::UInt8;
        momOffsetVar_[i].value = &momentary_[i].offsetPct;
        momOffsetVar_[i].persistence = ConfigPersistence::Persistent;
        momOffsetVar_[i].size = 0;
        ok &= cfg.registerVar(momOffsetVar_[i]);
    }

    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        UnitConfig& u = units_[i];
        const unsigned id = (unsigned)u.id;

        snprintf(unitModuleName_[i], sizeof(unitModuleName_[i]), "irr/u%u", id);
        snprintf(nvsUnitEnabledKey_[i], sizeof(nvsUnitEnabledKey_[i]), NvsKeys::Unit::EnabledFmt, id);
        snprintf(nvsUnitGroupKey_[i], sizeof(nvsUnitGroupKey_[i]), NvsKeys::Unit::GroupFmt, id);
        snprintf(nvsUnitMomKey_[i], sizeof(nvsUnitMomKey_[i]), NvsKeys::Unit::MomentaryFmt, id);
        snprintf(nvsUnitOffsetKey_[i], sizeof(nvsUnitOffsetKey_[i]), NvsKeys::Unit::OffsetFmt, id);
        snprintf(nvsUnitDelayKey_[i], sizeof(nvsUnitDelayKey_[i]), NvsKeys::Unit::DelayFmt, id);
        snprintf(nvsUnitModeKey_[i], sizeof(nvsUnitModeKey_[i]), NvsKeys::Unit::ModeFmt, id);
        snprintf(nvsUnitPpcKey_[i], sizeof(nvsUnitPpcKey_[i]), NvsKeys::Unit::PulsesPerCycleFmt, id);
        snprintf(nvsUnitKKey_[i], sizeof(nvsUnitKKey_[i]), NvsKeys::Unit::KFactorFmt, id);
        snprintf(nvsUnitMsPerMlKey_[i], sizeof(nvsUnitMsPerMlKey_[i]), NvsKeys::Unit::MsPerMlFmt, id);
        snprintf(nvsUnitFlowSrcKey_[i], sizeof(nvsUnitFlowSrcKey_[i]), NvsKeys::Unit::FlowSourceFmt, id);

        unitEnabledVar_[i].nvsKey = nvsUnitEnabledKey_[i];
        unitEnabledVar_[i].jsonName = "enabled";
        unitEnabledVar_[i].moduleName = unitModuleName_[i];
        unitEnabledVar_[i].type = ConfigType::Bool;
        unitEnabledVar_[i].value = &u.enabled;
        unitEnabledVar_[i].persistence = ConfigPersistence::Persistent;
        unitEnabledVar_[i].size = 0;
        ok &= cfg.registerVar(unitEnabledVar_[i]);

        unitGroupVar_[i].nvsKey = nvsUnitGroupKey_[i];
        unitGroupVar_[i].jsonName = "group";
        unitGroupVar_[i].moduleName = unitModuleName_[i];
        unitGroupVar_[i].type = ConfigType::UInt8;
        unitGroupVar_[i].value = &u.group;
        unitGroupVar_[i].persistence = ConfigPersistence::Persistent;
        unitGroupVar_[i].size = 0;
        ok &= cfg.registerVar(unitGroupVar_[i]);

        unitMomVar_[i].nvsKey = nvsUnitMomKey_[i];
        unitMomVar_[i].jsonName = "momentary";
        unitMomVar_[i].moduleName = unitModuleName_[i];
        unitMomVar_[i].type = ConfigType::UInt8;
        unitMomVar_[i].value = &u.momentary;
        unitMomVar_[i].persistence = ConfigPersistence::Persistent;
        unitMomVar_[i].size = 0;
        ok &= cfg.registerVar(unitMomVar_[i]);

        unitOffsetVar_[i].nvsKey = nvsUnitOffsetKey_[i];
        unitOffsetVar_[i].jsonName = "offset_pct";
        unitOffsetVar_[i].moduleName = unitModuleName_[i];
        unitOffsetVar_[i].type = ConfigType::UInt8;
        unitOffsetVar_[i].value = &u.legacyOffsetPct;
        unitOffsetVar_[i].persistence = ConfigPersistence::Persistent;
        unitOffsetVar_[i].size = 0;
        ok &= cfg.registerVar(unitOffsetVar_[i]);

        unitDelayVar_[i].nvsKey = nvsUnitDelayKey_[i];
        unitDelayVar_[i].jsonName = "delay_ms";
        unitDelayVar_[i].moduleName = unitModuleName_[i];
        unitDelayVar_[i].type = ConfigType::Int32;
        unitDelayVar_[i].value = &u.perDelayMs;
        unitDelayVar_[i].persistence = ConfigPersistence::Persistent;
        unitDelayVar_[i].size = 0;
        ok &= cfg.registerVar(unitDelayVar_[i]);

        unitModeVar_[i].nvsKey = nvsUnitModeKey_[i];
        unitModeVar_[i].jsonName = "mode";
        unitModeVar_[i].moduleName = unitModuleName_[i];
        unitModeVar_[i].type = ConfigType::UInt8;
        unitModeVar_[i].value = &u.mode;
        unitModeVar_[i].persistence = ConfigPersistence::Persistent;
        unitModeVar_[i].size = 0;
        ok &= cfg.registerVar(unitModeVar_[i]);

        unitPpcVar_[i].nvsKey = nvsUnitPpcKey_[i];
        unitPpcVar_[i].jsonName = "ppc";
        unitPpcVar_[i].moduleName = unitModuleName_[i];
        unitPpcVar_[i].type = ConfigType::Int32;
        unitPpcVar_[i].value = &u.pulsesPerCycle;
        unitPpcVar_[i].persistence = ConfigPersistence::Persistent;
        unitPpcVar_[i].size = 0;
        ok &= cfg.registerVar(unitPpcVar_[i]);

        unitKVar_[i].nvsKey = nvsUnitKKey_[i];
        unitKVar_[i].jsonName = "k_factor";
        unitKVar_[i].moduleName = unitModuleName_[i];
        unitKVar_[i].type = ConfigType::Int32;
        unitKVar_[i].value = &u.pulsesPerLiter;
        unitKVar_[i].persistence = ConfigPersistence::Persistent;
        unitKVar_[i].size = 0;
        ok &= cfg.registerVar(unitKVar_[i]);

        unitMsPerMlVar_[i].nvsKey = nvsUnitMsPerMlKey_[i];
        unitMsPerMlVar_[i].jsonName = "ms_per_ml";
        unitMsPerMlVar_[i].moduleName = unitModuleName_[i];
        unitMsPerMlVar_[i].type = ConfigType::Float;
        unitMsPerMlVar_[i].value = &u.msPerMl;
        unitMsPerMlVar_[i].persistence = ConfigPersistence::Persistent;
        unitMsPerMlVar_[i].size = 0;
        ok &= cfg.registerVar(unitMsPerMlVar_[i]);

        unitFlowSrcVar_[i].nvsKey = nvsUnitFlowSrcKey_[i];
        unitFlowSrcVar_[i].jsonName = "flow_src";
        unitFlowSrcVar_[i].moduleName = unitModuleName_[i];
        unitFlowSrcVar_[i].type = ConfigType::UInt8;
        unitFlowSrcVar_[i].value = &u.flowSource;
        unitFlowSrcVar_[i].persistence = ConfigPersistence::Persistent;
        unitFlowSrcVar_[i].size = 0;
        ok &= cfg.registerVar(unitFlowSrcVar_[i]);
    }

    if (!ok) LOGE("Some irrigation settings could not be registered");
}

void IrrigationModule::registerCommands_()
{
    if (!cmdSvc_ || !cmdSvc_->registerHandler) {
        LOGW("CommandService missing, irrigation commands unavailable");
        return;
    }

    struct Entry { const char* name; CommandHandler fn; };
    static const Entry entries[] = {
        {"irrigation.press", cmdPress_},
        {"irrigation.run", cmdRun_},
        {"irrigation.stop", cmdStop_},
        {"irrigation.tram", cmdTram_},
        {"irrigation.tram_clear", cmdTramClear_},
        {"irrigation.tram_preset", cmdTramPreset_},
        {"irrigation.cal", cmdCal_},
        {"irrigation.buzzer", cmdBuzzer_},
        {"irrigation.simulate", cmdSimulate_},
        {"irrigation.status", cmdStatus_},
        {"irrigation.plan", cmdPlan_},
    };
    for (const Entry& e : entries) {
        if (!cmdSvc_->registerHandler(cmdSvc_->ctx, e.name, e.fn, this)) {
            LOGW("Command %s not registered", e.name);
        }
    }
}

void IrrigationModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    logHub_ = services.get<LogHubService>("loghub");
    cmdSvc_ = services.get<CommandService>("cmd");
    const EventBusService* ebSvc = services.get<EventBusService>("eventbus");
    eventBus_ = ebSvc ? ebSvc->bus : nullptr;
    const DataStoreService* dsSvc = services.get<DataStoreService>("datastore");
    dataStore_ = dsSvc ? dsSvc->store : nullptr;

    cmdQueue_ = xQueueCreate(Limits::Irrigation::CmdQueueLen, sizeof(ControlCommand));
    if (!cmdQueue_) {
        LOGE("Command queue allocation failed");
    }

    registerConfig_(cfg);

    if (eventBus_) {
        eventBus_->subscribe(EventId::ConfigChanged, &IrrigationModule::onConfigChangedStatic_, this);
    }

    ActuationListener listener;
    listener.onCompleted = &IrrigationModule::onCompletedStatic_;
    listener.onFault = &IrrigationModule::onFaultStatic_;
    listener.ctx = this;
    actuation_.setListener(listener);
    actuation_.setTramlineSet(&tram_);

    estimator_.setMinSamples(IrrigationDefaults::PressMinSamples);

    registerCommands_();
    LOGI("Irrigation module ready (units=%u switches=%u)",
         (unsigned)Limits::Irrigation::MaxUnits, (unsigned)Limits::Irrigation::MaxSwitches);
}

void IrrigationModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    AutoDelayConfig ad;
    if (readAutoDelay_(ad)) {
        /// valeur publiée au boot: repli manuel tant qu'aucun appui n'est vu
        const int32_t boot = ad.manualMs + ad.geomLeadMs;
        estimator_.setCurrentMs(boot < 0 ? 0 : boot);
    }
    applySettings_(millis());
    settingsDirty_.store(false);

    if (dataStore_) {
        setIrrigationDelay(*dataStore_, estimator_.currentMs(), 0);
        setIrrigationRunning(*dataStore_, lastRunning_, simulating_);
        setIrrigationTramline(*dataStore_, tram_.mask());
    }
}

bool IrrigationModule::post(const ControlCommand& cmd)
{
    if (!cmdQueue_) return false;
    return xQueueSend(cmdQueue_, &cmd, 0) == pdTRUE;
}

void IRAM_ATTR IrrigationModule::onSwitchEdgeIsr(void* ctx, uint8_t switchId, uint32_t tsMs)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(ctx);
    if (!self || !self->cmdQueue_) return;

    const ControlCommand cmd = ControlCommand::switchEdge(switchId, tsMs);
    BaseType_t higherWoken = pdFALSE;
    if (xQueueSendFromISR(self->cmdQueue_, &cmd, &higherWoken) != pdTRUE) {
        self->droppedEdges_.fetch_add(1U, std::memory_order_relaxed);
    }
    if (higherWoken == pdTRUE) {
        portYIELD_FROM_ISR();
    }
}

void IrrigationModule::loop()
{
    if (settingsDirty_.exchange(false)) {
        applySettings_(millis());
    }

    ControlCommand cmd;
    for (uint8_t n = 0; n < kMaxCommandsPerTick && cmdQueue_; ++n) {
        if (xQueueReceive(cmdQueue_, &cmd, 0) != pdTRUE) break;
        handleCommand_(cmd, millis());
    }

    const uint32_t now = millis();
    presses_.tick(now);
    tickSimulator_(now);
    tickEstimator_(now);
    actuation_.tick(now);

    publishSlots_();
    publishCounters_();
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

bool IrrigationModule::takeSnapshot_(IrrigationSnapshot& out) const
{
    if (!cfgStore_ || !cfgStore_->lock()) return false;

    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) out.units[i] = units_[i];
    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) out.momentary[i] = momentary_[i];
    out.autoDelay = autoDelay_;
    out.targetMl = global_.targetMl;
    out.deliveryMode = global_.deliveryMode;
    out.pattern = global_.pattern;
    out.diagonalStepMs = global_.diagStepMs;

    cfgStore_->unlock();

    /// clamp hors plage (jamais de rejet à l'exécution)
    out.unitCount = Limits::Irrigation::MaxUnits;
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        UnitConfig& u = out.units[i];
        u.id = (uint8_t)(i + 1);
        if (u.group > (uint8_t)UnitGroup::B) u.group = (uint8_t)UnitGroup::A;
        if (u.momentary > Limits::Irrigation::MaxSwitches) u.momentary = MOMENTARY_NONE;
        if (u.legacyOffsetPct > 100) u.legacyOffsetPct = 100;
        if (u.mode > (uint8_t)UnitDeliveryMode::Timed) u.mode = (uint8_t)UnitDeliveryMode::Inherit;
        if (u.flowSource >= Limits::Irrigation::MaxFlowSources) u.flowSource = 0;
        if (u.perDelayMs > IrrigationDefaults::MaxUnitDelayMs) u.perDelayMs = IrrigationDefaults::MaxUnitDelayMs;
        if (u.perDelayMs < -IrrigationDefaults::MaxUnitDelayMs) u.perDelayMs = -IrrigationDefaults::MaxUnitDelayMs;
        if (!(u.msPerMl >= IrrigationDefaults::MinMsPerMl)) u.msPerMl = IrrigationDefaults::MinMsPerMl;
        if (u.msPerMl > IrrigationDefaults::MaxMsPerMl) u.msPerMl = IrrigationDefaults::MaxMsPerMl;
        if (u.pulsesPerCycle < 1) u.pulsesPerCycle = 1;
        if (u.pulsesPerLiter < 1) u.pulsesPerLiter = 1;
        if (u.pulsesPerLiter > IrrigationDefaults::MaxPulsesPerLiter) u.pulsesPerLiter = IrrigationDefaults::MaxPulsesPerLiter;
    }
    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) {
        if (out.momentary[i].offsetPct > 100) out.momentary[i].offsetPct = 100;
    }
    if (out.deliveryMode > (uint8_t)DeliveryMode::Timed) out.deliveryMode = (uint8_t)DeliveryMode::Flow;
    if (out.pattern > (uint8_t)TimingPattern::Line) out.pattern = (uint8_t)TimingPattern::Diamond;
    if (out.diagonalStepMs < 0) out.diagonalStepMs = 0;
    if (out.diagonalStepMs > IrrigationDefaults::MaxDiagonalStepMs) out.diagonalStepMs = IrrigationDefaults::MaxDiagonalStepMs;
    out.targetMl = clampTargetMl(out.targetMl);

    out.autoDelay.currentMs = estimator_.currentMs();
    out.tramlineMask = tram_.mask();
    return true;
}

bool IrrigationModule::readAutoDelay_(AutoDelayConfig& out) const
{
    if (!cfgStore_ || !cfgStore_->lock()) return false;
    out = autoDelay_;
    cfgStore_->unlock();
    out.currentMs = estimator_.currentMs();
    return true;
}

void IrrigationModule::applySettings_(uint32_t nowMs)
{
    if (!cfgStore_ || !cfgStore_->lock()) {
        /// retry on the next tick
        settingsDirty_.store(true);
        return;
    }
    const GlobalSettings g = global_;
    const PressSettings p = pressCfg_;
    const int32_t tickMs = estimatorTickMs_;
    cfgStore_->unlock();

    const uint32_t windowMs = (p.windowMs > 0) ? (uint32_t)p.windowMs : IrrigationDefaults::PressWindowMs;
    const uint32_t debounceMs = (p.debounceMs >= 0) ? (uint32_t)p.debounceMs : IrrigationDefaults::HardwareDebounceMs;
    const uint32_t simReleaseMs = (p.simReleaseMs >= 0) ? (uint32_t)p.simReleaseMs : IrrigationDefaults::SimulatedReleaseMs;
    presses_.configure(debounceMs, simReleaseMs, windowMs, p.cap);

    estimator_.setTickMs((tickMs > 0) ? (uint32_t)tickMs : IrrigationDefaults::EstimatorTickMs);
    actuation_.setFlowCeilingMultiplier(g.flowCeilMult);
    actuation_.setBuzzerMute(g.buzzerMuted, g.buzzerHardMute);

    applyRunning_(g.running, nowMs);
}

void IrrigationModule::applyRunning_(bool running, uint32_t nowMs)
{
    if (running == lastRunning_) return;
    lastRunning_ = running;

    if (!running) {
        const uint8_t n = actuation_.cancelAll(CancelReason::Stop, nowMs);
        LOGI("STOP (%u actuations cancelled)", (unsigned)n);
    } else {
        LOGI("RUN");
    }

    if (eventBus_) {
        RunningChangedPayload p{ (uint8_t)(running ? 1 : 0) };
        (void)eventBus_->post(EventId::RunningChanged, &p, sizeof(p));
    }
    if (dataStore_) setIrrigationRunning(*dataStore_, running, simulating_);
}

bool IrrigationModule::switchEnabled_(uint8_t switchId) const
{
    MomentaryConfig copy[Limits::Irrigation::MaxSwitches];
    if (!cfgStore_ || !cfgStore_->lock()) {
        LOGW("M%u press dropped (config busy)", (unsigned)switchId);
        return false;
    }
    for (uint8_t i = 0; i < Limits::Irrigation::MaxSwitches; ++i) copy[i] = momentary_[i];
    cfgStore_->unlock();
    return momentaryEnabled(copy, switchId);
}

bool IrrigationModule::unitConfig_(uint8_t unitId, UnitConfig& out) const
{
    if (unitId < 1 || unitId > Limits::Irrigation::MaxUnits) return false;
    if (!cfgStore_ || !cfgStore_->lock()) return false;
    out = units_[unitId - 1];
    cfgStore_->unlock();
    out.id = unitId;
    if (out.flowSource >= Limits::Irrigation::MaxFlowSources) out.flowSource = 0;
    return true;
}

// ---------------------------------------------------------------------------
// Actor
// ---------------------------------------------------------------------------

void IrrigationModule::handleCommand_(const ControlCommand& cmd, uint32_t nowMs)
{
    switch (cmd.kind) {
    case ControlKind::SwitchEdge:
        onPress_(cmd.u.edge.switchId, cmd.u.edge.tsMs, false, nowMs);
        break;

    case ControlKind::SimulatePress:
        onPress_(cmd.u.press.switchId, nowMs, true, nowMs);
        break;

    case ControlKind::SetRunning:
        if (!cfgStore_ || !cfgStore_->set(runningVar_, cmd.u.onOff.on)) {
            LOGW("running flag update failed");
            break;
        }
        applyRunning_(cmd.u.onOff.on, nowMs);
        break;

    case ControlKind::Stop:
        if (cmd.u.unit.unitId == 0) {
            const uint8_t n = actuation_.cancelAll(CancelReason::Stop, nowMs);
            LOGI("Stop all (%u cancelled)", (unsigned)n);
        } else if (!actuation_.cancel(cmd.u.unit.unitId, CancelReason::Stop, nowMs)) {
            LOGD("Stop U%u: nothing running", (unsigned)cmd.u.unit.unitId);
        }
        break;

    case ControlKind::Tramline:
        setTramline_(cmd.u.tram.unitId, cmd.u.tram.off, nowMs);
        break;

    case ControlKind::TramlineClear:
        applyTramMask_(0, nowMs);
        break;

    case ControlKind::TramlinePreset: {
        uint16_t mask = 0;
        if (cfgStore_ && cfgStore_->lock()) {
            if (cmd.u.preset.side == TramSide::Left) mask = maskFromConfig_(tramLeftMask_);
            else if (cmd.u.preset.side == TramSide::Right) mask = maskFromConfig_(tramRightMask_);
            cfgStore_->unlock();
        } else if (cmd.u.preset.side != TramSide::None) {
            LOGW("Tram preset %s skipped (config busy)", tramSideStr(cmd.u.preset.side));
            break;
        }
        LOGI("Tram preset %s mask=0x%03x", tramSideStr(cmd.u.preset.side), (unsigned)mask);
        applyTramMask_(mask, nowMs);
        break;
    }

    case ControlKind::CalibrateTimed:
    case ControlKind::CalibrateFlow:
        calibrate_(cmd, nowMs);
        break;

    case ControlKind::CalibrateStop:
        (void)actuation_.cancel(cmd.u.unit.unitId, CancelReason::Stop, nowMs);
        break;

    case ControlKind::Buzzer: {
        uint32_t ms = cmd.u.buzzer.ms;
        if (cmd.u.buzzer.on && cmd.u.buzzer.maintenance && ms == 0) ms = IrrigationDefaults::MaintenanceBeepMs;
        const BeepKind kind = cmd.u.buzzer.maintenance ? BeepKind::Maintenance : BeepKind::Normal;
        if (!actuation_.beep(cmd.u.buzzer.on, ms, kind, nowMs)) {
            LOGD("Buzzer %s refused (muted or hardware)", cmd.u.buzzer.on ? "on" : "off");
        }
        break;
    }

    case ControlKind::Simulate:
        if (simulating_ == cmd.u.onOff.on) break;
        simulating_ = cmd.u.onOff.on;
        nextSimPressMs_ = nowMs + (uint32_t)random((long)IrrigationDefaults::SimPressMinIntervalMs,
                                                   (long)IrrigationDefaults::SimPressMaxIntervalMs + 1);
        LOGI("Simulator %s", simulating_ ? "on" : "off");
        if (dataStore_) setIrrigationRunning(*dataStore_, lastRunning_, simulating_);
        break;

    default:
        LOGW("Unhandled command kind=%u", (unsigned)cmd.kind);
        break;
    }
}

void IrrigationModule::onPress_(uint8_t switchId, uint32_t tsMs, bool simulated, uint32_t nowMs)
{
    const bool enabled = switchEnabled_(switchId);
    const PressResult r = simulated ? presses_.onSimulatedPress(switchId, tsMs, enabled)
                                    : presses_.onEdge(switchId, tsMs, enabled);
    if (r != PressResult::Accepted) {
        if (r == PressResult::Disabled) LOGD("M%u disabled, press ignored", (unsigned)switchId);
        return;
    }

    if (eventBus_) {
        PressAcceptedPayload p{ switchId, (uint8_t)(simulated ? 1 : 0), tsMs };
        (void)eventBus_->post(EventId::PressAccepted, &p, sizeof(p));
    }

    /// l'historique alimente l'estimateur même à l'arrêt
    if (!lastRunning_) return;
    runCycle_(tsMs, nowMs);
}

void IrrigationModule::runCycle_(uint32_t pressMs, uint32_t nowMs)
{
    IrrigationSnapshot snap;
    if (!takeSnapshot_(snap)) {
        LOGW("Config busy, cycle skipped");
        return;
    }

    bool supersede = true;
    if (cfgStore_->lock()) {
        supersede = global_.supersede;
        cfgStore_->unlock();
    }

    CyclePlan plan;
    const uint8_t count = planCycle(snap, pressMs, (TimingPattern)snap.pattern, plan);
    const uint8_t accepted = actuation_.submitCycle(plan, nowMs, supersede);
    ++cycleId_;

    const int32_t first = (count > 0) ? plan.entries[0].offsetMs : 0;
    const int32_t last = (count > 0) ? plan.entries[count - 1].offsetMs : 0;
    LOGI("Cycle #%lu %s: %u planned, %u accepted, offsets %ld..%ld ms",
         (unsigned long)cycleId_, patternStr((TimingPattern)snap.pattern),
         (unsigned)count, (unsigned)accepted, (long)first, (long)last);

    if (eventBus_) {
        CycleScheduledPayload p{ cycleId_, pressMs, count, accepted, first, last };
        (void)eventBus_->post(EventId::CycleScheduled, &p, sizeof(p));
    }

    if (dataStore_) {
        IrrigationPlanRuntime rt{};
        rt.cycleId = cycleId_;
        rt.pressMs = pressMs;
        rt.count = count;
        rt.accepted = accepted;
        for (uint8_t i = 0; i < count; ++i) {
            rt.unitIds[i] = plan.entries[i].unitId;
            rt.offsetsMs[i] = plan.entries[i].offsetMs;
        }
        setIrrigationPlan(*dataStore_, rt);
    }
}

void IrrigationModule::setTramline_(uint8_t unitId, bool off, uint32_t nowMs)
{
    if (!tram_.set(unitId, off)) return;

    if (off) (void)actuation_.cancel(unitId, CancelReason::Tramline, nowMs);
    LOGI("Tramline U%u %s", (unsigned)unitId, off ? "off" : "on");

    if (eventBus_) {
        TramlineChangedPayload p{ unitId, (uint8_t)(off ? 1 : 0), tram_.mask() };
        (void)eventBus_->post(EventId::TramlineChanged, &p, sizeof(p));
    }
    if (dataStore_) setIrrigationTramline(*dataStore_, tram_.mask());
}

void IrrigationModule::applyTramMask_(uint16_t mask, uint32_t nowMs)
{
    const uint16_t before = tram_.mask();
    if (!tram_.assign(mask)) return;
    const uint16_t after = tram_.mask();

    for (uint8_t id = 1; id <= Limits::Irrigation::MaxUnits; ++id) {
        const uint16_t bit = (uint16_t)(1u << (id - 1));
        if ((before & bit) == (after & bit)) continue;

        const bool off = (after & bit) != 0;
        if (off) (void)actuation_.cancel(id, CancelReason::Tramline, nowMs);
        if (eventBus_) {
            TramlineChangedPayload p{ id, (uint8_t)(off ? 1 : 0), after };
            (void)eventBus_->post(EventId::TramlineChanged, &p, sizeof(p));
        }
    }
    if (dataStore_) setIrrigationTramline(*dataStore_, after);
}

void IrrigationModule::calibrate_(const ControlCommand& cmd, uint32_t nowMs)
{
    const uint8_t unitId = (cmd.kind == ControlKind::CalibrateTimed) ? cmd.u.calTimed.unitId
                                                                     : cmd.u.calFlow.unitId;
    UnitConfig unit;
    if (!unitConfig_(unitId, unit)) {
        LOGW("Calibration U%u: config unavailable", (unsigned)unitId);
        return;
    }

    ScheduleEntry e{};
    e.unitId = unitId;
    e.startMs = nowMs;
    e.offsetMs = 0;

    if (cmd.kind == ControlKind::CalibrateTimed) {
        const float msPerMl = (unit.msPerMl >= IrrigationDefaults::MinMsPerMl) ? unit.msPerMl
                                                                             : IrrigationDefaults::MinMsPerMl;
        e.mode = DeliveryMode::Timed;
        e.hasDuration = true;
        e.durationMs = cmd.u.calTimed.ms;
        e.desc.timed.msPerMl = msPerMl;
        e.desc.timed.targetMl = (float)cmd.u.calTimed.ms / msPerMl;
    } else {
        /// pas de plafond pulses-par-cycle en calibration
        fillDelivery(e, unit, DeliveryMode::Flow, cmd.u.calFlow.targetMl, false);
    }

    const SubmitResult r = actuation_.submit(e, nowMs);
    switch (r) {
    case SubmitResult::Accepted:
        LOGI("Calibration U%u %s started", (unsigned)unitId, deliveryModeStr(e.mode));
        break;
    case SubmitResult::Conflict:
        LOGW("Calibration U%u rejected: unit busy", (unsigned)unitId);
        break;
    case SubmitResult::Tramlined:
        LOGW("Calibration U%u rejected: tramlined", (unsigned)unitId);
        break;
    case SubmitResult::InvalidUnit:
    default:
        LOGW("Calibration U%u rejected: invalid unit", (unsigned)unitId);
        break;
    }
}

void IrrigationModule::tickSimulator_(uint32_t nowMs)
{
    if (!simulating_) return;
    if ((int32_t)(nowMs - nextSimPressMs_) < 0) return;

    nextSimPressMs_ = nowMs + (uint32_t)random((long)IrrigationDefaults::SimPressMinIntervalMs,
                                               (long)IrrigationDefaults::SimPressMaxIntervalMs + 1);
    onPress_(1, nowMs, true, nowMs);
}

void IrrigationModule::tickEstimator_(uint32_t nowMs)
{
    AutoDelayConfig ad;
    if (!readAutoDelay_(ad)) return;
    if (!estimator_.tick(ad, presses_.history(), nowMs)) return;

    const int32_t current = estimator_.currentMs();
    const uint8_t samples = estimator_.lastSampleCount();
    LOGI("B delay %ld ms (%u presses)", (long)current, (unsigned)samples);

    if (eventBus_) {
        DelayChangedPayload p{ current, samples };
        (void)eventBus_->post(EventId::DelayChanged, &p, sizeof(p));
    }
    if (dataStore_) setIrrigationDelay(*dataStore_, current, samples);
}

void IrrigationModule::publishSlots_()
{
    if (!dataStore_) return;
    for (uint8_t id = 1; id <= Limits::Irrigation::MaxUnits; ++id) {
        IrrigationUnitRuntime rt = irrigationUnitRuntime(*dataStore_, id);
        rt.state = (uint8_t)actuation_.state(id);
        rt.outputOn = actuation_.outputAsserted(id);
        rt.faulted = actuation_.faulted(id);
        rt.tramlined = tram_.contains(id);
        setIrrigationUnitRuntime(*dataStore_, id, rt);
    }
}

void IrrigationModule::publishCounters_()
{
    if (!dataStore_) return;
    const ActuationStats& s = actuation_.stats();
    IrrigationCountersRuntime c{};
    c.presses = presses_.acceptedCount();
    c.bounced = presses_.bouncedCount();
    c.droppedEdges = droppedEdges_.load(std::memory_order_relaxed);
    c.conflicts = s.conflicts;
    c.lateStarts = s.lateStarts;
    c.tramlineRejects = s.tramlineRejects;
    c.faults = s.faults;
    c.completed = s.completed;
    c.flowCeilings = s.flowCeilings;
    c.cancelled = s.cancelled;
    c.superseded = s.superseded;
    setIrrigationCounters(*dataStore_, c);
}

// ---------------------------------------------------------------------------
// Listeners
// ---------------------------------------------------------------------------

void IrrigationModule::onConfigChangedStatic_(const Event&, void* user)
{
    static_cast<IrrigationModule*>(user)->settingsDirty_.store(true);
}

void IrrigationModule::onCompletedStatic_(void* ctx, const ActuationReport& report)
{
    static_cast<IrrigationModule*>(ctx)->onCompleted_(report);
}

void IrrigationModule::onFaultStatic_(void* ctx, uint8_t unitId, HardwareOp op)
{
    static_cast<IrrigationModule*>(ctx)->onFault_(unitId, op);
}

void IrrigationModule::onCompleted_(const ActuationReport& report)
{
    int32_t kFactor = IrrigationDefaults::PulsesPerLiter;
    UnitConfig unit;
    if (unitConfig_(report.unitId, unit)) kFactor = unit.pulsesPerLiter;

    const DeliveryAssessment a = assessDelivery(report, kFactor);

    if (report.outcome == ActuationOutcome::FlowCeiling) {
        LOGW("U%u flow ceiling after %lu ms (%lu/%lu pulses)",
             (unsigned)report.unitId, (unsigned long)report.activeMs,
             (unsigned long)report.pulses, (unsigned long)report.targetPulses);
    } else {
        LOGD("U%u %s %s active=%lu ms pulses=%lu status=%s",
             (unsigned)report.unitId, outcomeStr(report.outcome), deliveryModeStr(report.mode),
             (unsigned long)report.activeMs, (unsigned long)report.pulses, deliveryStatusStr(a.status));
    }

    if (eventBus_) {
        UnitActuationPayload p{
            report.unitId, (uint8_t)report.outcome, (uint8_t)report.mode, (uint8_t)a.status,
            report.activeMs, report.pulses
        };
        (void)eventBus_->post(EventId::UnitActuationCompleted, &p, sizeof(p));
    }

    if (dataStore_) {
        IrrigationUnitRuntime rt = irrigationUnitRuntime(*dataStore_, report.unitId);
        rt.lastOutcome = (uint8_t)report.outcome;
        rt.lastMode = (uint8_t)report.mode;
        rt.lastStatus = (uint8_t)a.status;
        rt.lastActiveMs = report.activeMs;
        rt.lastPulses = report.pulses;
        rt.lastDeliveredMl = a.deliveredMl;
        rt.lastDeviation = a.deviation;
        setIrrigationUnitRuntime(*dataStore_, report.unitId, rt);
    }
}

void IrrigationModule::onFault_(uint8_t unitId, HardwareOp op)
{
    if (unitId == OutputGuard::BuzzerId) {
        LOGE("Buzzer %s failed", (op == HardwareOp::Assert) ? "assert" : "deassert");
    } else {
        LOGE("U%u %s failed after %u attempts", (unsigned)unitId,
             (op == HardwareOp::Assert) ? "assert" : "deassert",
             (unsigned)Limits::Irrigation::HwRetryCount);
        /// alerte sonore, coupée seulement par le hard mute
        (void)actuation_.beep(true, IrrigationDefaults::MaintenanceBeepMs, BeepKind::Maintenance, millis());
    }

    if (eventBus_) {
        UnitFaultPayload p{ unitId, (uint8_t)op };
        (void)eventBus_->post(EventId::UnitFault, &p, sizeof(p));
    }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

bool IrrigationModule::replyQueued_(const ControlCommand& cmd, char* reply, size_t replyLen)
{
    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"queued\":\"%s\"}", controlKindStr(cmd.kind));
    return wrote > 0 && (size_t)wrote < replyLen;
}

bool IrrigationModule::postOrReply_(const ControlCommand& cmd, const char* where, char* reply, size_t replyLen)
{
    if (!post(cmd)) {
        writeCmdError(reply, replyLen, where, cmdQueue_ ? ErrorCode::QueueFull : ErrorCode::NotReady);
        return false;
    }
    if (!replyQueued_(cmd, reply, replyLen)) {
        writeCmdError(reply, replyLen, where, ErrorCode::Failed);
        return false;
    }
    return true;
}

bool IrrigationModule::handleParsed_(const CommandRequest& req, ArgsParser parse, bool argsRequired,
                                     const char* where, char* reply, size_t replyLen)
{
    StaticJsonDocument<Limits::Irrigation::JsonCmdBuf> doc;
    JsonObjectConst args;
    if (!parseCmdArgsObject(req, doc, args) && argsRequired) {
        writeCmdError(reply, replyLen, where, ErrorCode::MissingArgs);
        return false;
    }

    ControlCommand cmd{};
    ErrorCode err = ErrorCode::Failed;
    if (!parse(args, cmd, err)) {
        writeCmdError(reply, replyLen, where, err);
        return false;
    }
    return postOrReply_(cmd, where, reply, replyLen);
}

bool IrrigationModule::cmdPress_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parsePressArgs, false, "irrigation.press", reply, replyLen);
}

bool IrrigationModule::cmdRun_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseRunArgs, true, "irrigation.run", reply, replyLen);
}

bool IrrigationModule::cmdStop_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseStopArgs, false, "irrigation.stop", reply, replyLen);
}

bool IrrigationModule::cmdTram_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseTramArgs, true, "irrigation.tram", reply, replyLen);
}

bool IrrigationModule::cmdTramClear_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->postOrReply_(ControlCommand::tramlineClear(), "irrigation.tram_clear", reply, replyLen);
}

bool IrrigationModule::cmdTramPreset_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseTramPresetArgs, true, "irrigation.tram_preset", reply, replyLen);
}

bool IrrigationModule::cmdCal_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseCalArgs, true, "irrigation.cal", reply, replyLen);
}

bool IrrigationModule::cmdBuzzer_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseBuzzerArgs, true, "irrigation.buzzer", reply, replyLen);
}

bool IrrigationModule::cmdSimulate_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    return self->handleParsed_(req, parseSimulateArgs, true, "irrigation.simulate", reply, replyLen);
}

/// Lecture DataStore sans passer par l'acteur.
bool IrrigationModule::cmdStatus_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self->dataStore_) {
        writeCmdError(reply, replyLen, "irrigation.status", ErrorCode::NotReady);
        return false;
    }
    const IrrigationRuntimeData& rt = self->dataStore_->data().irrigation;

    StaticJsonDocument<Limits::CmdReplyBuf + 256> doc;
    doc["ok"] = true;
    doc["running"] = rt.running;
    doc["simulating"] = rt.simulating;
    doc["delay_ms"] = rt.delayMs;
    doc["samples"] = rt.delaySamples;
    doc["tram_mask"] = rt.tramlineMask;

    JsonArray states = doc.createNestedArray("states");
    uint16_t faultMask = 0;
    for (uint8_t i = 0; i < Limits::Irrigation::MaxUnits; ++i) {
        const IrrigationUnitRuntime& u = rt.units[i];
        states.add(taskStateStr((TaskState)u.state));
        if (u.faulted) faultMask |= (uint16_t)(1u << i);
    }
    doc["fault_mask"] = faultMask;

    JsonObject c = doc.createNestedObject("counters");
    c["presses"] = rt.counters.presses;
    c["bounced"] = rt.counters.bounced;
    c["dropped"] = rt.counters.droppedEdges;
    c["conflicts"] = rt.counters.conflicts;
    c["late"] = rt.counters.lateStarts;
    c["tram_rej"] = rt.counters.tramlineRejects;
    c["faults"] = rt.counters.faults;
    c["done"] = rt.counters.completed;
    c["ceiling"] = rt.counters.flowCeilings;
    c["cancelled"] = rt.counters.cancelled;
    c["superseded"] = rt.counters.superseded;

    const size_t wrote = serializeJson(doc, reply, replyLen);
    if (doc.overflowed() || wrote == 0 || wrote >= replyLen) {
        writeCmdError(reply, replyLen, "irrigation.status", ErrorCode::Failed);
        return false;
    }
    return true;
}

bool IrrigationModule::cmdPlan_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    IrrigationModule* self = static_cast<IrrigationModule*>(userCtx);
    if (!self->dataStore_) {
        writeCmdError(reply, replyLen, "irrigation.plan", ErrorCode::NotReady);
        return false;
    }
    const IrrigationPlanRuntime& plan = self->dataStore_->data().irrigation.plan;

    StaticJsonDocument<Limits::CmdReplyBuf> doc;
    doc["ok"] = true;
    doc["cycle"] = plan.cycleId;
    doc["press_ms"] = plan.pressMs;
    doc["accepted"] = plan.accepted;
    JsonArray entries = doc.createNestedArray("entries");
    for (uint8_t i = 0; i < plan.count && i < Limits::Irrigation::MaxUnits; ++i) {
        JsonArray e = entries.createNestedArray();
        e.add(plan.unitIds[i]);
        e.add(plan.offsetsMs[i]);
    }

    const size_t wrote = serializeJson(doc, reply, replyLen);
    if (doc.overflowed() || wrote == 0 || wrote >= replyLen) {
        writeCmdError(reply, replyLen, "irrigation.plan", ErrorCode::Failed);
        return false;
    }
    return true;
}
