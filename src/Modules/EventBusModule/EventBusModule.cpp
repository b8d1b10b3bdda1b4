/**
 * @file EventBusModule.cpp
 * @brief Implementation file.
 */
#include "EventBusModule.h"
#define LOG_TAG "EvtBusMd"
#include "Core/ModuleLog.h"

static constexpr uint32_t kDropReportPeriodMs = 10000;

void EventBusModule::init(ConfigStore&, ServiceRegistry& services) {
    /// récupérer service loghub (log async)
    logHub = services.get<LogHubService>("loghub");

    if (!services.add("eventbus", &_svc)) {
        LOGE("EventBusService registration failed");
        return;
    }
    LOGI("EventBusService registered");
}

void EventBusModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    /// Broadcast system started (no payload); dispatched once the task runs
    if (!_bus.post(EventId::SystemStarted, nullptr, 0)) {
        LOGW("SystemStarted not queued");
    }
}

void EventBusModule::loop() {
    /// Dispatch queued events.
    _bus.dispatch(8);

    const uint32_t now = millis();
    if ((uint32_t)(now - _lastDropReportMs) >= kDropReportPeriodMs) {
        _lastDropReportMs = now;
        const uint32_t dropped = _bus.takeDropped();
        if (dropped > 0) {
            LOGW("%lu events dropped (queue full)", (unsigned long)dropped);
        }
    }
}
