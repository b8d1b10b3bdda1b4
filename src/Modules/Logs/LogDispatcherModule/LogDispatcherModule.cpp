/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static constexpr uint32_t kDropCheckPeriodMs = 5000;

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    /// récupérer hub et sink registry
    auto hubSvc = services.get<LogHubService>("loghub");
    auto sinkReg = services.get<LogSinkRegistryService>("logsinks");
    if (!hubSvc || !hubSvc->ctx || !sinkReg || !sinkReg->ctx) {
        Serial.println("[log.dispatcher] loghub/logsinks services missing");
        return;
    }

    _hub = static_cast<LogHub*>(hubSvc->ctx);
    _sinks = static_cast<const LogSinkRegistry*>(sinkReg->ctx);

    /// Crée la task log
    const BaseType_t ok = xTaskCreatePinnedToCore(
        LogDispatcherModule::taskFn,
        "LogDispatch",
        4096,                ///< stack
        this,                ///< param
        1,                   ///< priorité basse
        nullptr,
        0                    ///< core 0, loin de la tâche irrigation
    );
    if (ok != pdPASS) {
        Serial.println("[log.dispatcher] task creation failed");
    }
}

void LogDispatcherModule::taskFn(void* pv) {
    static_cast<LogDispatcherModule*>(pv)->run_();
}

void LogDispatcherModule::run_() {
    LogEntry e;

    while (true) {
        if (_hub->dequeue(e, pdMS_TO_TICKS(kDropCheckPeriodMs))) {
            _sinks->broadcast(e);
        }

        const uint32_t now = millis();
        if ((uint32_t)(now - _lastDropCheckMs) < kDropCheckPeriodMs) continue;
        _lastDropCheckMs = now;

        const uint32_t dropped = _hub->takeDropped();
        if (dropped == 0) continue;

        /// reported straight to the sinks: the queue is what overflowed
        LogEntry d{};
        d.ts_ms = now;
        d.lvl = LogLevel::Warn;
        strncpy(d.tag, "LogDisp", LOG_TAG_MAX - 1);
        snprintf(d.msg, LOG_MSG_MAX, "%lu log entries dropped", (unsigned long)dropped);
        _sinks->broadcast(d);
    }
}
