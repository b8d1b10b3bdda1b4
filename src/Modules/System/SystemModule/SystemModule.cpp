/**
 * @file SystemModule.cpp
 * @brief Implementation file.
 */
#include "SystemModule.h"
#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"
#include <esp_system.h>
#define LOG_TAG "SysModul"
#include "Core/ModuleLog.h"

static bool writeOkReply_(char* reply, size_t replyLen, const char* json, const char* where)
{
    if (!reply || replyLen == 0 || !json) return false;
    const int wrote = snprintf(reply, replyLen, "%s", json);
    if (wrote > 0 && (size_t)wrote < replyLen) return true;
    writeCmdError(reply, replyLen, where, ErrorCode::Failed);
    return false;
}

static bool parseLevel_(const char* s, LogLevel& out)
{
    if (!s) return false;
    if (strcmp(s, "debug") == 0) { out = LogLevel::Debug; return true; }
    if (strcmp(s, "info") == 0)  { out = LogLevel::Info;  return true; }
    if (strcmp(s, "warn") == 0)  { out = LogLevel::Warn;  return true; }
    if (strcmp(s, "error") == 0) { out = LogLevel::Error; return true; }
    return false;
}

static const char* levelStr_(LogLevel lvl)
{
    switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    }
    return "info";
}

bool SystemModule::cmdPing(void*, const CommandRequest&, char* reply, size_t replyLen) {
    char buf[64];
    snprintf(buf, sizeof(buf), "{\"ok\":true,\"pong\":true,\"uptime_ms\":%lu}", (unsigned long)millis());
    return writeOkReply_(reply, replyLen, buf, "system.ping");
}

bool SystemModule::cmdReboot(void*, const CommandRequest&, char* reply, size_t replyLen) {
    if (!writeOkReply_(reply, replyLen, "{\"ok\":true,\"msg\":\"rebooting\"}", "system.reboot")) {
        return false;
    }
    LOGW("Reboot requested");
    delay(200); ///< laisser le temps à la console de publier l'ACK
    esp_restart();
    return true;
}

/// `{"level":"debug|info|warn|error"}`, no args returns the current level.
bool SystemModule::cmdLogLevel(void*, const CommandRequest& req, char* reply, size_t replyLen) {
    StaticJsonDocument<Limits::Irrigation::JsonCmdBuf> doc;
    JsonObjectConst args;
    if (parseCmdArgsObject(req, doc, args) && args.containsKey("level")) {
        LogLevel lvl;
        if (!parseLevel_(args["level"].as<const char*>(), lvl)) {
            writeCmdError(reply, replyLen, "system.log_level", ErrorCode::InvalidMode);
            return false;
        }
        Log::setMinLevel(lvl);
        LOGI("Log level set to %s", levelStr_(lvl));
    }

    char buf[48];
    snprintf(buf, sizeof(buf), "{\"ok\":true,\"level\":\"%s\"}", levelStr_(Log::minLevel()));
    return writeOkReply_(reply, replyLen, buf, "system.log_level");
}

void SystemModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    logHub = services.get<LogHubService>("loghub");
    cmdSvc = services.get<CommandService>("cmd");
    if (!cmdSvc) {
        LOGE("CommandService missing");
        return;
    }

    const bool ok = cmdSvc->registerHandler(cmdSvc->ctx, "system.ping", cmdPing, this) &&
                    cmdSvc->registerHandler(cmdSvc->ctx, "system.reboot", cmdReboot, this) &&
                    cmdSvc->registerHandler(cmdSvc->ctx, "system.log_level", cmdLogLevel, this);
    if (!ok) {
        LOGW("System commands partially registered");
        return;
    }
    LOGI("Commands registered: system.ping system.reboot system.log_level");
}
