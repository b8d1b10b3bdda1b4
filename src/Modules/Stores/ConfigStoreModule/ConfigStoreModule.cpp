/**
 * @file ConfigStoreModule.cpp
 * @brief Implementation file.
 */
#include "ConfigStoreModule.h"
#define LOG_TAG "CfgModul"
#include "Core/ModuleLog.h"


bool ConfigStoreModule::svcApplyJson(void* ctx, const char* json) {
    return ((ConfigStore*)ctx)->applyJson(json);
}

bool ConfigStoreModule::svcToJson(void* ctx, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJson(out, outLen, truncated);
}

bool ConfigStoreModule::svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated) {
    return ((ConfigStore*)ctx)->toJsonModule(module, out, outLen, truncated);
}

uint8_t ConfigStoreModule::svcListModules(void* ctx, const char** out, uint8_t max) {
    return ((ConfigStore*)ctx)->listModules(out, max);
}

bool ConfigStoreModule::svcErase(void* ctx) {
    return ((ConfigStore*)ctx)->erasePersistent();
}

/// `{"module":"irr/u3"}` returns that module, no args lists the module names.
bool ConfigStoreModule::cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);

    StaticJsonDocument<Limits::Irrigation::JsonCmdBuf> doc;
    JsonObjectConst args;
    const char* module = nullptr;
    if (parseCmdArgsObject(req, doc, args)) {
        module = args["module"].as<const char*>();
    }

    if (!module) {
        const char* names[Limits::MaxConfigModules];
        const uint8_t n = self->registry->listModules(names, Limits::MaxConfigModules);
        size_t pos = 0;
        int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"modules\":[");
        if (wrote <= 0 || (size_t)wrote >= replyLen) {
            writeCmdError(reply, replyLen, "config.get", ErrorCode::CfgTruncated);
            return false;
        }
        pos = (size_t)wrote;
        for (uint8_t i = 0; i < n; ++i) {
            wrote = snprintf(reply + pos, replyLen - pos, "%s\"%s\"", (i == 0) ? "" : ",", names[i]);
            if (wrote <= 0 || (size_t)wrote >= replyLen - pos) {
                writeCmdError(reply, replyLen, "config.get", ErrorCode::CfgTruncated);
                return false;
            }
            pos += (size_t)wrote;
        }
        wrote = snprintf(reply + pos, replyLen - pos, "]}");
        if (wrote <= 0 || (size_t)wrote >= replyLen - pos) {
            writeCmdError(reply, replyLen, "config.get", ErrorCode::CfgTruncated);
            return false;
        }
        return true;
    }

    char body[Limits::CmdReplyBuf - 48];
    bool truncated = false;
    if (!self->registry->toJsonModule(module, body, sizeof(body), &truncated)) {
        writeCmdError(reply, replyLen, "config.get", ErrorCode::BadCfgJson);
        return false;
    }
    if (truncated) {
        writeCmdError(reply, replyLen, "config.get", ErrorCode::CfgTruncated);
        return false;
    }

    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"module\":\"%s\",\"cfg\":%s}", module, body);
    if (wrote <= 0 || (size_t)wrote >= replyLen) {
        writeCmdError(reply, replyLen, "config.get", ErrorCode::CfgTruncated);
        return false;
    }
    return true;
}

bool ConfigStoreModule::cmdErase(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    ConfigStoreModule* self = static_cast<ConfigStoreModule*>(userCtx);
    if (!self->registry->erasePersistent()) {
        LOGE("NVS erase failed");
        writeCmdError(reply, replyLen, "config.erase", ErrorCode::Failed);
        return false;
    }
    LOGW("NVS erased, factory values apply after reboot");
    snprintf(reply, replyLen, "{\"ok\":true,\"msg\":\"erased\"}");
    return true;
}

void ConfigStoreModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    registry = &cfg;

    /// récupérer service loghub (log async)
    logHub = services.get<LogHubService>("loghub");
    cmdSvc = services.get<CommandService>("cmd");

    svc.applyJson = svcApplyJson;
    svc.toJson = svcToJson;
    svc.toJsonModule = svcToJsonModule;
    svc.listModules = svcListModules;
    svc.erase = svcErase;
    svc.ctx = registry;

    if (!services.add("config", &svc)) {
        LOGE("ConfigStoreService registration failed");
        return;
    }

    if (cmdSvc) {
        const bool ok = cmdSvc->registerHandler(cmdSvc->ctx, "config.get", cmdGet, this) &&
                        cmdSvc->registerHandler(cmdSvc->ctx, "config.erase", cmdErase, this);
        if (!ok) LOGW("config commands not registered");
    }
    LOGI("ConfigStoreService registered");
}
