/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"


bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    CommandModule* self = static_cast<CommandModule*>(userCtx);
    const char* names[MAX_COMMANDS];
    const uint8_t n = self->registry.list(names, MAX_COMMANDS);

    StaticJsonDocument<Limits::CmdReplyBuf> doc;
    doc["ok"] = true;
    JsonArray arr = doc.createNestedArray("cmds");
    for (uint8_t i = 0; i < n; ++i) {
        if (!arr.add(names[i])) break;
    }
    if (doc.overflowed()) {
        writeCmdError(reply, replyLen, "cmd.list", ErrorCode::Failed);
        return false;
    }
    const size_t wrote = serializeJson(doc, reply, replyLen);
    if (wrote == 0 || wrote >= replyLen) {
        writeCmdError(reply, replyLen, "cmd.list", ErrorCode::Failed);
        return false;
    }
    return true;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    logHub = services.get<LogHubService>("loghub");

    svc.registerHandler = svcRegister;
    svc.execute = svcExecute;
    svc.ctx = &registry;
    if (!services.add("cmd", &svc)) {
        LOGE("CommandService registration failed");
        return;
    }

    if (!registry.registerHandler("cmd.list", cmdList, this)) {
        LOGW("cmd.list not registered");
    }
    LOGI("CommandService registered");
}
