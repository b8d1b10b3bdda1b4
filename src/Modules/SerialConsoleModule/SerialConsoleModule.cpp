/**
 * @file SerialConsoleModule.cpp
 * @brief Implementation file.
 */
#include "SerialConsoleModule.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <string.h>
#define LOG_TAG "Console "
#include "Core/ModuleLog.h"

void SerialConsoleModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfgStore_ = &cfg;
    cmdSvc_ = services.get<CommandService>("cmd");
    cfgSvc_ = services.get<ConfigStoreService>("config");
    if (!cmdSvc_) LOGW("CommandService missing, commands disabled");
    if (!cfgSvc_) LOGW("ConfigStoreService missing, cfg patches disabled");
}

void SerialConsoleModule::loop()
{
    cfgStore_->logNvsWriteSummaryIfDue(millis());

    while (Serial.available() > 0) {
        const int c = Serial.read();
        if (c < 0) break;
        if (c == '\r') continue;

        if (c == '\n') {
            if (overflow_) {
                LOGW("Line dropped (> %u bytes)", (unsigned)Limits::Console::LineBuf);
                printError_(ErrorCode::ArgsTooLarge, "console");
            } else if (lineLen_ > 0) {
                line_[lineLen_] = '\0';
                processLine_(line_);
            }
            lineLen_ = 0;
            overflow_ = false;
            continue;
        }

        if (lineLen_ < Limits::Console::LineBuf) {
            line_[lineLen_++] = (char)c;
        } else {
            overflow_ = true;
        }
    }
}

void SerialConsoleModule::processLine_(char* line)
{
    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, (const char*)line);
    if (err || !doc.is<JsonObjectConst>()) {
        LOGW("Bad json line (%s)", err ? err.c_str() : "not an object");
        printError_(ErrorCode::BadCmdJson, "console");
        return;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.containsKey("cmd")) {
        processCmd_(root, line);
        return;
    }
    if (root.containsKey("cfg")) {
        processCfg_(root);
        return;
    }
    printError_(ErrorCode::MissingCmd, "console");
}

void SerialConsoleModule::processCmd_(JsonObjectConst root, const char* raw)
{
    JsonVariantConst cmdVar = root["cmd"];
    const char* cmdVal = cmdVar.is<const char*>() ? cmdVar.as<const char*>() : nullptr;
    if (!cmdVal || cmdVal[0] == '\0') {
        printError_(ErrorCode::MissingCmd, "cmd");
        return;
    }
    if (!cmdSvc_ || !cmdSvc_->execute) {
        printError_(ErrorCode::CmdServiceUnavailable, "cmd");
        return;
    }

    char cmd[Limits::Console::CmdName];
    size_t clen = strlen(cmdVal);
    if (clen >= sizeof(cmd)) clen = sizeof(cmd) - 1;
    memcpy(cmd, cmdVal, clen);
    cmd[clen] = '\0';

    const char* argsJson = nullptr;
    char argsBuf[Limits::Console::CmdArgs] = {0};
    JsonVariantConst argsVar = root["args"];
    if (!argsVar.isNull()) {
        const size_t written = serializeJson(argsVar, argsBuf, sizeof(argsBuf));
        if (written == 0 || written >= sizeof(argsBuf)) {
            printError_(ErrorCode::ArgsTooLarge, "cmd");
            return;
        }
        argsJson = argsBuf;
    }

    replyBuf_[0] = '\0';
    const bool ok = cmdSvc_->execute(cmdSvc_->ctx, cmd, raw, argsJson, replyBuf_, sizeof(replyBuf_));
    if (!ok) {
        LOGD("cmd %s failed", cmd);
        /// le handler a déjà écrit une erreur JSON
        if (replyBuf_[0] == '{') Serial.println(replyBuf_);
        else printError_(ErrorCode::CmdHandlerFailed, "cmd");
        return;
    }

    const int wrote = snprintf(ackBuf_, sizeof(ackBuf_), "{\"ok\":true,\"cmd\":\"%s\",\"reply\":%s}", cmd, replyBuf_);
    if (!(wrote > 0 && (size_t)wrote < sizeof(ackBuf_))) {
        printError_(ErrorCode::Failed, "cmd");
        return;
    }
    Serial.println(ackBuf_);
}

void SerialConsoleModule::processCfg_(JsonObjectConst root)
{
    if (!cfgSvc_ || !cfgSvc_->applyJson) {
        printError_(ErrorCode::CfgServiceUnavailable, "cfg");
        return;
    }
    JsonVariantConst patch = root["cfg"];
    if (!patch.is<JsonObjectConst>()) {
        printError_(ErrorCode::BadCfgJson, "cfg");
        return;
    }

    const size_t written = serializeJson(patch, cfgBuf_, sizeof(cfgBuf_));
    if (written == 0 || written >= sizeof(cfgBuf_)) {
        printError_(ErrorCode::CfgTruncated, "cfg");
        return;
    }
    if (!cfgSvc_->applyJson(cfgSvc_->ctx, cfgBuf_)) {
        printError_(ErrorCode::CfgApplyFailed, "cfg");
        return;
    }
    Serial.println("{\"ok\":true}");
}

void SerialConsoleModule::printError_(ErrorCode code, const char* where)
{
    if (!writeErrorJson(ackBuf_, sizeof(ackBuf_), code, where)) {
        snprintf(ackBuf_, sizeof(ackBuf_), "{\"ok\":false}");
    }
    Serial.println(ackBuf_);
}
