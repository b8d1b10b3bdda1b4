#pragma once
/**
 * @file SerialConsoleModule.h
 * @brief Line-oriented JSON console on the USB serial port.
 */
#include "Core/Module.h"
#include "Core/Services/Services.h"
#include "Core/SystemLimits.h"
#include "Core/ErrorCodes.h"
#include <ArduinoJson.h>

/**
 * @brief Reads one JSON document per line from Serial.
 *
 * `{"cmd":"name","args":{...}}` runs a registered command,
 * `{"cfg":{...}}` applies a config patch. Every line gets one JSON answer.
 */
class SerialConsoleModule : public Module {
public:
    const char* moduleId() const override { return "console"; }
    const char* taskName() const override { return "Console"; }
    BaseType_t taskCore() const override { return 0; }
    uint16_t taskStackSize() const override { return 6144; }
    uint32_t loopDelayMs() const override { return 20; }

    uint8_t dependencyCount() const override { return 3; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        if (i == 2) return "config";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

private:
    void processLine_(char* line);
    void processCmd_(JsonObjectConst root, const char* raw);
    void processCfg_(JsonObjectConst root);
    void printError_(ErrorCode code, const char* where);

    ConfigStore* cfgStore_ = nullptr;
    const CommandService* cmdSvc_ = nullptr;
    const ConfigStoreService* cfgSvc_ = nullptr;

    char line_[Limits::Console::LineBuf + 1] = {0};
    size_t lineLen_ = 0;
    bool overflow_ = false;

    char replyBuf_[Limits::CmdReplyBuf] = {0};
    char ackBuf_[Limits::Console::AckBuf] = {0};
    char cfgBuf_[Limits::JsonConfigApplyBuf] = {0};
};
