#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service.
 */
#include "Core/ModulePassive.h"
#include "Core/CommandRegistry.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring ConfigStore JSON services and config commands.
 */
class ConfigStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "config"; }

    /** @brief Config module depends on log hub and command registry. */
    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    /** @brief Register config services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* registry = nullptr;
    ConfigStoreService svc{};
    const CommandService* cmdSvc = nullptr;
    const LogHubService* logHub = nullptr;

    static bool svcApplyJson(void* ctx, const char* json);
    static bool svcToJson(void* ctx, char* out, size_t outLen, bool* truncated);
    static bool svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    static uint8_t svcListModules(void* ctx, const char** out, uint8_t max);
    static bool svcErase(void* ctx);

    static bool cmdGet(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdErase(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
