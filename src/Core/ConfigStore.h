#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// ConfigStore integrates with the EventBus:
// - When a config value changes (set() or applyJson()), it posts an
//   EventId::ConfigChanged event.
//
// Design goals (ESP32):
// - no heap allocations in normal runtime path
// - writers and multi-field readers serialize on one recursive mutex

#include <Preferences.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <type_traits>

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

#include "ConfigTypes.h"
#include "Core/Log.h"
#include "Core/EventBus/EventBus.h"
#include "Core/EventBus/EventPayloads.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    static constexpr size_t MAX_CONFIG_VARS = Limits::MaxConfigVars;

    ConfigStore() = default;

    /** @brief Create the store mutex. Call once before any task starts. */
    bool begin();

    /** @brief Inject EventBus dependency for change notifications. */
    void setEventBus(EventBus* bus) { _eventBus = bus; }
    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /**
     * @brief Take the store lock (recursive).
     *
     * Readers copying several values that must stay consistent hold it for
     * the duration of the copy only.
     */
    bool lock(uint32_t timeoutMs = Limits::ConfigLockTimeoutMs) const;
    void unlock() const;

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();
    /** @brief Save persistent values from registered variables into NVS. */
    void savePersistent();
    /** @brief Erase the whole NVS namespace (values in RAM are kept until reboot). */
    bool erasePersistent();

    /** @brief Serialize all registered config as `{"module":{...},...}`. */
    bool toJson(char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply a `{"module":{"name":value}}` patch.
     *
     * Unknown modules/names and values of the wrong JSON type are skipped.
     * @return false only when the document cannot be parsed.
     */
    bool applyJson(const char* json);

    /** @brief Log NVS write summary when the configured period elapsed. */
    void logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs = Limits::NvsSummaryPeriodMs);

    uint16_t varCount() const { return _metaCount; }

private:
    Preferences* _prefs = nullptr;
    EventBus* _eventBus = nullptr;
    SemaphoreHandle_t _mutex = nullptr;
    ConfigMeta _meta[MAX_CONFIG_VARS];
    uint16_t _metaCount = 0;

    void notifyChanged(const char* module, const char* nvsKey);
    bool writePersistent(const ConfigMeta& m);
    void recordNvsWrite_(size_t bytesWritten);
    void putInt_(const char* key, int32_t value);
    void putUChar_(const char* key, uint8_t value);
    void putBool_(const char* key, bool value);
    void putFloat_(const char* key, float value);
    void putBytes_(const char* key, const void* value, size_t len);
    void putString_(const char* key, const char* value);

    const ConfigMeta* findMeta_(const char* module, const char* jsonName) const;
    bool writeModuleBody_(const char* module, char* out, size_t outLen, size_t& pos) const;

    std::atomic<uint32_t> _nvsWriteTotal{0};
    std::atomic<uint32_t> _nvsWriteWindow{0};
    std::atomic<uint32_t> _nvsLastSummaryMs{0};
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= MAX_CONFIG_VARS) {
        Log::error(LOG_TAG_CORE, "config table full (%s.%s)",
                   var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return false;
    }

    // champ par champ (évite initializer list incompatible)
    ConfigMeta& m = _meta[_metaCount++];

    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    if (!var.value) return false;
    if (!lock()) return false;

    bool changed = false;
    if (*(var.value) != value) {
        *(var.value) = value;
        changed = true;
    }

    if (changed && var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        switch (var.type) {
        case ConfigType::Int32:  putInt_(var.nvsKey, *(int32_t*)var.value); break;
        case ConfigType::UInt8:  putUChar_(var.nvsKey, *(uint8_t*)var.value); break;
        case ConfigType::Bool:   putBool_(var.nvsKey, *(bool*)var.value); break;
        case ConfigType::Float:  putFloat_(var.nvsKey, *(float*)var.value); break;
        case ConfigType::Double: putBytes_(var.nvsKey, var.value, sizeof(double)); break;
        default: break;
        }
    }
    unlock();

    if (!changed) return true;

    var.notify();
    notifyChanged(var.moduleName, var.nvsKey);
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;
    if (!lock()) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    bool changed = false;
    if (strncmp(var.value, str, len) != 0 || var.value[len] != '\0') {
        memcpy(var.value, str, len);
        var.value[len] = '\0';
        changed = true;
    }

    if (changed && var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        putString_(var.nvsKey, var.value);
    }
    unlock();

    if (!changed) return true;

    var.notify();
    notifyChanged(var.moduleName, var.nvsKey);
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
