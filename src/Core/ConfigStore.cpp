/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <math.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

static bool readNumber_(JsonVariantConst v, double& out) {
    if (v.is<bool>()) return false;
    if (!(v.is<int32_t>() || v.is<uint32_t>() || v.is<float>() || v.is<double>())) return false;
    out = v.as<double>();
    return isfinite(out);
}

static bool readBool_(JsonVariantConst v, bool& out) {
    if (v.is<bool>()) {
        out = v.as<bool>();
        return true;
    }
    double n = 0.0;
    if (!readNumber_(v, n)) return false;
    out = (n != 0.0);
    return true;
}

bool ConfigStore::begin()
{
    if (_mutex) return true;
    _mutex = xSemaphoreCreateRecursiveMutex();
    if (!_mutex) {
        Log::error(LOG_TAG_CORE, "mutex creation failed");
        return false;
    }
    return true;
}

bool ConfigStore::lock(uint32_t timeoutMs) const
{
    /// before begin() only the boot task runs
    if (!_mutex) return true;
    return xSemaphoreTakeRecursive(_mutex, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

void ConfigStore::unlock() const
{
    if (!_mutex) return;
    (void)xSemaphoreGiveRecursive(_mutex);
}

void ConfigStore::notifyChanged(const char* module, const char* nvsKey)
{
    if (!_eventBus) return;

    ConfigChangedPayload p{};
    if (module) strncpy(p.module, module, sizeof(p.module) - 1);
    if (nvsKey) strncpy(p.nvsKey, nvsKey, sizeof(p.nvsKey) - 1);

    if (!_eventBus->post(EventId::ConfigChanged, &p, sizeof(p))) {
        Log::warn(LOG_TAG_CORE, "ConfigChanged dropped (%s)", nvsKey ? nvsKey : "-");
    }
}

void ConfigStore::recordNvsWrite_(size_t bytesWritten)
{
    if (bytesWritten == 0) return;
    _nvsWriteTotal.fetch_add(1U, std::memory_order_relaxed);
    _nvsWriteWindow.fetch_add(1U, std::memory_order_relaxed);
}

void ConfigStore::putInt_(const char* key, int32_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putInt(key, value));
}

void ConfigStore::putUChar_(const char* key, uint8_t value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putUChar(key, value));
}

void ConfigStore::putBool_(const char* key, bool value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putBool(key, value));
}

void ConfigStore::putFloat_(const char* key, float value)
{
    if (!_prefs || !key) return;
    recordNvsWrite_(_prefs->putFloat(key, value));
}

void ConfigStore::putBytes_(const char* key, const void* value, size_t len)
{
    if (!_prefs || !key || !value || len == 0) return;
    recordNvsWrite_(_prefs->putBytes(key, value, len));
}

void ConfigStore::putString_(const char* key, const char* value)
{
    if (!_prefs || !key || !value) return;
    recordNvsWrite_(_prefs->putString(key, value));
}

void ConfigStore::logNvsWriteSummaryIfDue(uint32_t nowMs, uint32_t periodMs)
{
    if (periodMs == 0U) return;

    const uint32_t last = _nvsLastSummaryMs.load(std::memory_order_relaxed);
    if (last == 0U) {
        _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
        return;
    }
    if ((uint32_t)(nowMs - last) < periodMs) return;

    _nvsLastSummaryMs.store(nowMs, std::memory_order_relaxed);
    const uint32_t windowWrites = _nvsWriteWindow.exchange(0U, std::memory_order_relaxed);
    const uint32_t totalWrites = _nvsWriteTotal.load(std::memory_order_relaxed);
    if (windowWrites == 0U) return;

    Log::info(LOG_TAG_CORE, "NVS writes: last_%lus=%lu total=%lu",
              (unsigned long)(periodMs / 1000U),
              (unsigned long)windowWrites,
              (unsigned long)totalWrites);
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    switch (m.type) {
        case ConfigType::Int32:
            putInt_(m.nvsKey, *(int32_t*)m.valuePtr);
            return true;
        case ConfigType::UInt8:
            putUChar_(m.nvsKey, *(uint8_t*)m.valuePtr);
            return true;
        case ConfigType::Bool:
            putBool_(m.nvsKey, *(bool*)m.valuePtr);
            return true;
        case ConfigType::Float:
            putFloat_(m.nvsKey, *(float*)m.valuePtr);
            return true;
        case ConfigType::Double:
            putBytes_(m.nvsKey, m.valuePtr, sizeof(double));
            return true;
        case ConfigType::CharArray:
            putString_(m.nvsKey, (const char*)m.valuePtr);
            return true;
        default:
            return false;
    }
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;
    if (!lock()) {
        Log::error(LOG_TAG_CORE, "loadPersistent: lock timeout");
        return;
    }

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey) continue;
        /// absent keys keep the compiled-in default
        if (!_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::Float:
                *(float*)m.valuePtr = _prefs->getFloat(m.nvsKey, *(float*)m.valuePtr);
                break;
            case ConfigType::Double: {
                double tmp = *(double*)m.valuePtr;
                if (_prefs->getBytes(m.nvsKey, &tmp, sizeof(double)) == sizeof(double)) {
                    *(double*)m.valuePtr = tmp;
                }
                break;
            }
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
            default:
                break;
        }
    }
    unlock();
}

void ConfigStore::savePersistent()
{
    if (!_prefs) return;
    if (!lock()) return;

    Log::debug(LOG_TAG_CORE, "savePersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (!writePersistent(_meta[i])) {
            Log::warn(LOG_TAG_CORE, "savePersistent: failed %s", _meta[i].nvsKey ? _meta[i].nvsKey : "-");
        }
    }
    unlock();
}

bool ConfigStore::erasePersistent()
{
    if (!_prefs) return false;
    if (!lock()) return false;
    const bool ok = _prefs->clear();
    unlock();
    Log::warn(LOG_TAG_CORE, "NVS erase %s", ok ? "done" : "failed");
    return ok;
}

const ConfigMeta* ConfigStore::findMeta_(const char* module, const char* jsonName) const
{
    if (!module || !jsonName) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, jsonName)) return &_meta[i];
    }
    return nullptr;
}

bool ConfigStore::writeModuleBody_(const char* module, char* out, size_t outLen, size_t& pos) const
{
    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!strEquals(m.module, module)) continue;

        if (any) {
            if (pos + 1 >= outLen) return false;
            out[pos++] = ',';
        }

        int n = snprintf(out + pos, outLen - pos, "\"%s\":", m.name ? m.name : "");
        if (n <= 0 || pos + (size_t)n >= outLen) return false;
        pos += (size_t)n;

        switch (m.type) {
            case ConfigType::Int32:
                n = snprintf(out + pos, outLen - pos, "%ld", (long)*(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                n = snprintf(out + pos, outLen - pos, "%u", (unsigned)*(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                n = snprintf(out + pos, outLen - pos, "%s", (*(bool*)m.valuePtr) ? "true" : "false");
                break;
            case ConfigType::Float:
                n = snprintf(out + pos, outLen - pos, "%.3f", (double)*(float*)m.valuePtr);
                break;
            case ConfigType::Double:
                n = snprintf(out + pos, outLen - pos, "%.6f", *(double*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                n = snprintf(out + pos, outLen - pos, "\"%s\"", (const char*)m.valuePtr);
                break;
            default:
                n = snprintf(out + pos, outLen - pos, "null");
                break;
        }

        if (n <= 0 || pos + (size_t)n >= outLen) return false;
        pos += (size_t)n;
        any = true;
    }
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen < 3) return false;
    if (!module || module[0] == '\0') {
        out[0] = '\0';
        return false;
    }

    bool known = false;
    for (uint16_t i = 0; i < _metaCount && !known; ++i) known = strEquals(_meta[i].module, module);
    if (!known) {
        snprintf(out, outLen, "{}");
        return false;
    }

    if (!lock()) return false;
    size_t pos = 0;
    out[pos++] = '{';
    bool ok = writeModuleBody_(module, out, outLen, pos);
    if (ok && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        ok = false;
        out[outLen - 1] = '\0';
    }
    unlock();

    if (truncated) *truncated = !ok;
    return true;
}

bool ConfigStore::toJson(char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen < 3) return false;

    const char* modules[Limits::MaxConfigModules];
    const uint8_t modCount = listModules(modules, Limits::MaxConfigModules);

    if (!lock()) return false;
    size_t pos = 0;
    out[pos++] = '{';
    bool ok = true;
    for (uint8_t i = 0; i < modCount && ok; ++i) {
        const int n = snprintf(out + pos, outLen - pos, "%s\"%s\":{", (i > 0) ? "," : "", modules[i]);
        if (n <= 0 || pos + (size_t)n >= outLen) {
            ok = false;
            break;
        }
        pos += (size_t)n;
        ok = writeModuleBody_(modules[i], out, outLen, pos);
        if (ok) {
            if (pos + 1 >= outLen) ok = false;
            else out[pos++] = '}';
        }
    }
    if (ok && pos + 2 <= outLen) {
        out[pos++] = '}';
        out[pos] = '\0';
    } else {
        ok = false;
        out[outLen - 1] = '\0';
    }
    unlock();

    if (truncated) *truncated = !ok;
    return ok;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json || json[0] == '\0') return false;
    if (!lock()) {
        Log::warn(LOG_TAG_CORE, "applyJson: lock timeout");
        return false;
    }

    static StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) {
        unlock();
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    uint16_t changedCount = 0;
    uint16_t skipped = 0;
    for (JsonPairConst modPair : root) {
        JsonObjectConst body = modPair.value().as<JsonObjectConst>();
        if (body.isNull()) {
            ++skipped;
            continue;
        }
        const char* module = modPair.key().c_str();

        for (JsonPairConst kv : body) {
            const ConfigMeta* mc = findMeta_(module, kv.key().c_str());
            if (!mc) {
                ++skipped;
                continue;
            }
            ConfigMeta& m = const_cast<ConfigMeta&>(*mc);
            JsonVariantConst v = kv.value();
            bool changed = false;
            bool valid = true;
            double num = 0.0;

            switch (m.type) {
            case ConfigType::Int32: {
                valid = readNumber_(v, num);
                if (!valid) break;
                if (num > (double)INT32_MAX) num = (double)INT32_MAX;
                if (num < (double)INT32_MIN) num = (double)INT32_MIN;
                const int32_t nv = (int32_t)lround(num);
                if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::UInt8: {
                valid = readNumber_(v, num);
                if (!valid) break;
                if (num < 0.0) num = 0.0;
                if (num > 255.0) num = 255.0;
                const uint8_t nv = (uint8_t)lround(num);
                if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Bool: {
                bool nv = false;
                valid = readBool_(v, nv);
                if (valid && *(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Float: {
                valid = readNumber_(v, num);
                const float nv = (float)num;
                if (valid && *(float*)m.valuePtr != nv) { *(float*)m.valuePtr = nv; changed = true; }
                break;
            }
            case ConfigType::Double: {
                valid = readNumber_(v, num);
                if (valid && *(double*)m.valuePtr != num) { *(double*)m.valuePtr = num; changed = true; }
                break;
            }
            case ConfigType::CharArray: {
                const char* s = v.as<const char*>();
                valid = (s != nullptr) && m.size > 0;
                if (!valid) break;
                size_t len = strlen(s);
                if (len >= m.size) len = m.size - 1;
                /// compare before writing to avoid unnecessary events
                char* dst = (char*)m.valuePtr;
                if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                    memcpy(dst, s, len);
                    dst[len] = '\0';
                    changed = true;
                }
                break;
            }
            }

            if (!valid) {
                ++skipped;
                Log::warn(LOG_TAG_CORE, "applyJson: bad value %s.%s", module, m.name ? m.name : "-");
                continue;
            }
            if (!changed) continue;

            ++changedCount;
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", module, m.name ? m.name : "-");
            if (m.persistence == ConfigPersistence::Persistent && m.nvsKey) {
                (void)writePersistent(m);
            }
            notifyChanged(m.module, m.nvsKey);
        }
    }
    unlock();

    Log::debug(LOG_TAG_CORE, "applyJson: changed=%u skipped=%u", (unsigned)changedCount, (unsigned)skipped);
    return true;
}
