/**
 * @file CommandRegistry.cpp
 * @brief Implementation file.
 */
#include "CommandRegistry.h"
#include "Core/SnprintfCheck.h"
#include <cstring>
#include <cstdio>
#define LOG_TAG_CORE "CmdRegst"
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    EVENCROP_SNPRINTF_CHECKED(LOG_TAG_CORE, OUT, LEN, FMT, ##__VA_ARGS__)

static bool isJsonObjectReply_(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = s[i];
        if (c == '\0') return false;
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return c == '{';
    }
    return false;
}

void writeCmdError(char* reply, size_t replyLen, const char* where, ErrorCode code)
{
    if (!reply || replyLen == 0) return;
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool parseCmdArgsObject(const CommandRequest& req, JsonDocument& doc, JsonObjectConst& outObj)
{
    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        /// a full request document carries its args under "args"
        if (json == req.json && doc["args"].is<JsonObject>()) {
            outObj = doc["args"].as<JsonObjectConst>();
            return true;
        }
        outObj = doc.as<JsonObjectConst>();
        return true;
    }

    if (req.json && req.json[0] != '\0' && req.args != req.json) {
        doc.clear();
        const DeserializationError rootErr = deserializeJson(doc, req.json);
        if (rootErr || !doc.is<JsonObject>()) return false;
        JsonVariantConst argsVar = doc["args"];
        if (argsVar.is<JsonObjectConst>()) {
            outObj = argsVar.as<JsonObjectConst>();
            return true;
        }
    }
    return false;
}

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx) {
    if (!cmd || !fn) return false;
    if (count >= MAX_COMMANDS) return false;

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) == 0) return false;
    }

    entries[count++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen) {
    const bool haveReply = (reply && replyLen);
    if (haveReply) reply[0] = '\0';

    if (!cmd || cmd[0] == '\0') {
        if (haveReply) writeCmdError(reply, replyLen, "command", ErrorCode::MissingCmd);
        return false;
    }

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) != 0) continue;

        CommandRequest req{cmd, json, args};
        const bool ok = entries[i].fn(entries[i].userCtx, req, reply, replyLen);
        if (haveReply && !isJsonObjectReply_(reply, replyLen)) {
            writeCmdError(reply, replyLen, "command.reply", ErrorCode::CmdHandlerFailed);
            return false;
        }
        return ok;
    }

    if (haveReply) writeCmdError(reply, replyLen, "command", ErrorCode::UnknownCmd);
    return false;
}

uint8_t CommandRegistry::list(const char** out, uint8_t max) const {
    if (!out) return 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < count && n < max; ++i) out[n++] = entries[i].cmd;
    return n;
}
