#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>
#include <ArduinoJson.h>
#include "Core/ErrorCodes.h"

/** @brief Maximum number of registered commands. */
constexpr uint8_t MAX_COMMANDS = 24;

/** @brief Command invocation context. */
struct CommandRequest {
    const char* cmd;
    const char* json;   ///< full request document, may be nullptr
    const char* args;   ///< args object text, may be nullptr
};

/** @brief Handler signature for commands. */
using CommandHandler = bool (*)(void* userCtx,
                                const CommandRequest& req,
                                char* reply,
                                size_t replyLen);

/** @brief Registered command entry. */
struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers.
 *
 * Handlers must write a JSON object into `reply`; anything else is replaced
 * by a CmdHandlerFailed error.
 */
class CommandRegistry {
public:
    /** @brief Register a handler for a command string (names are unique). */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    /** @brief Execute a command into a reply buffer. */
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);

    /** @brief Registered command names, in registration order. */
    uint8_t list(const char** out, uint8_t max) const;

private:
    CommandEntry entries[MAX_COMMANDS]{};
    uint8_t count = 0;
};

/**
 * @brief Resolve the args object of a request.
 *
 * Tries `req.args` first, then the `"args"` member of `req.json`. The object
 * stays valid while `doc` is alive and untouched.
 */
bool parseCmdArgsObject(const CommandRequest& req, JsonDocument& doc, JsonObjectConst& outObj);

/** @brief Write an error reply, falling back to `{"ok":false}` when it does not fit. */
void writeCmdError(char* reply, size_t replyLen, const char* where, ErrorCode code);
