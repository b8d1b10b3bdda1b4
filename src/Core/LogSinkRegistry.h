#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Fixed-size registry of log sinks.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"

/**
 * @brief Sinks are added during init and only enumerated afterwards.
 */
class LogSinkRegistry {
public:
    bool add(LogSinkService sink);
    int count() const { return n; }
    /** @brief Sink by index, empty service when out of range. */
    LogSinkService get(int idx) const;

    /** @brief Write one entry to every sink. */
    void broadcast(const LogEntry& e) const;

private:
    LogSinkService sinks[Limits::MaxLogSinks]{};
    int n = 0;
};
