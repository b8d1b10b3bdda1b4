/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    if (n >= (int)Limits::MaxLogSinks) return false;
    sinks[n++] = sink;
    return true;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}

void LogSinkRegistry::broadcast(const LogEntry& e) const {
    for (int i = 0; i < n; ++i) {
        if (sinks[i].write) sinks[i].write(sinks[i].ctx, e);
    }
}
