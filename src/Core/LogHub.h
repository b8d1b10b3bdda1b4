#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue between producers and the dispatcher task.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"
#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

/**
 * @brief Queue-based log hub. Producers never block; a full queue drops.
 */
class LogHub {
public:
    /** @brief Create the log queue. */
    bool init(uint16_t queueLen = Limits::LogQueueLen);

    /** @brief Enqueue a log entry (non-blocking). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitTicks). */
    bool dequeue(LogEntry& out, TickType_t waitTicks);

    /** @brief Entries dropped since the last call. */
    uint32_t takeDropped() { return dropped_.exchange(0U, std::memory_order_relaxed); }

private:
    QueueHandle_t q = nullptr;
    std::atomic<uint32_t> dropped_{0};
};
