/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

bool LogHub::init(uint16_t queueLen) {
    if (q) return true;
    q = xQueueCreate(queueLen, sizeof(LogEntry));
    return q != nullptr;
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q) return false;
    if (xQueueSend(q, &e, 0) == pdTRUE) return true;  ///< 0 => non bloquant
    dropped_.fetch_add(1U, std::memory_order_relaxed);
    return false;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q) return false;
    return xQueueReceive(q, &out, waitTicks) == pdTRUE;
}
