/**
 * @file ServiceRegistry.cpp
 * @brief Implementation file.
 */
#include "ServiceRegistry.h"

bool ServiceRegistry::add(const char* id, const void* service) {
    if (!id || !service) return false;
    if (count >= MAX_SERVICES) return false;
    /// ids are unique, first registration wins
    if (getRaw(id)) return false;
    entries[count++] = {id, service};
    return true;
}

const void* ServiceRegistry::getRaw(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].id, id) == 0)
            return entries[i].ptr;
    }
    return nullptr;
}
