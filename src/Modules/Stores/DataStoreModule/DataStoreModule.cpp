/**
 * @file DataStoreModule.cpp
 * @brief Implementation file.
 */
#include "DataStoreModule.h"
#define LOG_TAG "DataStMd"
#include "Core/ModuleLog.h"

void DataStoreModule::init(ConfigStore&, ServiceRegistry& services)
{
    auto* eb = services.get<EventBusService>("eventbus");
    if (eb && eb->bus) {
        _store.setEventBus(eb->bus);
    } else {
        LOGW("EventBus missing, data changes will not be published");
    }

    if (!services.add("datastore", &_svc)) {
        LOGE("DataStoreService registration failed");
    }
}
