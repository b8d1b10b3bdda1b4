#pragma once
/**
 * @file DataModel.h
 * @brief Runtime data model types for the DataStore.
 */
#include <stdbool.h>

#include "Modules/IrrigationModule/IrrigationModuleDataModel.h"

/** @brief Root runtime data model: one member per module contribution. */
struct RuntimeData {
    IrrigationRuntimeData irrigation;
};
