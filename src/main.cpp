/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
#include "Modules/Stores/DataStoreModule/DataStoreModule.h"
// System Modules
#include "Modules/System/SystemModule/SystemModule.h"
#include "Modules/SerialConsoleModule/SerialConsoleModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/IrrigationModule/IrrigationModule.h"
#include "Modules/IrrigationModule/Drivers/GpioHardwareIO.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

/// sorties forcées à OFF avant tout module
static GpioHardwareIO       hardware;

static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static DataStoreModule      dataStoreModule;
static SystemModule         systemModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;
static IrrigationModule     irrigationModule(hardware);
static SerialConsoleModule  serialConsoleModule;

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

void setup() {
    requireSetup(hardware.begin(), "gpio outputs");

    Serial.begin(115200);
    delay(50);
    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "preferences");
    registry.setPreferences(preferences);
    requireSetup(registry.begin(), "config store");

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add log.dispatcher");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add log.sink.serial");
    requireSetup(moduleManager.add(&eventBusModule), "add eventbus");

    requireSetup(moduleManager.add(&commandModule), "add cmd");
    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&dataStoreModule), "add datastore");
    requireSetup(moduleManager.add(&systemModule), "add system");
    requireSetup(moduleManager.add(&irrigationModule), "add irrigation");
    requireSetup(moduleManager.add(&serialConsoleModule), "add console");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    /// le module a créé sa file dans init(), les fronts peuvent arriver
    requireSetup(hardware.attachInputs(IrrigationModule::onSwitchEdgeIsr, &irrigationModule), "gpio inputs");

    Serial.print(
        "\x1b[32m"
        " _____                  ____                \n"
        "| ____|_   _____ _ __  / ___|_ __ ___  _ __  \n"
        "|  _| \\ \\ / / _ \\ '_ \\| |   | '__/ _ \\| '_ \\ \n"
        "| |___ \\ V /  __/ | | | |___| | | (_) | |_) |\n"
        "|_____| \\_/ \\___|_| |_|\\____|_|  \\___/| .__/ \n"
        "                                      |_|    \n"
        "\x1b[0m"
        );
}

void loop() {
    delay(1000);
}
