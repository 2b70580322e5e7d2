/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      main.cpp
 * Description: Application entry point.
 * =================================================================================
 */

#include <Arduino.h>
#include <Ticker.h>
#include <esp_task_wdt.h>

// --- Module Includes ---
#include "Config.h"
#include "Esp32BleTransport.h"
#include "Esp32CubeHAL.h"
#include "Globals.h"
#include "SerialConsole.h"
#include "SettingsManager.h"

// --- Cube Engine Includes ---
#include "CubeAlarmEngine.h"

// --- Main ticker ---
Ticker engineTicker;
volatile uint32_t tickCounter = 0;
portMUX_TYPE timerMux = portMUX_INITIALIZER_UNLOCKED;

// --- Dependencies ---
Esp32CubeHAL &hal = Esp32CubeHAL::getInstance();
Esp32BleTransport &transport = Esp32BleTransport::getInstance();
SerialConsole &console = SerialConsole::getInstance();

// --- Cube Engine
CubeAlarmEngine *cubeEngine = nullptr;

/**
 * Prints high-level firmware identity and build information.
 */
void printFirmwareDiagnostics() {
    char logBuf[128];

    hal.log("==========================================================================");
    hal.log("                       FIRMWARE IDENTITY                                  ");
    hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: IDENTITY
    // -------------------------------------------------------------------------
    hal.log("[ VERSION INFO ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Firmware Version", DEVICE_VERSION);
    hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: BUILD METADATA
    // -------------------------------------------------------------------------
    hal.log("");
    hal.log("[ BUILD DETAILS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
    hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
    hal.log(logBuf);

#ifdef DEBUG_MODE
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Profile", "DEBUG");
#else
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Profile", "RELEASE");
#endif
    hal.log(logBuf);

    hal.log("==========================================================================");
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

void setup() {
  Serial.begin(SERIAL_BAUD_RATE);
  delay(3000);

  // 1. Initialize Hardware
  hal.initialize();
  printFirmwareDiagnostics();

  hal.tick();

  // 2. Load User Settings (factory values for anything missing)
  g_cubeSettings = DEFAULT_CUBE_SETTINGS;
  SettingsManager::loadSettings(g_cubeSettings);
  hal.setAlarmClock(g_cubeSettings.alarmEnabled, g_cubeSettings.alarmHour, g_cubeSettings.alarmMinute);

  // 3. Bluetooth
  if (!transport.initialize(hal)) {
    hal.logKeyValue("System", "CRITICAL: Bluetooth unavailable. Restarting.");
    hal.tick();
    delay(3000);
    ESP.restart();
  }

  // 4. Initialize Engine
  cubeEngine = new CubeAlarmEngine(hal, transport, g_cubeDefaults);

  if (cubeEngine->begin(g_cubeSettings) != CUBE_OK) {
    hal.logKeyValue("System", "Stored target rejected. Using factory address.");
    strncpy(g_cubeSettings.targetAddress, DEFAULT_CUBE_SETTINGS.targetAddress, CUBE_ADDRESS_TEXT_LENGTH - 1);
    g_cubeSettings.targetAddress[CUBE_ADDRESS_TEXT_LENGTH - 1] = '\0';
    if (cubeEngine->begin(g_cubeSettings) != CUBE_OK) {
      hal.logKeyValue("System", "CRITICAL: No valid target. Link idle.");
    }
  }

  // 5. Diagnostics
  hal.printStartupDiagnostics();
  hal.tick();

  cubeEngine->printStartupDiagnostics();
  hal.tick();

  hal.log("==========================================================================");

  // 6. Start Engine Timer
  hal.logKeyValue("Engine", "Attaching engine ticker.");
  engineTicker.attach_ms(g_cubeDefaults.tickIntervalMs, []() {
    portENTER_CRITICAL_ISR(&timerMux);
    tickCounter++;
    portEXIT_CRITICAL_ISR(&timerMux);
  });

  // 7. Console
  console.begin(cubeEngine);
}

void loop() {
  // 1. System Housekeeping
  esp_task_wdt_reset();

  // 2. Hardware Tick (Inputs, LEDs, Clock, Health, Logging)
  hal.tick();

  // 3. Serial Console
  console.poll();

  // 4. Engine Tick (Link, Commands, Alarm)
  uint32_t pendingTicks = 0;
  portENTER_CRITICAL(&timerMux);
  if (tickCounter > 0) {
    pendingTicks = tickCounter;
    tickCounter = 0;
  }
  portEXIT_CRITICAL(&timerMux);

  if (pendingTicks > 0) {
    if (hal.lockState()) {
      while (pendingTicks > 0 && cubeEngine != nullptr) {
        cubeEngine->tick();
        pendingTicks--;
      }

      hal.unlockState();
    }
  }
}
