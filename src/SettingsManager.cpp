/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of settings persistence and boot diagnostics.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "CubeCipher.h"
#include "Esp32CubeHAL.h" // For logging
#include "Globals.h"
#include <Arduino.h>
#include <Preferences.h>

// --- Preferences Namespaces ---
static Preferences cubePrefs;
static Preferences bootPrefs;

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { Esp32CubeHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: FACTORY RESET
// =================================================================================

void SettingsManager::wipeAll() {
  log("Settings", "Performing Full Factory Wipe...");

  cubePrefs.begin("cube", false);
  cubePrefs.clear();
  cubePrefs.end();
  bootPrefs.begin("boot", false);
  bootPrefs.clear();
  bootPrefs.end();

  log("Settings", "Factory Wipe Complete.");
}

// =================================================================================
// SECTION: USER SETTINGS
// =================================================================================

void SettingsManager::loadSettings(CubeSettings &settings) {
  cubePrefs.begin("cube", true);

  // 1. Target Cube
  String address = cubePrefs.getString("address", settings.targetAddress);
  DeviceIdentity identity;
  if (CubeCipher::parseAddress(address.c_str(), identity) == CUBE_OK) {
    strncpy(settings.targetAddress, address.c_str(), CUBE_ADDRESS_TEXT_LENGTH - 1);
    settings.targetAddress[CUBE_ADDRESS_TEXT_LENGTH - 1] = '\0';
  } else {
    log("Settings", "Stored address invalid, using default.");
  }

  // 2. Write Mode
  uint8_t mode = cubePrefs.getUChar("writeMode", (uint8_t)settings.writeMode);
  settings.writeMode = (mode == WRITE_WITH_RESPONSE) ? WRITE_WITH_RESPONSE : WRITE_NO_RESPONSE;

  // 3. Alarm
  settings.alarmEnabled = cubePrefs.getBool("alarmOn", settings.alarmEnabled);
  settings.alarmHour = cubePrefs.getUChar("alarmHour", settings.alarmHour);
  settings.alarmMinute = cubePrefs.getUChar("alarmMin", settings.alarmMinute);

  // Sanity check to prevent an alarm that never fires
  if (settings.alarmHour > 23 || settings.alarmMinute > 59) {
    settings.alarmEnabled = false;
    settings.alarmHour = 0;
    settings.alarmMinute = 0;
  }

  // 4. Practice Mode
  settings.ringOnScramble = cubePrefs.getBool("ringScramble", settings.ringOnScramble);

  cubePrefs.end();
}

void SettingsManager::saveSettings(const CubeSettings &settings) {
  cubePrefs.begin("cube", false);
  cubePrefs.putString("address", settings.targetAddress);
  cubePrefs.putUChar("writeMode", (uint8_t)settings.writeMode);
  cubePrefs.putBool("alarmOn", settings.alarmEnabled);
  cubePrefs.putUChar("alarmHour", settings.alarmHour);
  cubePrefs.putUChar("alarmMin", settings.alarmMinute);
  cubePrefs.putBool("ringScramble", settings.ringOnScramble);
  cubePrefs.end();

  log("Settings", "Settings saved.");
}

// =================================================================================
// SECTION: BOOT DIAGNOSTICS
// =================================================================================

int SettingsManager::getCrashCount() {
  bootPrefs.begin("boot", true);
  int c = bootPrefs.getInt("crashes", 0);
  bootPrefs.end();
  return c;
}

void SettingsManager::incrementCrashCount() {
  bootPrefs.begin("boot", false);
  int c = bootPrefs.getInt("crashes", 0);
  bootPrefs.putInt("crashes", c + 1);
  bootPrefs.end();
}

void SettingsManager::clearCrashCount() {
  bootPrefs.begin("boot", false);
  bootPrefs.putInt("crashes", 0);
  bootPrefs.end();
}
