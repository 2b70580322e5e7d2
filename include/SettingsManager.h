/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for Device Configuration and Storage.
 * - Manages all NVS (Preferences) interactions.
 * - Falls back to factory settings for anything missing or invalid.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include <stdint.h>

class SettingsManager {
public:
  // --- User Settings ---
  // Loads stored settings on top of 'settings' (which holds the factory values).
  static void loadSettings(CubeSettings &settings);
  static void saveSettings(const CubeSettings &settings);

  // --- Boot & Crash Diagnostics ---
  static int getCrashCount();
  static void incrementCrashCount();
  static void clearCrashCount();

  // --- Factory Reset ---
  static void wipeAll();

private:
  static void log(const char *key, const char *value);
};
