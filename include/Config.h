/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines hardware pin mappings, system constants,
 * link timing tables and the factory user settings.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Device Name String ---
#define DEVICE_NAME "CubeAlarm-ESP32"
#define DEVICE_VERSION "1.2.0"

// =================================================================================
// SECTION: HARDWARE & SYSTEM OBJECTS
// =================================================================================

#define SERIAL_BAUD_RATE 115200
#define DEFAULT_WDT_TIMEOUT 20 // Seconds
#define MIN_FREE_HEAP 10000    // Bytes, below this the device restarts
#define BOOT_LOOP_THRESHOLD 5
#define STABLE_BOOT_TIME_MS 60000
#define CONSOLE_LINE_LENGTH 256

// --- Pin Definitions ---
#define PCB_BUTTON_PIN 0 // Standard ESP32 Boot Button (Button A)
#define BUZZER_PIN 25

#ifdef DEBUG_MODE
// Development board
#define STATUS_LED_PIN 2
// BUTTON_B_PIN is purposefully undefined in Debug mode
#else
// Production board
#define STATUS_LED_PIN 21
#define BUTTON_B_PIN 15
#endif

// --- Alarm Tone ---
#define ALARM_TONE_HZ 2700
#define ALARM_BEEP_ON_MS 400
#define ALARM_BEEP_OFF_MS 200

// --- Time Zone (POSIX TZ string) ---
#define DEFAULT_TZ "UTC0"

// =================================================================================
// SECTION: LINK TIMING
// =================================================================================

#ifdef DEBUG_MODE
// ============================================================================
// DEBUG / DEVELOPMENT DEFAULTS
// ============================================================================
static const CubeDefaults DEFAULT_CUBE_DEFS = {
    5,      // tickIntervalMs

    15000,  // scanDurationMs
    100000, // scanIntervalUs
    50000,  // scanWindowUs
    true,   // activeScan

    10000,  // connectTimeoutMs
    10000,  // discoveryTimeoutMs
    1000,   // reconnectDelayMs
    100,    // busyRearmMs
    200,    // cccdCooldownMs
    2000,   // cccdConfirmTimeoutMs
    2000,   // initialStateTimeoutMs
    5,      // initialStateMaxRequests

    100,    // writeCooldownMs
    3,      // commandRetryBudget
    300,    // commandRetryIntervalMs
    50,     // commandBusyRetryMs
    80,     // statePollDelayMs
    250,    // statePollRateLimitMs

    4,      // notificationsPerTick

    1500    // longPressDuration
};

#else
// ============================================================================
// PRODUCTION / RELEASE DEFAULTS
// ============================================================================
static const CubeDefaults DEFAULT_CUBE_DEFS = {
    5,      // tickIntervalMs

    30000,  // scanDurationMs
    100000, // scanIntervalUs
    50000,  // scanWindowUs
    true,   // activeScan

    8000,   // connectTimeoutMs
    8000,   // discoveryTimeoutMs
    3000,   // reconnectDelayMs
    100,    // busyRearmMs
    200,    // cccdCooldownMs
    1500,   // cccdConfirmTimeoutMs
    1500,   // initialStateTimeoutMs
    3,      // initialStateMaxRequests

    100,    // writeCooldownMs
    3,      // commandRetryBudget
    300,    // commandRetryIntervalMs
    50,     // commandBusyRetryMs
    80,     // statePollDelayMs
    250,    // statePollRateLimitMs

    4,      // notificationsPerTick

    2000    // longPressDuration
};
#endif

// =================================================================================
// SECTION: FACTORY USER SETTINGS
// =================================================================================

static const CubeSettings DEFAULT_CUBE_SETTINGS = {
    "CF:AA:79:C9:96:9C", // targetAddress
    WRITE_NO_RESPONSE,   // writeMode
    false,               // alarmEnabled
    7,                   // alarmHour
    0,                   // alarmMinute
    false                // ringOnScramble
};
