/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      src/Esp32CubeHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Low-level hardware abstraction layer. Manages the two buttons, the buzzer,
 * the wall-clock alarm, LED patterns, logging and system health monitoring.
 * =================================================================================
 */
#include "Esp32CubeHAL.h"
#include <esp_task_wdt.h>
#include <sys/time.h>
#include <time.h>

#include "Config.h"
#include "Globals.h"
#include "SettingsManager.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

Esp32CubeHAL::Esp32CubeHAL()
    : _stateMutex(NULL), _statePollPending(false), _resetPending(false), _batteryPending(false), _hardwareInfoPending(false),
      _cancelPending(false), _alarmDuePending(false),

      // Alarm Clock
      _alarmClockEnabled(false), _alarmHour(0), _alarmMinute(0), _lastFiredYearDay(-1), _lastClockCheck(0),
      _clockValid(false), _clockHour(0), _clockMinute(0),

      // Buzzer
      _buzzerActive(false), _toneOn(false), _toneToggleAt(0),

      _cachedPhase((SessionPhase)-1), _logBufferIndex(0), _queueHead(0), _queueTail(0), _statusLed(JLed(STATUS_LED_PIN)),
      _lastHealthCheck(0), _bootStartTime(0), _bootMarkedStable(false) {
  // OneButton Setup (Pin, ActiveLow, Pullup)
  _buttonA = OneButton(PCB_BUTTON_PIN, true, true);

#ifdef BUTTON_B_PIN
  _buttonB = OneButton(BUTTON_B_PIN, true, true);
#endif

  _statusLine[0] = '\0';
  _clockLine[0] = '\0';

  // Clear log buffer
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    _logBuffer[i][0] = '\0';
}

Esp32CubeHAL &Esp32CubeHAL::getInstance() {
  static Esp32CubeHAL instance;
  return instance;
}

// --- Initialization ---

void Esp32CubeHAL::initialize() {

  // 1. Acquire the Mutex
  _stateMutex = xSemaphoreCreateRecursiveMutex();
  if (_stateMutex == NULL) {
    Serial.println("Critical Error: Could not create Mutex.");
    ESP.restart();
  }

  // 2. Logging Init
  logKeyValue("System", "Initializing Hardware...");

  // 3. Buzzer
  pinMode(BUZZER_PIN, OUTPUT);
  digitalWrite(BUZZER_PIN, LOW);

  // 4. Local time zone for the alarm clock
  setenv("TZ", DEFAULT_TZ, 1);
  tzset();

  // 5. Button Attachments
  // -- Button A --
  _buttonA.attachClick(handleAClick);
  _buttonA.attachDoubleClick(handleADoubleClick);
  _buttonA.setPressMs(g_cubeDefaults.longPressDuration);
  _buttonA.attachLongPressStart(handleLongStart);

  // -- Button B --
#ifdef BUTTON_B_PIN
  _buttonB.attachClick(handleBClick);
  _buttonB.attachDoubleClick(handleBDoubleClick);
  _buttonB.setPressMs(g_cubeDefaults.longPressDuration);
  _buttonB.attachLongPressStart(handleLongStart);
#endif

  // 6. Watchdog
  logKeyValue("System", "Initializing Hardware Watchdog...");
  esp_task_wdt_init(DEFAULT_WDT_TIMEOUT, true);
  esp_task_wdt_add(NULL);

  // 7. Boot Checks
  checkBootLoop();

  // 8. Force Initial LED State
  updateLedPattern(PHASE_IDLE);
}

// --- Main Tick ---

void Esp32CubeHAL::tick() {

  if (!lockState()) {
    return;
  }

  // 1. Process Serial Logs (Internal Queue)
  processLogQueue();

  // 2. Tick Peripherals
  _buttonA.tick();
#ifdef BUTTON_B_PIN
  _buttonB.tick();
#endif

  _statusLed.Update();

  // 3. Alarm Clock (Once per second)
  if (millis() - _lastClockCheck >= 1000) {
    _lastClockCheck = millis();
    checkAlarmClock();
  }

  // 4. Periodic Health Checks (Every 60s)
  if (millis() - _lastHealthCheck > 60000) {
    checkSystemHealth();
    _lastHealthCheck = millis();
  }

  // 5. Maintenance
  markBootStability();

  unlockState();
}

// =================================================================================
// SECTION: ALARM CLOCK
// =================================================================================

void Esp32CubeHAL::setAlarmClock(bool enabled, uint8_t hour, uint8_t minute) {
  bool changed = (enabled != _alarmClockEnabled) || (hour != _alarmHour) || (minute != _alarmMinute);
  _alarmClockEnabled = enabled;
  _alarmHour = hour;
  _alarmMinute = minute;

  if (!changed) return;

  // A new alarm time may fire again today
  _lastFiredYearDay = -1;

  char logBuf[48];
  if (enabled) {
    snprintf(logBuf, sizeof(logBuf), "Alarm set for %02u:%02u", (unsigned)hour, (unsigned)minute);
  } else {
    snprintf(logBuf, sizeof(logBuf), "Alarm DISABLED");
  }
  logKeyValue("Clock", logBuf);
}

void Esp32CubeHAL::setWallClock(uint8_t hour, uint8_t minute) {
  time_t now = time(nullptr);
  struct tm local;
  localtime_r(&now, &local);

  // Clock never set: anchor to a fixed date so the alarm can still run
  if (local.tm_year < (2020 - 1900)) {
    memset(&local, 0, sizeof(local));
    local.tm_year = 2024 - 1900;
    local.tm_mon = 0;
    local.tm_mday = 1;
  }

  local.tm_hour = hour;
  local.tm_min = minute;
  local.tm_sec = 0;
  local.tm_isdst = -1;

  struct timeval tv;
  tv.tv_sec = mktime(&local);
  tv.tv_usec = 0;
  if (settimeofday(&tv, nullptr) != 0) {
    logKeyValue("Clock", "Failed to set wall clock.");
    return;
  }

  // Don't fire for a minute we jumped over or onto
  _lastFiredYearDay = -1;

  char logBuf[48];
  snprintf(logBuf, sizeof(logBuf), "Wall clock set to %02u:%02u", (unsigned)hour, (unsigned)minute);
  logKeyValue("Clock", logBuf);
}

void Esp32CubeHAL::checkAlarmClock() {
  struct tm local;
  if (!getLocalTime(&local, 0)) {
    _clockValid = false; // Clock not set yet
    return;
  }

  // Cached for the display
  _clockValid = true;
  _clockHour = (uint8_t)local.tm_hour;
  _clockMinute = (uint8_t)local.tm_min;

  if (!_alarmClockEnabled) return;

  if (local.tm_hour == _alarmHour && local.tm_min == _alarmMinute && local.tm_yday != _lastFiredYearDay) {
    _lastFiredYearDay = local.tm_yday;
    _alarmDuePending = true;
    logKeyValue("Clock", "Wake-up time reached.");
  }
}

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

bool Esp32CubeHAL::lockState(uint32_t timeoutMs) {
  if (_stateMutex == NULL)
    return false;
  return (xSemaphoreTakeRecursive(_stateMutex, (TickType_t)pdMS_TO_TICKS(timeoutMs)) == pdTRUE);
}

void Esp32CubeHAL::unlockState() {
  if (_stateMutex != NULL) {
    xSemaphoreGiveRecursive(_stateMutex);
  }
}

// =================================================================================
// SECTION: LOGGING SYSTEM
// =================================================================================

void Esp32CubeHAL::log(const char *message) {
  // 1. Write to RAM (Console Buffer)
  strncpy(_logBuffer[_logBufferIndex], message, MAX_LOG_LENGTH);
  _logBuffer[_logBufferIndex][MAX_LOG_LENGTH - 1] = '\0';

  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
  }

  // 2. Write to Serial Queue
  int nextHead = (_queueHead + 1) % SERIAL_QUEUE_SIZE;
  if (nextHead != _queueTail) {
    strncpy(_serialQueue[_queueHead], message, MAX_LOG_LENGTH);
    _serialQueue[_queueHead][MAX_LOG_LENGTH - 1] = '\0';
    _queueHead = nextHead;
  }
  // Else: Queue full, drop message to prevent blocking
}

void Esp32CubeHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void Esp32CubeHAL::processLogQueue() {
  // Process a batch of logs to keep Serial active without blocking too long
  int maxLines = 10;
  while (_queueHead != _queueTail && maxLines > 0) {
    Serial.println(_serialQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % SERIAL_QUEUE_SIZE;
    maxLines--;
  }
}

void Esp32CubeHAL::dumpLog() {
  Serial.println("--- BEGIN LOG ---");

  // Oldest entry first; the slot at _logBufferIndex is the next to be overwritten
  for (int i = 0; i < LOG_BUFFER_SIZE; i++) {
    char line[MAX_LOG_LENGTH];
    line[0] = '\0';

    if (lockState()) {
      int slot = (_logBufferIndex + i) % LOG_BUFFER_SIZE;
      strncpy(line, _logBuffer[slot], MAX_LOG_LENGTH);
      line[MAX_LOG_LENGTH - 1] = '\0';
      unlockState();
    }

    // Print outside the lock (Serial is slow)
    if (line[0] != '\0') {
      Serial.println(line);
    }
  }

  Serial.println("--- END LOG ---");
}

void Esp32CubeHAL::printStartupDiagnostics() {
  char logBuf[128];

  log("==========================================================================");
  log("                            DEVICE DIAGNOSTICS                           ");
  log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: SYSTEM HEALTH
  // -------------------------------------------------------------------------
  log("[ SYSTEM HEALTH ]");

  // Heap Memory
  uint32_t freeHeap = ESP.getFreeHeap();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u bytes", "Free Heap", freeHeap);
  log(logBuf);

  // Temperature (Built-in sensor)
  float temp = temperatureRead();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %.1f C", "CPU Temp", temp);
  log(logBuf);

  // Crash Counters
  int crashes = SettingsManager::getCrashCount();
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Recorded Crashes", crashes);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: GPIO CONFIGURATION
  // -------------------------------------------------------------------------
  log(""); // Spacer
  log("[ GPIO & PERIPHERALS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "Button A", PCB_BUTTON_PIN);
  log(logBuf);

#ifdef BUTTON_B_PIN
  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d (Active Low)", "Button B", BUTTON_B_PIN);
#else
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Button B", "NOT DEFINED");
#endif
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d", "Status LED", STATUS_LED_PIN);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : GPIO %d (%d Hz)", "Buzzer", BUZZER_PIN, ALARM_TONE_HZ);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: CLOCK
  // -------------------------------------------------------------------------
  log(""); // Spacer
  log("[ CLOCK ]");

  struct tm local;
  if (getLocalTime(&local, 0)) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %02d:%02d:%02d", "Wall Clock", local.tm_hour, local.tm_min, local.tm_sec);
  } else {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Wall Clock", "NOT SET");
  }
  log(logBuf);

  if (_alarmClockEnabled) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %02u:%02u", "Alarm", (unsigned)_alarmHour, (unsigned)_alarmMinute);
  } else {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Alarm", "DISABLED");
  }
  log(logBuf);
}

// =================================================================================
// SECTION: ICubeHAL IMPLEMENTATION
// =================================================================================

// --- UI ---

void Esp32CubeHAL::showStatus(const char *status) {
  if (strncmp(_statusLine, status, sizeof(_statusLine)) == 0) return;
  strncpy(_statusLine, status, sizeof(_statusLine) - 1);
  _statusLine[sizeof(_statusLine) - 1] = '\0';
  logKeyValue("Status", _statusLine);
}

void Esp32CubeHAL::setLinkIndicator(SessionPhase phase) { updateLedPattern(phase); }

bool Esp32CubeHAL::getTimeOfDay(uint8_t &hour, uint8_t &minute) {
  if (!_clockValid) return false;
  hour = _clockHour;
  minute = _clockMinute;
  return true;
}

void Esp32CubeHAL::showClock(uint8_t hour, uint8_t minute) {
  snprintf(_clockLine, sizeof(_clockLine), "%02u:%02u", (unsigned)hour, (unsigned)minute);
  logKeyValue("Time", _clockLine);
}

// --- Audio ---

void Esp32CubeHAL::startAlarm() {
  if (_buzzerActive) return;
  _buzzerActive = true;
  _toneOn = true;
  _toneToggleAt = millis() + ALARM_BEEP_ON_MS;
  tone(BUZZER_PIN, ALARM_TONE_HZ);
  logKeyValue("Buzzer", "ON");
}

void Esp32CubeHAL::stopAlarm() {
  if (!_buzzerActive) return;
  _buzzerActive = false;
  _toneOn = false;
  noTone(BUZZER_PIN);
  logKeyValue("Buzzer", "OFF");
}

void Esp32CubeHAL::pollAlarm() {
  if (!_buzzerActive) return;
  unsigned long now = millis();
  if ((long)(now - _toneToggleAt) < 0) return;

  // Beep pattern: ON / OFF
  if (_toneOn) {
    noTone(BUZZER_PIN);
    _toneOn = false;
    _toneToggleAt = now + ALARM_BEEP_OFF_MS;
  } else {
    tone(BUZZER_PIN, ALARM_TONE_HZ);
    _toneOn = true;
    _toneToggleAt = now + ALARM_BEEP_ON_MS;
  }
}

// --- Input Events ---

bool Esp32CubeHAL::checkAlarmDue() {
  if (_alarmDuePending) {
    _alarmDuePending = false;
    return true;
  }
  return false;
}

bool Esp32CubeHAL::checkCancelAction() {
  if (_cancelPending) {
    _cancelPending = false;
    return true;
  }
  return false;
}

bool Esp32CubeHAL::checkStatePollAction() {
  if (_statePollPending) {
    _statePollPending = false;
    return true;
  }
  return false;
}

bool Esp32CubeHAL::checkResetAction() {
  if (_resetPending) {
    _resetPending = false;
    return true;
  }
  return false;
}

bool Esp32CubeHAL::checkBatteryAction() {
  if (_batteryPending) {
    _batteryPending = false;
    return true;
  }
  return false;
}

bool Esp32CubeHAL::checkHardwareInfoAction() {
  if (_hardwareInfoPending) {
    _hardwareInfoPending = false;
    return true;
  }
  return false;
}

// --- Utils ---

unsigned long Esp32CubeHAL::getMillis() { return millis(); }

// =================================================================================
// SECTION: INTERNAL LOGIC & HELPERS
// =================================================================================

void Esp32CubeHAL::updateLedPattern(SessionPhase phase) {
  if (phase == _cachedPhase) return;
  _cachedPhase = phase;

  switch (phase) {
  case PHASE_IDLE:
    _statusLed.Breathe(4000).Forever();
    break;
  case PHASE_SCANNING:
    _statusLed.Blink(500, 500).Forever();
    break;
  case PHASE_CONNECTING:
  case PHASE_SERVICE_DISCOVERY:
  case PHASE_CHAR_DISCOVERY:
  case PHASE_CCCD_ENABLE:
    _statusLed.Blink(100, 100).Forever();
    break;
  case PHASE_READY:
    _statusLed.On().Forever();
    break;
  case PHASE_DISCONNECTED:
    _statusLed.Blink(200, 200).Repeat(2).DelayAfter(2000).Forever();
    break;
  default:
    _statusLed.Off().Forever();
    break;
  }
}

void Esp32CubeHAL::checkBootLoop() {
  int crashes = SettingsManager::getCrashCount();

  if (crashes >= BOOT_LOOP_THRESHOLD) {
    Serial.println("CRITICAL: Boot Loop Detected! Restoring factory settings.");
    noTone(BUZZER_PIN);

    pinMode(STATUS_LED_PIN, OUTPUT);
    digitalWrite(STATUS_LED_PIN, HIGH);

    // Stored settings are the most likely culprit
    SettingsManager::wipeAll();
    delay(5000);
  }

  SettingsManager::incrementCrashCount();
  _bootStartTime = millis();
}

void Esp32CubeHAL::markBootStability() {
  if (!_bootMarkedStable && (millis() - _bootStartTime > STABLE_BOOT_TIME_MS)) {
    _bootMarkedStable = true;
    SettingsManager::clearCrashCount();
    logKeyValue("System", "System stable.");
  }
}

void Esp32CubeHAL::checkSystemHealth() {
  size_t freeMem = ESP.getFreeHeap();
  if (freeMem < MIN_FREE_HEAP) {
    logKeyValue("System", "CRITICAL: Low Heap! Restarting.");
    noTone(BUZZER_PIN);
    ESP.restart();
  }
}

// =================================================================================
// SECTION: STATIC HANDLERS (OneButton Callbacks)
// =================================================================================

void Esp32CubeHAL::handleAClick() { getInstance()._statePollPending = true; }

void Esp32CubeHAL::handleADoubleClick() { getInstance()._batteryPending = true; }

void Esp32CubeHAL::handleBClick() { getInstance()._resetPending = true; }

void Esp32CubeHAL::handleBDoubleClick() { getInstance()._hardwareInfoPending = true; }

void Esp32CubeHAL::handleLongStart() { getInstance()._cancelPending = true; }
