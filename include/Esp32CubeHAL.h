/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      include/Esp32CubeHAL.h
 * Description: Header for the ESP32 implementation of ICubeHAL.
 * Encapsulates Buttons, Buzzer, Alarm Clock, Logging, Watchdog and LED.
 * =================================================================================
 */
#pragma once

#include "CubeContext.h"
#include "Globals.h"
#include "Types.h"
#include <Arduino.h>
#include <OneButton.h>
#include <jled.h>

class Esp32CubeHAL : public ICubeHAL {
private:
  Esp32CubeHAL();

  // --- Synchronization
  SemaphoreHandle_t _stateMutex;

  // --- Input State ---
  volatile bool _statePollPending;
  volatile bool _resetPending;
  volatile bool _batteryPending;
  volatile bool _hardwareInfoPending;
  volatile bool _cancelPending;
  volatile bool _alarmDuePending;

  // --- Alarm Clock ---
  bool _alarmClockEnabled;
  uint8_t _alarmHour;
  uint8_t _alarmMinute;
  int _lastFiredYearDay; // Day-of-year the alarm last fired, -1 = never
  unsigned long _lastClockCheck;
  bool _clockValid;
  uint8_t _clockHour;
  uint8_t _clockMinute;

  // --- Buzzer ---
  bool _buzzerActive;
  bool _toneOn;
  unsigned long _toneToggleAt;

  // --- UI ---
  char _statusLine[32];
  char _clockLine[8];
  SessionPhase _cachedPhase;

  // --- Log State (RAM + Serial) ---
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH]; // For the console 'log' command
  int _logBufferIndex;
  char _serialQueue[SERIAL_QUEUE_SIZE][MAX_LOG_LENGTH]; // For Serial
  int _queueHead;
  int _queueTail;

  // --- Peripherals ---
  OneButton _buttonA;
  OneButton _buttonB;
  JLed _statusLed;

  // --- Health Tracking ---
  unsigned long _lastHealthCheck;
  unsigned long _bootStartTime;
  bool _bootMarkedStable;

  // --- Helpers ---
  void updateLedPattern(SessionPhase phase);
  void checkAlarmClock();
  void checkSystemHealth();
  void checkBootLoop();
  void markBootStability();
  void processLogQueue();

  // --- Static Callback Handlers (OneButton) ---
  static void handleAClick();       // Request full state
  static void handleADoubleClick(); // Request battery
  static void handleBClick();       // Reset cube
  static void handleBDoubleClick(); // Request hardware info
  static void handleLongStart();    // Silence alarm (either button)

public:
  static Esp32CubeHAL &getInstance();

  void initialize();
  void tick();

  // --- Thread Safety (Mutex Wrapper) ---
  // Returns true if lock acquired, false if timeout/busy
  bool lockState(uint32_t timeoutMs = 100);
  void unlockState();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics();
  void dumpLog();

  // --- Alarm Clock ---
  void setAlarmClock(bool enabled, uint8_t hour, uint8_t minute);

  // Sets the wall clock (local time of day, today's date is kept).
  void setWallClock(uint8_t hour, uint8_t minute);

  // --- ICubeHAL Implementation ---
  void showStatus(const char *status) override;
  void setLinkIndicator(SessionPhase phase) override;
  bool getTimeOfDay(uint8_t &hour, uint8_t &minute) override;
  void showClock(uint8_t hour, uint8_t minute) override;

  void startAlarm() override;
  void stopAlarm() override;
  void pollAlarm() override;

  bool checkAlarmDue() override;
  bool checkCancelAction() override;
  bool checkStatePollAction() override;
  bool checkResetAction() override;
  bool checkBatteryAction() override;
  bool checkHardwareInfoAction() override;

  unsigned long getMillis() override;
};
