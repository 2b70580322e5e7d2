/*
 * =================================================================================
 * File:      src/SerialConsole.cpp
 * Description: Serial console command parsing and settings updates.
 * =================================================================================
 */
#include "SerialConsole.h"
#include "ConfigValidators.h"
#include "Esp32CubeHAL.h"
#include "Globals.h"
#include "SettingsManager.h"
#include <Arduino.h>
#include <ctype.h>

SerialConsole &SerialConsole::getInstance() {
  static SerialConsole instance;
  return instance;
}

SerialConsole::SerialConsole() : _engine(nullptr), _lineLength(0), _overflow(false) { _line[0] = '\0'; }

void SerialConsole::begin(CubeAlarmEngine *engine) {
  _engine = engine;
  log("Console", "Ready. Send a keyword or a JSON settings object.");
}

void SerialConsole::log(const char *key, const char *value) {
  Esp32CubeHAL &hal = Esp32CubeHAL::getInstance();
  if (hal.lockState()) {
    hal.logKeyValue(key, value);
    hal.unlockState();
  }
}

// =================================================================================
// SECTION: INPUT
// =================================================================================

void SerialConsole::poll() {
  while (Serial.available() > 0) {
    int c = Serial.read();
    if (c < 0) return;
    if (c == '\r') continue;

    if (c == '\n') {
      _line[_lineLength] = '\0';
      bool overflow = _overflow;
      _lineLength = 0;
      _overflow = false;

      if (overflow) {
        sendError("Line too long.");
      } else {
        handleLine(_line);
      }
      return;
    }

    if (_lineLength < CONSOLE_LINE_LENGTH - 1) {
      _line[_lineLength++] = (char)c;
    } else {
      _overflow = true;
    }
  }
}

void SerialConsole::handleLine(const char *line) {
  // Trim
  while (*line && isspace((unsigned char)*line)) line++;
  size_t len = strlen(line);
  while (len > 0 && isspace((unsigned char)line[len - 1])) len--;
  if (len == 0) return;

  char trimmed[CONSOLE_LINE_LENGTH];
  memcpy(trimmed, line, len);
  trimmed[len] = '\0';

  if (_engine == nullptr) {
    sendError("Engine not running.");
    return;
  }

  if (trimmed[0] == '{') {
    handleSettings(trimmed);
  } else {
    handleKeyword(trimmed);
  }
}

// =================================================================================
// SECTION: KEYWORDS
// =================================================================================

void SerialConsole::handleKeyword(const char *keyword) {
  Esp32CubeHAL &hal = Esp32CubeHAL::getInstance();

  // --- Cube Commands ---
  if (strcasecmp(keyword, "state") == 0) {
    handleCommand(CMD_REQUEST_STATE);
  } else if (strcasecmp(keyword, "reset") == 0) {
    handleCommand(CMD_RESET);
  } else if (strcasecmp(keyword, "battery") == 0) {
    handleCommand(CMD_REQUEST_BATTERY);
  } else if (strcasecmp(keyword, "hw") == 0) {
    handleCommand(CMD_REQUEST_HARDWARE);
  }
  // --- Alarm ---
  else if (strcasecmp(keyword, "stop") == 0) {
    if (hal.lockState(1000)) {
      _engine->cancelAlarm("Console");
      hal.unlockState();
      sendSuccess("Alarm silenced.");
    } else {
      sendError("System Busy");
    }
  }
  // --- Diagnostics ---
  else if (strcasecmp(keyword, "status") == 0) {
    if (hal.lockState(1000)) {
      _engine->printStatus();
      hal.unlockState();
      sendSuccess("Status printed.");
    } else {
      sendError("System Busy");
    }
  } else if (strcasecmp(keyword, "log") == 0) {
    hal.dumpLog();
    sendSuccess("Log dumped.");
  }
  // --- Link ---
  else if (strcasecmp(keyword, "scan") == 0) {
    if (hal.lockState(1000)) {
      _engine->restartLink();
      hal.unlockState();
      sendSuccess("Link restarted.");
    } else {
      sendError("System Busy");
    }
  } else {
    sendError("Unknown command: " + std::string(keyword));
  }
}

void SerialConsole::handleCommand(CubeCommand command) {
  Esp32CubeHAL &hal = Esp32CubeHAL::getInstance();
  if (!hal.lockState(1000)) {
    sendError("System Busy");
    return;
  }

  CubeError err = _engine->sendCommand(command, "Console");
  hal.unlockState();

  if (err != CUBE_OK) {
    sendError(std::string("Command rejected: ") + errorToString(err));
    return;
  }
  sendSuccess(commandToString(command));
}

// =================================================================================
// SECTION: SETTINGS
// =================================================================================

void SerialConsole::handleSettings(const char *json) {
  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, json);
  if (error) {
    sendError(std::string("Invalid JSON: ") + error.c_str());
    return;
  }

  if (!doc.is<JsonObject>()) {
    sendError("Expected a JSON object.");
    return;
  }

  // 1. Wall clock (not a stored setting)
  bool setClock = false;
  uint8_t clockHour = 0;
  uint8_t clockMinute = 0;
  std::string errorMsg;

  if (!doc["time"].isNull()) {
    const char *text = doc["time"] | "";
    if (!ConfigValidators::parseClockTime(text, clockHour, clockMinute, errorMsg)) {
      sendError(errorMsg);
      return;
    }
    setClock = true;
    doc.remove("time");
  }

  // 2. Stored settings (all-or-nothing)
  CubeSettings updated = g_cubeSettings;
  if (!ConfigValidators::parseSettingsUpdate(doc.as<JsonVariant>(), updated, errorMsg)) {
    sendError(errorMsg);
    return;
  }

  // 3. Apply
  Esp32CubeHAL &hal = Esp32CubeHAL::getInstance();
  if (!hal.lockState(1000)) {
    sendError("System Busy");
    return;
  }

  CubeError err = _engine->applySettings(updated);
  if (err != CUBE_OK) {
    hal.unlockState();
    sendError(std::string("Settings rejected: ") + errorToString(err));
    return;
  }

  g_cubeSettings = updated;
  hal.setAlarmClock(updated.alarmEnabled, updated.alarmHour, updated.alarmMinute);
  if (setClock) {
    hal.setWallClock(clockHour, clockMinute);
  }
  hal.unlockState();

  // 4. Persist (outside the lock, NVS writes are slow)
  SettingsManager::saveSettings(updated);
  sendSuccess("Settings updated.");
}

// =================================================================================
// SECTION: REPLIES
// =================================================================================

void SerialConsole::sendSuccess(const char *message) {
  JsonDocument doc;
  doc["status"] = "success";
  doc["message"] = message;
  serializeJson(doc, Serial);
  Serial.println();
}

void SerialConsole::sendError(const std::string &message) {
  JsonDocument doc;
  doc["status"] = "error";
  doc["message"] = message.c_str();
  serializeJson(doc, Serial);
  Serial.println();
}
