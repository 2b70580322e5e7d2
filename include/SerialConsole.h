/*
 * =================================================================================
 * File:      include/SerialConsole.h
 * Description:
 * Line-based control surface on the USB serial port.
 * - Single-line JSON objects update the settings (validated, persisted).
 * - Plain keywords send cube commands and print diagnostics.
 * Replies are single-line JSON: {"status":"success"} or {"status":"error",...}.
 * =================================================================================
 */
#pragma once
#include "Config.h"
#include "CubeAlarmEngine.h"
#include <ArduinoJson.h>
#include <string>

class SerialConsole {
public:
  static SerialConsole &getInstance();

  void begin(CubeAlarmEngine *engine);

  // Reads pending serial input; runs at most one complete line per call.
  void poll();

private:
  SerialConsole();

  // --- Dependencies ---
  CubeAlarmEngine *_engine;

  // --- Line Buffer ---
  char _line[CONSOLE_LINE_LENGTH];
  size_t _lineLength;
  bool _overflow;

  // --- Handlers ---
  void handleLine(const char *line);
  void handleKeyword(const char *keyword);
  void handleSettings(const char *json);
  void handleCommand(CubeCommand command);

  // --- Replies ---
  void sendSuccess(const char *message);
  void sendError(const std::string &message);
  void log(const char *key, const char *value);
};
