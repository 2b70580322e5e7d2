/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/AlarmController.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "AlarmController.h"
#include <stdio.h>

AlarmController::AlarmController(ICubeHAL &hal)
    : _hal(hal), _ringOnScramble(false), _ringing(false), _hasVerdict(false), _lastSolved(false) {}

void AlarmController::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

void AlarmController::onAlarmDue(const char *source) {
  if (_ringing) return;
  start(source);
}

void AlarmController::onVerdict(bool solved) {
  bool wasSolved = _hasVerdict && _lastSolved;
  _hasVerdict = true;
  _lastSolved = solved;

  if (_ringing) {
    if (solved) stop("Cube solved");
    return;
  }

  if (_ringOnScramble && wasSolved && !solved) {
    start("Scrambled");
  }
}

void AlarmController::onCancel(const char *source) {
  if (!_ringing) return;
  stop(source);
}

void AlarmController::onLinkLost() {
  // Verdict is stale once the link is gone; ringing continues
  _hasVerdict = false;
}

void AlarmController::tick() {
  if (_ringing) {
    _hal.pollAlarm();
  }
}

void AlarmController::start(const char *reason) {
  _ringing = true;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Ringing (%s)", reason);
  logKeyValue("Alarm", logBuf);

  _hal.startAlarm();
  _hal.showStatus("Alarm!");
}

void AlarmController::stop(const char *reason) {
  _ringing = false;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Silenced (%s)", reason);
  logKeyValue("Alarm", logBuf);

  _hal.stopAlarm();
  _hal.showStatus("Alarm off");
}
