/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeAlarmEngine.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Core orchestration:
 * - Consumes HAL input events (alarm due, buttons).
 * - Drives the GATT session and, once READY, the command dispatcher.
 * - Turns decoded frames into UI status, state polls and alarm verdicts.
 * Decode failures are counted and dropped; they never touch the link.
 * =================================================================================
 */
#include "CubeAlarmEngine.h"
#include "CubeCipher.h"
#include "CubeProtocol.h"
#include "CubeStateDecoder.h"
#include "TimeUtils.h"
#include <stdio.h>
#include <string.h>

CubeAlarmEngine::CubeAlarmEngine(ICubeHAL &hal, ICubeTransport &transport, const CubeDefaults &defaults)
    : _hal(hal), _transport(transport), _defaults(defaults), _link(hal, transport, defaults), _dispatcher(hal, transport, defaults),
      _alarm(hal), _awaitingInitialState(false), _initialRequests(0), _initialStateDeadline(0), _hasLastSerial(false),
      _lastSerial(0), _shownClockMinute(-1) {
  memset(&_settings, 0, sizeof(_settings));
  memset(&_stats, 0, sizeof(_stats));
  _lastFacelets[0] = '\0';

  _link.setListener(this);
  _transport.setEventSink(&_link);
}

void CubeAlarmEngine::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

CubeError CubeAlarmEngine::begin(const CubeSettings &settings) {
  CubeError err = applySettings(settings);
  if (err != CUBE_OK) {
    logKeyValue("Engine", "Start Failed: Invalid cube address.");
    return err;
  }

  _link.start();
  return CUBE_OK;
}

CubeError CubeAlarmEngine::applySettings(const CubeSettings &settings) {
  DeviceIdentity identity;
  CubeError err = CubeCipher::parseAddress(settings.targetAddress, identity);
  if (err != CUBE_OK) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Rejected address '%s' (%s)", settings.targetAddress, errorToString(err));
    logKeyValue("Engine", logBuf);
    return err;
  }

  bool targetChanged = !_link.hasTarget() || memcmp(identity.bytes, _link.getTarget().bytes, CUBE_ADDRESS_LENGTH) != 0;

  _settings = settings;
  _alarm.setRingOnScramble(settings.ringOnScramble);

  if (targetChanged) {
    _link.setTarget(identity);
    if (_link.isMonitoring()) {
      restartLink();
    }
  }
  return CUBE_OK;
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

void CubeAlarmEngine::tick() {
  // 1. Inputs
  processInputs();

  // 2. Link bring-up and telemetry
  _link.tick();

  // 3. Outgoing commands
  uint32_t now = (uint32_t)_hal.getMillis();
  if (_link.getPhase() == PHASE_READY) {
    checkInitialState(now);
    _dispatcher.tick(now, _link.session(), _settings.writeMode);
  }

  // 4. Audio
  _alarm.tick();

  // 5. Display
  updateClock();
}

void CubeAlarmEngine::updateClock() {
  uint8_t hour = 0;
  uint8_t minute = 0;
  if (!_hal.getTimeOfDay(hour, minute)) return;

  int16_t minuteOfDay = (int16_t)(hour * 60 + minute);
  if (minuteOfDay == _shownClockMinute) return;

  _shownClockMinute = minuteOfDay;
  _hal.showClock(hour, minute);
}

void CubeAlarmEngine::processInputs() {
  if (_hal.checkAlarmDue()) {
    triggerAlarm("Clock");
  }
  if (_hal.checkCancelAction()) {
    cancelAlarm("Long press");
  }
  if (_hal.checkStatePollAction()) {
    sendCommand(CMD_REQUEST_STATE, "Button");
  }
  if (_hal.checkResetAction()) {
    sendCommand(CMD_RESET, "Button");
  }
  if (_hal.checkBatteryAction()) {
    sendCommand(CMD_REQUEST_BATTERY, "Button");
  }
  if (_hal.checkHardwareInfoAction()) {
    sendCommand(CMD_REQUEST_HARDWARE, "Button");
  }
}

// =================================================================================
// SECTION: API COMMANDS
// =================================================================================

CubeError CubeAlarmEngine::sendCommand(CubeCommand command, const char *source) {
  char logBuf[64];

  if (_link.getPhase() != PHASE_READY) {
    snprintf(logBuf, sizeof(logBuf), "Cmd:%s ignored, link not ready (%s)", commandToString(command), source);
    logKeyValue("Engine", logBuf);
    return ERR_DISCOVERY_INCOMPLETE;
  }

  snprintf(logBuf, sizeof(logBuf), "Cmd:%s", commandToString(command));
  _hal.showStatus(logBuf);

  snprintf(logBuf, sizeof(logBuf), "Cmd:%s requested (%s)", commandToString(command), source);
  logKeyValue("Engine", logBuf);

  return _dispatcher.submit(command, (uint32_t)_hal.getMillis(), _link.getSession());
}

void CubeAlarmEngine::triggerAlarm(const char *source) {
  _alarm.onAlarmDue(source);

  // Refresh the verdict so solving can silence it
  if (_link.getPhase() == PHASE_READY && !_dispatcher.hasPending(CMD_REQUEST_STATE)) {
    _dispatcher.submit(CMD_REQUEST_STATE, (uint32_t)_hal.getMillis(), _link.getSession());
  }
}

void CubeAlarmEngine::cancelAlarm(const char *source) { _alarm.onCancel(source); }

void CubeAlarmEngine::restartLink() {
  logKeyValue("Engine", "Restarting link.");
  _link.stop();
  _dispatcher.clear();
  _link.start();
}

// =================================================================================
// SECTION: LINK EVENTS
// =================================================================================

void CubeAlarmEngine::onLinkReady(Session &session) {
  uint32_t now = (uint32_t)_hal.getMillis();

  _stats.sessions++;
  _dispatcher.clear();
  _hasLastSerial = false;

  _dispatcher.submit(CMD_REQUEST_STATE, now, session);
  _awaitingInitialState = true;
  _initialRequests = 1;
  _initialStateDeadline = now + _defaults.initialStateTimeoutMs;
}

void CubeAlarmEngine::onLinkLost() {
  _dispatcher.clear();
  _awaitingInitialState = false;
  _hasLastSerial = false;
  _alarm.onLinkLost();
}

void CubeAlarmEngine::checkInitialState(uint32_t now) {
  if (!_awaitingInitialState || !TimeUtils::isDue(now, _initialStateDeadline)) return;

  char logBuf[64];

  if (_initialRequests >= _defaults.initialStateMaxRequests) {
    logKeyValue("Engine", "No state frame yet. Waiting for telemetry.");
    _awaitingInitialState = false;
    return;
  }

  if (!_dispatcher.hasPending(CMD_REQUEST_STATE)) {
    _dispatcher.submit(CMD_REQUEST_STATE, now, _link.getSession());
  }
  _initialRequests++;
  _initialStateDeadline = now + _defaults.initialStateTimeoutMs;

  snprintf(logBuf, sizeof(logBuf), "State request repeated (%u/%u)", (unsigned)_initialRequests,
           (unsigned)_defaults.initialStateMaxRequests);
  logKeyValue("Engine", logBuf);
}

// =================================================================================
// SECTION: TELEMETRY
// =================================================================================

void CubeAlarmEngine::onFrame(const uint8_t *plaintext, size_t length) {
  DecodedFrame frame;
  CubeError err = CubeStateDecoder::decode(plaintext, length, frame);

  if (err == ERR_MALFORMED_STATE) {
    _stats.malformedFrames++;
    logKeyValue("Cube", "Malformed facelets frame dropped.");
    return;
  }

  switch (frame.kind) {
  case FRAME_MOVE:
    handleMove(frame.move, (uint32_t)_hal.getMillis());
    break;
  case FRAME_STATE:
    handleState(frame);
    break;
  default:
    _stats.unrecognizedFrames++;
    break;
  }
}

void CubeAlarmEngine::handleMove(const MoveEvent &move, uint32_t now) {
  if (!move.legacy) {
    // 16-bit serial, wraps
    if (_hasLastSerial && (int16_t)(move.serial - _lastSerial) <= 0) {
      _stats.duplicateMoves++;
      return;
    }
    _lastSerial = move.serial;
    _hasLastSerial = true;
  }

  _stats.moves++;

  char buf[48];
  if (move.legacy) {
    _hal.showStatus("Move...");
    logKeyValue("Cube", "Move (legacy frame)");
  } else {
    snprintf(buf, sizeof(buf), "Move %s", CubeProtocol::moveToString(move.code));
    _hal.showStatus(buf);
    snprintf(buf, sizeof(buf), "Move %s (#%u)", CubeProtocol::moveToString(move.code), (unsigned)move.serial);
    logKeyValue("Cube", buf);
  }

  _dispatcher.requestStatePoll(now, _link.getSession());
}

void CubeAlarmEngine::handleState(const DecodedFrame &frame) {
  _stats.states++;
  _awaitingInitialState = false;

  strncpy(_lastFacelets, frame.facelets, sizeof(_lastFacelets) - 1);
  _lastFacelets[FACELET_COUNT] = '\0';

  logKeyValue("Cube", frame.solved ? "State: SOLVED" : "State: scrambled");
  logKeyValue("Facelets", _lastFacelets);

  _alarm.onVerdict(frame.solved);

  if (!_alarm.isRinging()) {
    _hal.showStatus(frame.solved ? "Solved!" : "Scrambled");
  }
}

// =================================================================================
// SECTION: DIAGNOSTICS
// =================================================================================

void CubeAlarmEngine::printStartupDiagnostics() {
  char logBuf[128];
  char valBuf[32];

  _hal.log("==========================================================================");
  _hal.log("                           CUBE LINK CONFIGURATION                        ");
  _hal.log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: TARGET
  // -------------------------------------------------------------------------
  _hal.log("[ TARGET ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Cube Address", _settings.targetAddress);
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Write Mode", writeModeToString(_settings.writeMode));
  _hal.log(logBuf);
  if (_settings.alarmEnabled) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %02u:%02u", "Alarm Time", (unsigned)_settings.alarmHour,
             (unsigned)_settings.alarmMinute);
  } else {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Alarm Time", "DISABLED");
  }
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Ring On Scramble", _settings.ringOnScramble ? "ENABLED" : "DISABLED");
  _hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: TIMING
  // -------------------------------------------------------------------------
  _hal.log("");
  _hal.log("[ TIMING ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu ms", "Tick Interval", (unsigned long)_defaults.tickIntervalMs);
  _hal.log(logBuf);

  TimeUtils::formatMillis(_defaults.scanDurationMs, valBuf, sizeof(valBuf));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%s)", "Scan Window", _defaults.scanDurationMs ? valBuf : "continuous",
           _defaults.activeScan ? "active" : "passive");
  _hal.log(logBuf);

  TimeUtils::formatMillis(_defaults.connectTimeoutMs, valBuf, sizeof(valBuf));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Connect Timeout", valBuf);
  _hal.log(logBuf);

  TimeUtils::formatMillis(_defaults.discoveryTimeoutMs, valBuf, sizeof(valBuf));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Discovery Timeout", valBuf);
  _hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu ms / %lu ms", "CCCD Cooldown / Confirm", (unsigned long)_defaults.cccdCooldownMs,
           (unsigned long)_defaults.cccdConfirmTimeoutMs);
  _hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u x %lu ms (busy %lu ms)", "Command Attempts", (unsigned)_defaults.commandRetryBudget,
           (unsigned long)_defaults.commandRetryIntervalMs, (unsigned long)_defaults.commandBusyRetryMs);
  _hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : +%lu ms, max 1 / %lu ms", "State Poll", (unsigned long)_defaults.statePollDelayMs,
           (unsigned long)_defaults.statePollRateLimitMs);
  _hal.log(logBuf);
}

void CubeAlarmEngine::printStatus() {
  char logBuf[128];

  _hal.log("[ STATUS ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Link Phase", phaseToString(_link.getPhase()));
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Alarm", _alarm.isRinging() ? "RINGING" : "quiet");
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Cube",
           !_alarm.hasVerdict() ? "unknown" : (_alarm.isCubeSolved() ? "solved" : "scrambled"));
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Facelets", _lastFacelets[0] ? _lastFacelets : "-");
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu moves, %lu states, %lu sessions", "Telemetry", (unsigned long)_stats.moves,
           (unsigned long)_stats.states, (unsigned long)_stats.sessions);
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu dup, %lu malformed, %lu unknown, %lu cipher", "Frames Dropped",
           (unsigned long)_stats.duplicateMoves, (unsigned long)_stats.malformedFrames, (unsigned long)_stats.unrecognizedFrames,
           (unsigned long)_link.getCipherErrors());
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu notify, %lu events", "Queue Overflow", (unsigned long)_link.getDroppedNotifications(),
           (unsigned long)_link.getDroppedEvents());
  _hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %lu sent, %lu dropped, %u pending", "Commands", (unsigned long)_dispatcher.getSentCount(),
           (unsigned long)_dispatcher.getDroppedCount(), (unsigned)_dispatcher.getPendingCount());
  _hal.log(logBuf);
}
