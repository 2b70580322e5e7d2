/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/GattSession.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * GATT client bring-up and notification intake.
 * - Events are queued by the transport callback and handled at the start of
 *   each tick; the current phase then runs its step function.
 * - Notifications are queued separately (bounded, overflow counted) and a few
 *   are decrypted per tick.
 * =================================================================================
 */
#include "GattSession.h"
#include "CubeCipher.h"
#include "CubeProtocol.h"
#include "TimeUtils.h"
#include <stdio.h>
#include <string.h>

GattSession::GattSession(ICubeHAL &hal, ICubeTransport &transport, const CubeDefaults &defaults)
    : _hal(hal), _transport(transport), _defaults(defaults), _listener(nullptr), _hasTarget(false), _monitoring(false),
      _phase(PHASE_IDLE), _phaseStartMs(0), _nextStepMs(0), _stepIssued(false), _connectStartMs(0), _candidateAddressType(0),
      _oversizeFrames(0), _cipherErrors(0) {
  memset(&_target, 0, sizeof(_target));
  memset(&_candidate, 0, sizeof(_candidate));
  resetSession();
}

void GattSession::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

CubeError GattSession::setTarget(const char *address) {
  DeviceIdentity identity;
  CubeError err = CubeCipher::parseAddress(address, identity);
  if (err != CUBE_OK) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Rejected target '%s' (%s)", address ? address : "", errorToString(err));
    logKeyValue("Link", logBuf);
    return err;
  }

  setTarget(identity);
  return CUBE_OK;
}

void GattSession::setTarget(const DeviceIdentity &target) {
  _target = target;
  _hasTarget = true;

  char addr[24];
  char logBuf[64];
  CubeCipher::formatAddress(_target, addr, sizeof(addr));
  snprintf(logBuf, sizeof(logBuf), "Target %s", addr);
  logKeyValue("Link", logBuf);
}

bool GattSession::matchesTarget(const DeviceIdentity &address) const {
  if (!_hasTarget) return false;
  if (memcmp(address.bytes, _target.bytes, CUBE_ADDRESS_LENGTH) == 0) return true;

  // Some stacks report the address least-significant byte first
  for (int i = 0; i < CUBE_ADDRESS_LENGTH; i++) {
    if (address.bytes[i] != _target.bytes[CUBE_ADDRESS_LENGTH - 1 - i]) return false;
  }
  return true;
}

// =================================================================================
// SECTION: MONITORING CONTROL
// =================================================================================

void GattSession::start() {
  _monitoring = true;
  if (!_hasTarget) {
    logKeyValue("Link", "No target cube configured.");
    return;
  }
  if (_phase == PHASE_IDLE || _phase == PHASE_DISCONNECTED) {
    changePhase(PHASE_SCANNING);
  }
}

void GattSession::stop() {
  _monitoring = false;

  if (_session.active) {
    TransportStatus status = _transport.disconnect(_session.connHandle);
    if (status != TRANSPORT_OK) {
      logKeyValue("Link", "Disconnect request failed.");
    }
    endSession("Stopped");
  } else if (_phase == PHASE_SCANNING && _stepIssued) {
    _transport.stopScan();
  } else if (_phase == PHASE_CONNECTING && _stepIssued) {
    _transport.cancelConnect();
  }

  changePhase(PHASE_IDLE);
}

// =================================================================================
// SECTION: EVENT INTAKE (Callback Context)
// =================================================================================

void GattSession::onTransportEvent(const TransportEvent &event) { _events.push(event); }

void GattSession::onNotification(uint16_t connHandle, uint16_t valueHandle, const uint8_t *data, size_t length) {
  if (length > MAX_FRAME_LENGTH) {
    _oversizeFrames++;
    return;
  }

  NotificationFrame frame;
  frame.connHandle = connHandle;
  frame.valueHandle = valueHandle;
  frame.length = (uint8_t)length;
  memcpy(frame.data, data, length);
  _notifications.push(frame);
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

void GattSession::tick() {
  uint32_t t = now();

  // 1. Deferred transport events
  TransportEvent event;
  while (_events.pop(event)) {
    handleEvent(event, t);
  }

  // 2. Advance the current phase
  switch (_phase) {
  case PHASE_SCANNING:
    stepScanning(t);
    break;
  case PHASE_CONNECTING:
    stepConnecting(t);
    break;
  case PHASE_SERVICE_DISCOVERY:
    stepServiceDiscovery(t);
    break;
  case PHASE_CHAR_DISCOVERY:
    stepCharDiscovery(t);
    break;
  case PHASE_CCCD_ENABLE:
    stepCccdEnable(t);
    break;
  case PHASE_DISCONNECTED:
    stepDisconnected(t);
    break;
  default:
    break;
  }

  // 3. Telemetry
  drainNotifications();
}

void GattSession::changePhase(SessionPhase next) {
  if (_phase == next) return;

  _phase = next;
  _phaseStartMs = now();
  _nextStepMs = _phaseStartMs;
  _stepIssued = false;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), ">>> PHASE CHANGE: %s", phaseToString(_phase));
  logKeyValue("Link", logBuf);

  _hal.setLinkIndicator(_phase);

  switch (_phase) {
  case PHASE_SCANNING:
    _hal.showStatus("Scanning...");
    break;
  case PHASE_CONNECTING:
    _hal.showStatus("Connecting...");
    break;
  case PHASE_SERVICE_DISCOVERY:
    _hal.showStatus("Discovering...");
    break;
  case PHASE_READY:
    _hal.showStatus("Connected");
    break;
  case PHASE_DISCONNECTED:
    _hal.showStatus("Disconnected");
    break;
  default:
    break;
  }
}

bool GattSession::isCurrent(uint16_t connHandle) const { return _session.active && _session.connHandle == connHandle; }

// =================================================================================
// SECTION: EVENT HANDLING (Tick Context)
// =================================================================================

void GattSession::handleEvent(const TransportEvent &event, uint32_t t) {
  char logBuf[96];

  switch (event.type) {
  case EVT_SCAN_RESULT:
    if (_phase != PHASE_SCANNING || !matchesTarget(event.address)) break;

    _candidate = event.address;
    _candidateAddressType = event.addressType;
    snprintf(logBuf, sizeof(logBuf), "Target found (RSSI %d)", (int)event.rssi);
    logKeyValue("Link", logBuf);

    if (_transport.stopScan() != TRANSPORT_OK) {
      logKeyValue("Link", "Stop scan failed.");
    }
    changePhase(PHASE_CONNECTING);
    break;

  case EVT_SCAN_COMPLETE:
    if (_phase == PHASE_SCANNING) {
      // Window closed without a match: rescan
      _stepIssued = false;
      _nextStepMs = t;
    }
    break;

  case EVT_CONNECTED:
    if (_phase == PHASE_CONNECTING && !_session.active) {
      beginSession(event, t);
    } else if (!isCurrent(event.connHandle)) {
      // Late completion of an attempt we already gave up on
      logKeyValue("Link", "Dropping unexpected connection.");
      _transport.disconnect(event.connHandle);
    }
    break;

  case EVT_CONNECT_FAILED:
    if (_phase == PHASE_CONNECTING) {
      snprintf(logBuf, sizeof(logBuf), "Connect failed (%s)", transportStatusToString(event.status));
      logKeyValue("Link", logBuf);
      changePhase(PHASE_DISCONNECTED);
    }
    break;

  case EVT_DISCONNECTED:
    if (isCurrent(event.connHandle)) {
      endSession("Peer disconnected");
      changePhase(PHASE_DISCONNECTED);
    }
    break;

  case EVT_SERVICE_FOUND:
    if (_phase != PHASE_SERVICE_DISCOVERY || !isCurrent(event.connHandle)) break;
    if (_session.serviceRangeCount < MAX_SERVICE_RANGES) {
      _session.serviceRanges[_session.serviceRangeCount++] = event.range;
    } else {
      logKeyValue("Link", "Service table full, range ignored.");
    }
    break;

  case EVT_SERVICE_DISCOVERY_DONE:
    if (_phase != PHASE_SERVICE_DISCOVERY || !isCurrent(event.connHandle)) break;

    if (event.status == TRANSPORT_BUSY) {
      _session.serviceRangeCount = 0;
      _stepIssued = false;
      _nextStepMs = t + _defaults.busyRearmMs;
      break;
    }
    if (event.status != TRANSPORT_OK || _session.serviceRangeCount == 0) {
      abortSession(ERR_DISCOVERY_INCOMPLETE);
      break;
    }

    snprintf(logBuf, sizeof(logBuf), "%u service range(s)", (unsigned)_session.serviceRangeCount);
    logKeyValue("Link", logBuf);
    changePhase(PHASE_CHAR_DISCOVERY);
    break;

  case EVT_CHAR_FOUND:
    if (_phase == PHASE_CHAR_DISCOVERY && isCurrent(event.connHandle)) {
      recordCharacteristic(event);
    }
    break;

  case EVT_CHAR_DISCOVERY_DONE:
    if (_phase != PHASE_CHAR_DISCOVERY || !isCurrent(event.connHandle)) break;

    _session.discoveryInFlight = false;
    if (event.status == TRANSPORT_BUSY && _session.nextRangeIndex > 0) {
      // Same range again later
      _session.nextRangeIndex--;
      _nextStepMs = t + _defaults.busyRearmMs;
    }
    break;

  case EVT_CCCD_WRITTEN:
    if (!isCurrent(event.connHandle)) break;

    if (event.status == TRANSPORT_OK) {
      if (event.valueHandle == _session.stateHandle) {
        _session.stateNotifyConfirmed = true;
      }
    } else if (event.status == TRANSPORT_BUSY) {
      // Rewind to the rejected handle
      for (uint8_t i = 0; i < _session.cccdNext; i++) {
        if (_session.cccdHandles[i] == event.valueHandle) {
          _session.cccdNext = i;
          _session.nextOpAllowedMs = t + _defaults.busyRearmMs;
          break;
        }
      }
    } else {
      snprintf(logBuf, sizeof(logBuf), "CCCD write failed (handle 0x%04X)", event.valueHandle);
      logKeyValue("Link", logBuf);
    }
    break;

  case EVT_WRITE_COMPLETE:
    if (isCurrent(event.connHandle) && event.status != TRANSPORT_OK) {
      snprintf(logBuf, sizeof(logBuf), "Write not acknowledged (%s)", transportStatusToString(event.status));
      logKeyValue("Link", logBuf);
    }
    break;
  }
}

void GattSession::recordCharacteristic(const TransportEvent &event) {
  bool isCommand = CubeProtocol::uuidEquals(event.uuid, CubeProtocol::commandCharUuid());
  bool isState = CubeProtocol::uuidEquals(event.uuid, CubeProtocol::stateCharUuid());

  if (isCommand) {
    _session.commandHandle = event.valueHandle;
  }
  if (isState) {
    _session.stateHandle = event.valueHandle;
  }

  if (isState || (event.properties & (CHAR_PROP_NOTIFY | CHAR_PROP_INDICATE))) {
    queueCccd(event.valueHandle);
  }
}

void GattSession::queueCccd(uint16_t valueHandle) {
  for (uint8_t i = 0; i < _session.cccdCount; i++) {
    if (_session.cccdHandles[i] == valueHandle) return;
  }
  if (_session.cccdCount < MAX_NOTIFY_HANDLES) {
    _session.cccdHandles[_session.cccdCount++] = valueHandle;
  }
}

bool GattSession::handlesResolved() const { return _session.commandHandle != 0 && _session.stateHandle != 0; }

// =================================================================================
// SECTION: PHASE STEPS
// =================================================================================

void GattSession::stepScanning(uint32_t t) {
  if (!_hasTarget || _stepIssued || !TimeUtils::isDue(t, _nextStepMs)) return;

  ScanConfig config;
  config.durationMs = _defaults.scanDurationMs;
  config.intervalUs = _defaults.scanIntervalUs;
  config.windowUs = _defaults.scanWindowUs;
  config.active = _defaults.activeScan;

  TransportStatus status = _transport.startScan(config);
  if (status == TRANSPORT_OK) {
    _stepIssued = true;
  } else if (status == TRANSPORT_BUSY) {
    _nextStepMs = t + _defaults.busyRearmMs;
  } else {
    logKeyValue("Link", "Scan start failed.");
    _nextStepMs = t + _defaults.reconnectDelayMs;
  }
}

void GattSession::stepConnecting(uint32_t t) {
  if (!_stepIssued) {
    if (!TimeUtils::isDue(t, _nextStepMs)) return;

    TransportStatus status = _transport.connect(_candidate, _candidateAddressType);
    if (status == TRANSPORT_OK) {
      _stepIssued = true;
      _connectStartMs = t;
    } else if (status == TRANSPORT_BUSY) {
      _nextStepMs = t + _defaults.busyRearmMs;
    } else {
      logKeyValue("Link", "Connect request failed.");
      changePhase(PHASE_DISCONNECTED);
    }
    return;
  }

  if (TimeUtils::hasElapsed(t, _connectStartMs, _defaults.connectTimeoutMs)) {
    logKeyValue("Link", "Connect timeout.");
    _transport.cancelConnect();
    changePhase(PHASE_DISCONNECTED);
  }
}

void GattSession::stepServiceDiscovery(uint32_t t) {
  if (TimeUtils::hasElapsed(t, _phaseStartMs, _defaults.discoveryTimeoutMs)) {
    abortSession(ERR_DISCOVERY_INCOMPLETE);
    return;
  }
  if (_stepIssued || !TimeUtils::isDue(t, _nextStepMs)) return;

  TransportStatus status = _transport.discoverServices(_session.connHandle);
  if (status == TRANSPORT_OK) {
    _stepIssued = true;
  } else if (status == TRANSPORT_BUSY) {
    _nextStepMs = t + _defaults.busyRearmMs;
  } else {
    abortSession(ERR_DISCOVERY_INCOMPLETE);
  }
}

void GattSession::stepCharDiscovery(uint32_t t) {
  if (TimeUtils::hasElapsed(t, _phaseStartMs, _defaults.discoveryTimeoutMs)) {
    abortSession(ERR_DISCOVERY_INCOMPLETE);
    return;
  }
  if (_session.discoveryInFlight || !TimeUtils::isDue(t, _nextStepMs)) return;

  char logBuf[96];

  if (handlesResolved()) {
    snprintf(logBuf, sizeof(logBuf), "State 0x%04X, Command 0x%04X, %u notify handle(s)", _session.stateHandle,
             _session.commandHandle, (unsigned)_session.cccdCount);
    logKeyValue("Link", logBuf);
    changePhase(PHASE_CCCD_ENABLE);
    return;
  }

  if (_session.nextRangeIndex >= _session.serviceRangeCount) {
    abortSession(ERR_DISCOVERY_INCOMPLETE);
    return;
  }

  const HandleRange &range = _session.serviceRanges[_session.nextRangeIndex];
  TransportStatus status = _transport.discoverCharacteristics(_session.connHandle, range);

  if (status == TRANSPORT_OK) {
    _session.discoveryInFlight = true;
    _session.nextRangeIndex++;
  } else if (status == TRANSPORT_BUSY) {
    _nextStepMs = t + _defaults.busyRearmMs;
  } else {
    snprintf(logBuf, sizeof(logBuf), "Range 0x%04X-0x%04X skipped", range.start, range.end);
    logKeyValue("Link", logBuf);
    _session.nextRangeIndex++;
  }
}

void GattSession::stepCccdEnable(uint32_t t) {
  if (_session.cccdNext < _session.cccdCount) {
    if (!TimeUtils::isDue(t, _session.nextOpAllowedMs)) return;

    uint16_t handle = _session.cccdHandles[_session.cccdNext];
    TransportStatus status = _transport.enableNotifications(_session.connHandle, handle);

    if (status == TRANSPORT_OK) {
      if (handle == _session.stateHandle) {
        _session.stateNotifyRequested = true;
        _session.stateNotifyRequestedAt = t;
      }
      _session.cccdNext++;
      _session.nextOpAllowedMs = t + _defaults.cccdCooldownMs;
    } else if (status == TRANSPORT_BUSY) {
      _session.nextOpAllowedMs = t + _defaults.busyRearmMs;
    } else if (handle == _session.stateHandle) {
      abortSession(ERR_DISCOVERY_INCOMPLETE);
    } else {
      char logBuf[64];
      snprintf(logBuf, sizeof(logBuf), "CCCD 0x%04X skipped", handle);
      logKeyValue("Link", logBuf);
      _session.cccdNext++;
    }
    return;
  }

  if (!_session.stateNotifyRequested) {
    // State characteristic never made it into the CCCD table
    abortSession(ERR_DISCOVERY_INCOMPLETE);
  } else if (_session.stateNotifyConfirmed) {
    enterReady(t, "Notifications confirmed");
  } else if (TimeUtils::hasElapsed(t, _session.stateNotifyRequestedAt, _defaults.cccdConfirmTimeoutMs)) {
    enterReady(t, "No CCCD confirmation, assuming enabled");
  }
}

void GattSession::stepDisconnected(uint32_t t) {
  if (_monitoring && _hasTarget && TimeUtils::hasElapsed(t, _phaseStartMs, _defaults.reconnectDelayMs)) {
    changePhase(PHASE_SCANNING);
  }
}

// =================================================================================
// SECTION: NOTIFICATIONS
// =================================================================================

void GattSession::drainNotifications() {
  uint8_t budget = _defaults.notificationsPerTick > 0 ? _defaults.notificationsPerTick : 1;
  NotificationFrame frame;

  while (budget > 0 && _notifications.pop(frame)) {
    budget--;

    if (!isCurrent(frame.connHandle)) continue;
    if (_phase != PHASE_CCCD_ENABLE && _phase != PHASE_READY) continue;
    if (_session.stateHandle != 0 && frame.valueHandle != _session.stateHandle) continue;

    uint8_t plain[MAX_FRAME_LENGTH];
    CubeError err = CubeCipher::decrypt(frame.data, frame.length, _session.keys, plain);
    if (err != CUBE_OK) {
      _cipherErrors++;
      continue;
    }

    if (_listener != nullptr) {
      _listener->onFrame(plain, frame.length);
    }
  }
}

// =================================================================================
// SECTION: SESSION LIFECYCLE
// =================================================================================

void GattSession::beginSession(const TransportEvent &event, uint32_t t) {
  resetSession();
  _notifications.clear();

  _session.active = true;
  _session.connHandle = event.connHandle;
  _session.peer = event.address;
  _session.nextOpAllowedMs = t;

  // Keys first: the link is useless without them
  CubeCipher::deriveKeys(_session.peer, _session.keys);

  char addr[24];
  char logBuf[80];
  CubeCipher::formatAddress(_session.peer, addr, sizeof(addr));
  snprintf(logBuf, sizeof(logBuf), "Connected to %s (handle %u)", addr, (unsigned)event.connHandle);
  logKeyValue("Link", logBuf);

  changePhase(PHASE_SERVICE_DISCOVERY);
}

void GattSession::enterReady(uint32_t t, const char *reason) {
  char elapsed[32];
  char logBuf[96];
  TimeUtils::formatMillis(TimeUtils::elapsed(t, _connectStartMs), elapsed, sizeof(elapsed));
  snprintf(logBuf, sizeof(logBuf), "%s. Link up after %s", reason, elapsed);
  logKeyValue("Link", logBuf);

  changePhase(PHASE_READY);

  if (_listener != nullptr) {
    _listener->onLinkReady(_session);
  }
}

void GattSession::endSession(const char *reason) {
  logKeyValue("Link", reason);

  bool wasActive = _session.active;
  resetSession();
  _notifications.clear();

  if (wasActive && _listener != nullptr) {
    _listener->onLinkLost();
  }
}

void GattSession::abortSession(CubeError reason) {
  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Session aborted (%s)", errorToString(reason));
  logKeyValue("Link", logBuf);

  if (_session.active) {
    if (_transport.disconnect(_session.connHandle) != TRANSPORT_OK) {
      logKeyValue("Link", "Disconnect request failed.");
    }
  }

  endSession("Session closed.");
  changePhase(PHASE_DISCONNECTED);
}

void GattSession::resetSession() { memset(&_session, 0, sizeof(_session)); }
