/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CommandDispatcher.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "CommandDispatcher.h"
#include "CubeCipher.h"
#include "CubeProtocol.h"
#include "TimeUtils.h"
#include <stdio.h>
#include <string.h>

CommandDispatcher::CommandDispatcher(ICubeHAL &hal, ICubeTransport &transport, const CubeDefaults &defaults)
    : _hal(hal), _transport(transport), _defaults(defaults), _nextSequence(0), _pollGateArmed(false), _nextPollAllowedMs(0),
      _sentCount(0), _droppedCount(0) {
  memset(_queue, 0, sizeof(_queue));
}

void CommandDispatcher::logKeyValue(const char *key, const char *value) {
  char buf[MAX_LOG_LENGTH];
  snprintf(buf, sizeof(buf), " %-8s : %s", key, value);
  _hal.log(buf);
}

// =================================================================================
// SECTION: QUEUEING
// =================================================================================

CubeError CommandDispatcher::submit(CubeCommand command, uint32_t now, const Session &session, uint32_t delayMs) {
  uint8_t payload[COMMAND_PAYLOAD_SIZE];
  CubeProtocol::buildCommand(command, payload);
  return submitPayload(command, payload, sizeof(payload), now, session, delayMs);
}

CubeError CommandDispatcher::submitPayload(CubeCommand tag, const uint8_t *payload, size_t length, uint32_t now,
                                           const Session &session, uint32_t delayMs) {
  char logBuf[64];

  if (length != CIPHER_BLOCK_SIZE && length != 2 * CIPHER_BLOCK_SIZE) {
    snprintf(logBuf, sizeof(logBuf), "Cmd:%s rejected (%s)", commandToString(tag), errorToString(ERR_INVALID_LENGTH));
    logKeyValue("Command", logBuf);
    return ERR_INVALID_LENGTH;
  }

  PendingCommand *slot = nullptr;
  for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
    if (!_queue[i].inUse) {
      slot = &_queue[i];
      break;
    }
  }

  if (slot == nullptr) {
    snprintf(logBuf, sizeof(logBuf), "Queue full, Cmd:%s dropped", commandToString(tag));
    logKeyValue("Command", logBuf);
    _droppedCount++;
    return ERR_TRANSPORT_BUSY;
  }

  slot->inUse = true;
  slot->command = tag;
  memcpy(slot->payload, payload, length);
  slot->length = (uint8_t)length;
  slot->attemptsLeft = _defaults.commandRetryBudget > 0 ? _defaults.commandRetryBudget : 1;
  slot->nextAttemptMs = TimeUtils::latest(now + delayMs, session.nextOpAllowedMs);
  slot->sequence = _nextSequence++;
  return CUBE_OK;
}

bool CommandDispatcher::requestStatePoll(uint32_t now, const Session &session) {
  if (hasPending(CMD_REQUEST_STATE)) return false;
  if (_pollGateArmed && !TimeUtils::isDue(now, _nextPollAllowedMs)) return false;

  if (submit(CMD_REQUEST_STATE, now, session, _defaults.statePollDelayMs) != CUBE_OK) return false;

  _pollGateArmed = true;
  _nextPollAllowedMs = now + _defaults.statePollRateLimitMs;
  return true;
}

void CommandDispatcher::clear() {
  for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
    _queue[i].inUse = false;
  }
  _pollGateArmed = false;
}

bool CommandDispatcher::hasPending(CubeCommand command) const {
  for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
    if (_queue[i].inUse && _queue[i].command == command) return true;
  }
  return false;
}

size_t CommandDispatcher::getPendingCount() const {
  size_t count = 0;
  for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
    if (_queue[i].inUse) count++;
  }
  return count;
}

PendingCommand *CommandDispatcher::nextDue(uint32_t now) {
  PendingCommand *best = nullptr;
  for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
    PendingCommand &cmd = _queue[i];
    if (!cmd.inUse || !TimeUtils::isDue(now, cmd.nextAttemptMs)) continue;
    if (best == nullptr || (int32_t)(cmd.sequence - best->sequence) < 0) {
      best = &cmd;
    }
  }
  return best;
}

void CommandDispatcher::release(PendingCommand &cmd) { cmd.inUse = false; }

// =================================================================================
// SECTION: DRAIN
// =================================================================================

void CommandDispatcher::tick(uint32_t now, Session &session, WriteMode mode) {
  if (!session.active || session.commandHandle == 0) return;
  if (!TimeUtils::isDue(now, session.nextOpAllowedMs)) return;

  PendingCommand *cmd = nextDue(now);
  if (cmd == nullptr) return;

  char logBuf[64];
  uint8_t cipher[2 * CIPHER_BLOCK_SIZE];

  CubeError err = CubeCipher::encrypt(cmd->payload, cmd->length, session.keys, cipher);
  if (err != CUBE_OK) {
    snprintf(logBuf, sizeof(logBuf), "Cmd:%s dropped (%s)", commandToString(cmd->command), errorToString(err));
    logKeyValue("Command", logBuf);
    _droppedCount++;
    release(*cmd);
    return;
  }

  TransportStatus status = _transport.write(session.connHandle, session.commandHandle, cipher, cmd->length, mode);

  if (status == TRANSPORT_OK) {
    snprintf(logBuf, sizeof(logBuf), "Cmd:%s sent (%s)", commandToString(cmd->command), writeModeToString(mode));
    logKeyValue("Command", logBuf);
    _sentCount++;
    session.nextOpAllowedMs = now + _defaults.writeCooldownMs;
    release(*cmd);
    return;
  }

  if (status == TRANSPORT_BUSY) {
    // Transient: re-arm without consuming an attempt
    cmd->nextAttemptMs = now + _defaults.commandBusyRetryMs;
    return;
  }

  cmd->attemptsLeft--;
  if (cmd->attemptsLeft == 0) {
    snprintf(logBuf, sizeof(logBuf), "Cmd:%s dropped after %u attempts", commandToString(cmd->command),
             (unsigned)_defaults.commandRetryBudget);
    logKeyValue("Command", logBuf);
    _droppedCount++;
    release(*cmd);
    return;
  }

  snprintf(logBuf, sizeof(logBuf), "Cmd:%s write failed, %u left", commandToString(cmd->command), (unsigned)cmd->attemptsLeft);
  logKeyValue("Command", logBuf);
  cmd->nextAttemptMs = now + _defaults.commandRetryIntervalMs;
}
