/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CommandDispatcher.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Serializes encrypted command writes to the cube.
 * - One write per tick, never before the session cooldown gate.
 * - Busy transport: re-armed after a short interval, attempt not consumed.
 * - Failed write: consumes one attempt. Commands are advisory polls, so an
 *   exhausted command is dropped for good.
 * - State polls triggered by moves are delayed and rate-limited.
 * =================================================================================
 */
#pragma once
#include "CubeContext.h"
#include "Types.h"

struct PendingCommand {
  bool inUse;
  CubeCommand command;
  uint8_t payload[2 * CIPHER_BLOCK_SIZE];
  uint8_t length;
  uint8_t attemptsLeft;
  uint32_t nextAttemptMs;
  uint32_t sequence;
};

class CommandDispatcher {
public:
    CommandDispatcher(ICubeHAL &hal, ICubeTransport &transport, const CubeDefaults &defaults);

    /**
     * Queues a fixed protocol command.
     * @param delayMs Extra delay on top of the session cooldown gate.
     * @return CUBE_OK, or ERR_TRANSPORT_BUSY if the queue is full.
     */
    CubeError submit(CubeCommand command, uint32_t now, const Session &session, uint32_t delayMs = 0);

    // Queues a raw payload. Lengths other than 16/32 are rejected with ERR_INVALID_LENGTH.
    CubeError submitPayload(CubeCommand tag, const uint8_t *payload, size_t length, uint32_t now, const Session &session,
                            uint32_t delayMs = 0);

    // Move-triggered "request full state". Returns false if rate-limited or one is already queued.
    bool requestStatePoll(uint32_t now, const Session &session);

    void tick(uint32_t now, Session &session, WriteMode mode);

    // Discards everything (disconnect / new session).
    void clear();

    bool hasPending(CubeCommand command) const;
    size_t getPendingCount() const;
    uint32_t getSentCount() const { return _sentCount; }
    uint32_t getDroppedCount() const { return _droppedCount; }

private:
    ICubeHAL &_hal;
    ICubeTransport &_transport;
    const CubeDefaults &_defaults;

    PendingCommand _queue[COMMAND_QUEUE_SIZE];
    uint32_t _nextSequence;

    bool _pollGateArmed;
    uint32_t _nextPollAllowedMs;

    uint32_t _sentCount;
    uint32_t _droppedCount;

    PendingCommand *nextDue(uint32_t now);
    void release(PendingCommand &cmd);
    void logKeyValue(const char *key, const char *value);
};
