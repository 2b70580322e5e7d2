/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeAlarmEngine.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Top-level core object. Owns the GATT session, the command dispatcher and the
 * alarm policy, and routes decoded telemetry between them.
 *
 * Data flow:
 *   transport -> GattSession (queue, decrypt) -> CubeStateDecoder
 *     -> Move: rate-limited state poll via CommandDispatcher
 *     -> State: solved verdict to AlarmController
 * =================================================================================
 */
#pragma once
#include "AlarmController.h"
#include "CommandDispatcher.h"
#include "CubeContext.h"
#include "GattSession.h"
#include "Types.h"

struct EngineStats {
  uint32_t moves;
  uint32_t states;
  uint32_t duplicateMoves;
  uint32_t malformedFrames;
  uint32_t unrecognizedFrames;
  uint32_t sessions;
};

class CubeAlarmEngine : public ICubeLinkListener {
public:
    CubeAlarmEngine(ICubeHAL& hal, ICubeTransport& transport, const CubeDefaults& defaults);

    /**
     * Applies settings and starts monitoring the configured cube.
     * @return CUBE_OK or ERR_INVALID_IDENTITY (nothing is started).
     */
    CubeError begin(const CubeSettings& settings);

    // Runtime settings update. A new target restarts the link.
    CubeError applySettings(const CubeSettings& settings);

    // --- Main Loop Tick ---
    void tick();

    // --- API Commands ---
    CubeError sendCommand(CubeCommand command, const char* source);
    void triggerAlarm(const char* source);
    void cancelAlarm(const char* source);
    void restartLink();

    void printStartupDiagnostics();
    void printStatus();

    // --- Accessors ---
    SessionPhase getPhase() const { return _link.getPhase(); }
    bool isAlarmRinging() const { return _alarm.isRinging(); }
    bool hasVerdict() const { return _alarm.hasVerdict(); }
    bool isCubeSolved() const { return _alarm.isCubeSolved(); }
    const EngineStats& getStats() const { return _stats; }
    const CubeSettings& getSettings() const { return _settings; }
    const char* getLastFacelets() const { return _lastFacelets; }
    GattSession& link() { return _link; }
    CommandDispatcher& dispatcher() { return _dispatcher; }

    // --- ICubeLinkListener ---
    void onLinkReady(Session& session) override;
    void onLinkLost() override;
    void onFrame(const uint8_t* plaintext, size_t length) override;

private:
    ICubeHAL& _hal;
    ICubeTransport& _transport;
    const CubeDefaults& _defaults;

    GattSession _link;
    CommandDispatcher _dispatcher;
    AlarmController _alarm;

    CubeSettings _settings;
    EngineStats _stats;

    // Initial state request bookkeeping
    bool _awaitingInitialState;
    uint8_t _initialRequests;
    uint32_t _initialStateDeadline;

    // Duplicate move detection
    bool _hasLastSerial;
    uint16_t _lastSerial;

    char _lastFacelets[FACELET_COUNT + 1];

    // Minute of day last sent to the display, -1 = none
    int16_t _shownClockMinute;

    // --- Internal Logic ---
    void processInputs();
    void updateClock();
    void checkInitialState(uint32_t now);
    void handleMove(const MoveEvent& move, uint32_t now);
    void handleState(const DecodedFrame& frame);

    // --- Logging Helper ---
    void logKeyValue(const char* key, const char* value);
};
