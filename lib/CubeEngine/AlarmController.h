/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/AlarmController.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Decides when the alarm rings and when it goes quiet.
 * - Alarm due: ring.
 * - Ringing stops on the first State frame that reports the cube solved,
 *   or on an explicit cancel.
 * - Practice mode: a solved -> unsolved transition starts ringing.
 * - Losing the link does not silence the alarm.
 * =================================================================================
 */
#pragma once
#include "CubeContext.h"
#include "Types.h"

class AlarmController {
public:
    explicit AlarmController(ICubeHAL& hal);

    void setRingOnScramble(bool enabled) { _ringOnScramble = enabled; }
    bool getRingOnScramble() const { return _ringOnScramble; }

    // --- Inputs ---
    void onAlarmDue(const char* source);
    void onVerdict(bool solved);
    void onCancel(const char* source);
    void onLinkLost();

    // Services the audio collaborator while ringing.
    void tick();

    // --- Accessors ---
    bool isRinging() const { return _ringing; }
    bool hasVerdict() const { return _hasVerdict; }
    bool isCubeSolved() const { return _lastSolved; }

private:
    ICubeHAL& _hal;
    bool _ringOnScramble;
    bool _ringing;
    bool _hasVerdict;
    bool _lastSolved;

    void start(const char* reason);
    void stop(const char* reason);
    void logKeyValue(const char* key, const char* value);
};
