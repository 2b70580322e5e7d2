/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeProtocol.h
 *
 * Description:
 * Wire constants of the targeted smart cube: GATT identifiers, command
 * payloads and the face-turn alphabet.
 * =================================================================================
 */
#pragma once
#include "Types.h"

#define CUBE_SERVICE_UUID "8653000a-43e6-47b7-9cb0-5fc21d4ae340"
#define CUBE_STATE_CHAR_UUID "8653000b-43e6-47b7-9cb0-5fc21d4ae340"
#define CUBE_COMMAND_CHAR_UUID "8653000c-43e6-47b7-9cb0-5fc21d4ae340"

class CubeProtocol {
public:
    // Parses the canonical 8-4-4-4-12 textual form. Returns false on bad input.
    static bool parseUuid(const char *text, Uuid128 &out);
    static bool uuidEquals(const Uuid128 &a, const Uuid128 &b);

    static const Uuid128 &serviceUuid();
    static const Uuid128 &stateCharUuid();
    static const Uuid128 &commandCharUuid();

    // Fills the 16-byte plaintext for a command (zero padded).
    static void buildCommand(CubeCommand command, uint8_t out[COMMAND_PAYLOAD_SIZE]);

    // "B", "B'", ... "L'", or "?" for codes outside the alphabet.
    static const char *moveToString(uint8_t code);
};
