/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeCipher.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Frame cipher used by the cube firmware.
 * - Session key/IV are the fixed base constants with the first six bytes salted
 *   by the peripheral's hardware address.
 * - Frames are AES-128-CBC, but every 16-byte window is processed on its own
 *   with a freshly loaded IV. A frame longer than one block is covered by a
 *   leading window and a trailing window, each decrypted from the received
 *   bytes. Below 32 bytes they overlap and the window written last wins.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class CubeCipher {
public:
    /**
     * Parses a hardware address into raw bytes.
     * Accepts "CF:AA:79:C9:96:9C", "CF-AA-...", bare hex, or a 32-hex-digit
     * identifier (first six bytes are used).
     * @return CUBE_OK or ERR_INVALID_IDENTITY.
     */
    static CubeError parseAddress(const char *text, DeviceIdentity &out);

    // Formats as "CF:AA:79:C9:96:9C".
    static void formatAddress(const DeviceIdentity &identity, char *buffer, size_t size);

    // Derives the per-device key and IV. Pure and deterministic.
    static void deriveKeys(const DeviceIdentity &identity, SessionKeys &out);
    static CubeError deriveKeys(const char *address, SessionKeys &out);

    /**
     * Decrypts a received frame (16..MAX_FRAME_LENGTH bytes).
     * Tries trailing-window-first, then leading-window-first, and keeps the
     * first result that starts with FRAME_MARKER. If neither does, the
     * trailing-first result is returned.
     * @return CUBE_OK, ERR_SHORT_FRAME, ERR_INVALID_LENGTH or ERR_CIPHER_FAILURE.
     */
    static CubeError decrypt(const uint8_t *in, size_t length, const SessionKeys &keys, uint8_t *out);

    // Single decrypt attempt. The order names which window is written first.
    static CubeError decryptWithOrder(const uint8_t *in, size_t length, const SessionKeys &keys, ChunkOrder order, uint8_t *out);

    /**
     * Encrypts an outgoing command payload. Only 16 and 32 byte payloads exist.
     * @return CUBE_OK, ERR_INVALID_LENGTH or ERR_CIPHER_FAILURE.
     */
    static CubeError encrypt(const uint8_t *in, size_t length, const SessionKeys &keys, uint8_t *out);

private:
    static bool cryptWindow(bool encrypt, const SessionKeys &keys, const uint8_t *input, uint8_t *output);
    static CubeError checkLength(size_t length);
};
