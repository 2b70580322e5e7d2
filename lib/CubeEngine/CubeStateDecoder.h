/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeStateDecoder.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Interprets decrypted telemetry frames.
 * - 0x55 0x01, 16 bytes : legacy move frame
 * - 0x55 0x02, 16 bytes : move frame (code @5, LE serial @2)
 * - 0x55 0x02, >=19 bytes: facelets frame, big-endian bitstream
 *     CP 7x3 @40, CO 7x2 @61, EP 11x4 @77, EO 11x1 @121
 *   The last element of each array is implied by the sum constraints.
 * Solved means the rebuilt 54-sticker string (URFDLB face order) equals the
 * canonical solved string.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class CubeStateDecoder {
public:
    /**
     * Classifies and parses a plaintext frame.
     * @return CUBE_OK (out.kind says what was found) or ERR_MALFORMED_STATE
     *         when a facelets frame fails validation. A malformed frame
     *         always leaves out.kind == FRAME_UNRECOGNIZED.
     */
    static CubeError decode(const uint8_t *frame, size_t length, DecodedFrame &out);

    static CubeError parseFacelets(const uint8_t *frame, size_t length, CubeState &out);

    // Returns false if the move code is out of range even after byte reversal.
    static bool parseMove(const uint8_t *frame, size_t length, MoveEvent &out);

    static void toFacelets(const CubeState &state, char out[FACELET_COUNT + 1]);
    static bool isSolved(const CubeState &state);
    static const char *solvedFacelets();

    // Reads 'bitCount' bits (MSB first) starting at 'bitOffset'.
    static uint32_t extractBits(const uint8_t *data, size_t length, size_t bitOffset, uint8_t bitCount);
};
