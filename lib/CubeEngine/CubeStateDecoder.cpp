/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeStateDecoder.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Frame classification, facelets bit-field extraction and the solved predicate.
 * =================================================================================
 */
#include "CubeStateDecoder.h"
#include <string.h>

// --- Frame Layout ---
#define FRAME_TYPE_LEGACY_MOVE 0x01
#define FRAME_TYPE_MOVE 0x02
#define MOVE_FRAME_LENGTH 16
#define FACELETS_MIN_LENGTH 19
#define MOVE_CODE_OFFSET 5

#define CP_BIT_OFFSET 40
#define CO_BIT_OFFSET 61
#define EP_BIT_OFFSET 77
#define EO_BIT_OFFSET 121

static const char FACE_ORDER[] = "URFDLB";
static const char SOLVED_FACELETS[] = "UUUUUUUUURRRRRRRRRFFFFFFFFFDDDDDDDDDLLLLLLLLLBBBBBBBBB";

// Sticker indices per corner slot (URF, UFL, ULB, UBR, DFR, DLF, DBL, DRB)
static const uint8_t CORNER_FACELETS[8][3] = {
    {8, 9, 20}, {6, 18, 38}, {0, 36, 47}, {2, 45, 11},
    {29, 26, 15}, {27, 44, 24}, {33, 53, 42}, {35, 17, 51}};

// Sticker indices per edge slot (UR, UF, UL, UB, DR, DF, DL, DB, FR, FL, BL, BR)
static const uint8_t EDGE_FACELETS[12][2] = {
    {5, 10}, {7, 19}, {3, 37}, {1, 46}, {32, 16}, {28, 25},
    {30, 43}, {34, 52}, {23, 12}, {21, 41}, {50, 39}, {48, 14}};

// =================================================================================
// SECTION: BIT EXTRACTION
// =================================================================================

uint32_t CubeStateDecoder::extractBits(const uint8_t *data, size_t length, size_t bitOffset, uint8_t bitCount) {
  uint32_t value = 0;
  for (uint8_t i = 0; i < bitCount; i++) {
    size_t bit = bitOffset + i;
    size_t byteIndex = bit / 8;
    if (byteIndex >= length) return 0;
    value = (value << 1) | ((data[byteIndex] >> (7 - (bit % 8))) & 0x01);
  }
  return value;
}

// =================================================================================
// SECTION: FACELETS
// =================================================================================

static bool isPermutation(const uint8_t *values, uint8_t count) {
  uint16_t seen = 0;
  for (uint8_t i = 0; i < count; i++) {
    if (values[i] >= count) return false;
    uint16_t bit = (uint16_t)(1u << values[i]);
    if (seen & bit) return false;
    seen |= bit;
  }
  return true;
}

CubeError CubeStateDecoder::parseFacelets(const uint8_t *frame, size_t length, CubeState &out) {
  if (length < FACELETS_MIN_LENGTH) return ERR_MALFORMED_STATE;

  // Corner permutation
  int sum = 0;
  for (int i = 0; i < 7; i++) {
    out.cp[i] = (uint8_t)extractBits(frame, length, CP_BIT_OFFSET + i * 3, 3);
    sum += out.cp[i];
  }
  int lastCorner = 28 - sum;
  if (lastCorner < 0 || lastCorner > 7) return ERR_MALFORMED_STATE;
  out.cp[7] = (uint8_t)lastCorner;

  // Corner orientation
  sum = 0;
  for (int i = 0; i < 7; i++) {
    out.co[i] = (uint8_t)extractBits(frame, length, CO_BIT_OFFSET + i * 2, 2);
    sum += out.co[i];
  }
  out.co[7] = (uint8_t)((3 - sum % 3) % 3);

  // Edge permutation
  sum = 0;
  for (int i = 0; i < 11; i++) {
    out.ep[i] = (uint8_t)extractBits(frame, length, EP_BIT_OFFSET + i * 4, 4);
    sum += out.ep[i];
  }
  int lastEdge = 66 - sum;
  if (lastEdge < 0 || lastEdge > 11) return ERR_MALFORMED_STATE;
  out.ep[11] = (uint8_t)lastEdge;

  // Edge orientation
  sum = 0;
  for (int i = 0; i < 11; i++) {
    out.eo[i] = (uint8_t)extractBits(frame, length, EO_BIT_OFFSET + i, 1);
    sum += out.eo[i];
  }
  out.eo[11] = (uint8_t)((2 - sum % 2) % 2);

  // Validation
  if (!isPermutation(out.cp, 8) || !isPermutation(out.ep, 12)) return ERR_MALFORMED_STATE;
  for (int i = 0; i < 8; i++) {
    if (out.co[i] > 2) return ERR_MALFORMED_STATE;
  }
  for (int i = 0; i < 12; i++) {
    if (out.eo[i] > 1) return ERR_MALFORMED_STATE;
  }
  return CUBE_OK;
}

void CubeStateDecoder::toFacelets(const CubeState &state, char out[FACELET_COUNT + 1]) {
  for (int i = 0; i < FACELET_COUNT; i++) {
    out[i] = FACE_ORDER[i / 9];
  }
  out[FACELET_COUNT] = '\0';

  for (int i = 0; i < 8; i++) {
    if (state.cp[i] >= 8) continue;
    for (int p = 0; p < 3; p++) {
      out[CORNER_FACELETS[i][(p + state.co[i]) % 3]] = FACE_ORDER[CORNER_FACELETS[state.cp[i]][p] / 9];
    }
  }

  for (int i = 0; i < 12; i++) {
    if (state.ep[i] >= 12) continue;
    for (int p = 0; p < 2; p++) {
      out[EDGE_FACELETS[i][(p + state.eo[i]) % 2]] = FACE_ORDER[EDGE_FACELETS[state.ep[i]][p] / 9];
    }
  }
}

bool CubeStateDecoder::isSolved(const CubeState &state) {
  char facelets[FACELET_COUNT + 1];
  toFacelets(state, facelets);
  return strcmp(facelets, SOLVED_FACELETS) == 0;
}

const char *CubeStateDecoder::solvedFacelets() { return SOLVED_FACELETS; }

// =================================================================================
// SECTION: MOVES
// =================================================================================

bool CubeStateDecoder::parseMove(const uint8_t *frame, size_t length, MoveEvent &out) {
  if (length < MOVE_FRAME_LENGTH) return false;

  out.legacy = false;
  uint8_t code = frame[MOVE_CODE_OFFSET];
  if (code < MOVE_CODE_COUNT) {
    out.code = code;
    out.serial = (uint16_t)(frame[2] | (frame[3] << 8));
    return true;
  }

  // Some firmware sends the body byte-reversed. Header stays in place.
  uint8_t reversed[MAX_FRAME_LENGTH];
  reversed[0] = frame[0];
  reversed[1] = frame[1];
  for (size_t i = 2; i < length; i++) {
    reversed[i] = frame[length - 1 - (i - 2)];
  }

  code = reversed[MOVE_CODE_OFFSET];
  if (code >= MOVE_CODE_COUNT) return false;

  out.code = code;
  out.serial = (uint16_t)(reversed[2] | (reversed[3] << 8));
  return true;
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

CubeError CubeStateDecoder::decode(const uint8_t *frame, size_t length, DecodedFrame &out) {
  memset(&out, 0, sizeof(out));
  out.kind = FRAME_UNRECOGNIZED;

  if (length < 2 || length > MAX_FRAME_LENGTH || frame[0] != FRAME_MARKER) return CUBE_OK;

  if (length == MOVE_FRAME_LENGTH && frame[1] == FRAME_TYPE_LEGACY_MOVE) {
    out.kind = FRAME_MOVE;
    out.move.code = MOVE_CODE_UNKNOWN;
    out.move.legacy = true;
    return CUBE_OK;
  }

  if (length == MOVE_FRAME_LENGTH && frame[1] == FRAME_TYPE_MOVE) {
    if (parseMove(frame, length, out.move)) {
      out.kind = FRAME_MOVE;
    }
    return CUBE_OK;
  }

  if (length >= FACELETS_MIN_LENGTH && frame[1] == FRAME_TYPE_MOVE) {
    CubeState state;
    CubeError err = parseFacelets(frame, length, state);
    if (err != CUBE_OK) return err;

    out.kind = FRAME_STATE;
    out.state = state;
    toFacelets(state, out.facelets);
    out.solved = (strcmp(out.facelets, SOLVED_FACELETS) == 0);
  }

  return CUBE_OK;
}
