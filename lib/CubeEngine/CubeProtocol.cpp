/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeProtocol.cpp
 * =================================================================================
 */
#include "CubeProtocol.h"
#include <string.h>

static const char *MOVE_ALPHABET[MOVE_CODE_COUNT] = {"B", "B'", "F", "F'", "U", "U'", "D", "D'", "R", "R'", "L", "L'"};

static const uint8_t RESET_PAYLOAD[COMMAND_PAYLOAD_SIZE] = {0x68, 0x05, 0x05, 0x39, 0x77, 0x00, 0x00, 0x01,
                                                           0x23, 0x45, 0x67, 0x89, 0xAB, 0x00, 0x00, 0x00};

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool CubeProtocol::parseUuid(const char *text, Uuid128 &out) {
  if (text == nullptr || strlen(text) != 36) return false;

  size_t byteIndex = 0;
  for (size_t i = 0; i < 36;) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') return false;
      i++;
      continue;
    }
    int hi = hexValue(text[i]);
    int lo = hexValue(text[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out.bytes[byteIndex++] = (uint8_t)((hi << 4) | lo);
    i += 2;
  }
  return byteIndex == 16;
}

bool CubeProtocol::uuidEquals(const Uuid128 &a, const Uuid128 &b) { return memcmp(a.bytes, b.bytes, sizeof(a.bytes)) == 0; }

static Uuid128 makeUuid(const char *text) {
  Uuid128 uuid;
  memset(&uuid, 0, sizeof(uuid));
  CubeProtocol::parseUuid(text, uuid);
  return uuid;
}

const Uuid128 &CubeProtocol::serviceUuid() {
  static const Uuid128 uuid = makeUuid(CUBE_SERVICE_UUID);
  return uuid;
}

const Uuid128 &CubeProtocol::stateCharUuid() {
  static const Uuid128 uuid = makeUuid(CUBE_STATE_CHAR_UUID);
  return uuid;
}

const Uuid128 &CubeProtocol::commandCharUuid() {
  static const Uuid128 uuid = makeUuid(CUBE_COMMAND_CHAR_UUID);
  return uuid;
}

void CubeProtocol::buildCommand(CubeCommand command, uint8_t out[COMMAND_PAYLOAD_SIZE]) {
  memset(out, 0, COMMAND_PAYLOAD_SIZE);

  switch (command) {
  case CMD_RESET:
    memcpy(out, RESET_PAYLOAD, COMMAND_PAYLOAD_SIZE);
    break;
  case CMD_REQUEST_BATTERY:
    out[0] = 0x03;
    break;
  case CMD_REQUEST_HARDWARE:
    out[0] = 0x01;
    break;
  case CMD_REQUEST_STATE:
  default:
    out[0] = 0x02;
    break;
  }
}

const char *CubeProtocol::moveToString(uint8_t code) {
  if (code < MOVE_CODE_COUNT) return MOVE_ALPHABET[code];
  return "?";
}
