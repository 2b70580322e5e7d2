/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *phaseToString(SessionPhase p) {
  switch (p) {
  case PHASE_SCANNING:
    return "SCANNING";
  case PHASE_CONNECTING:
    return "CONNECTING";
  case PHASE_SERVICE_DISCOVERY:
    return "SERVICE_DISCOVERY";
  case PHASE_CHAR_DISCOVERY:
    return "CHAR_DISCOVERY";
  case PHASE_CCCD_ENABLE:
    return "CCCD_ENABLE";
  case PHASE_READY:
    return "READY";
  case PHASE_DISCONNECTED:
    return "DISCONNECTED";
  default:
    return "IDLE";
  }
}

const char *errorToString(CubeError e) {
  switch (e) {
  case CUBE_OK:
    return "OK";
  case ERR_INVALID_IDENTITY:
    return "INVALID_IDENTITY";
  case ERR_SHORT_FRAME:
    return "SHORT_FRAME";
  case ERR_INVALID_LENGTH:
    return "INVALID_LENGTH";
  case ERR_MALFORMED_STATE:
    return "MALFORMED_STATE";
  case ERR_TRANSPORT_BUSY:
    return "TRANSPORT_BUSY";
  case ERR_DISCOVERY_INCOMPLETE:
    return "DISCOVERY_INCOMPLETE";
  default:
    return "CIPHER_FAILURE";
  }
}

const char *commandToString(CubeCommand c) {
  switch (c) {
  case CMD_RESET:
    return "Reset";
  case CMD_REQUEST_BATTERY:
    return "Batt";
  case CMD_REQUEST_HARDWARE:
    return "HW";
  default:
    return "Face";
  }
}

const char *writeModeToString(WriteMode m) { return (m == WRITE_WITH_RESPONSE) ? "ack" : "no-ack"; }

const char *transportStatusToString(TransportStatus s) {
  switch (s) {
  case TRANSPORT_OK:
    return "OK";
  case TRANSPORT_BUSY:
    return "BUSY";
  default:
    return "FAILED";
  }
}
