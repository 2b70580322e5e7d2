/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared enums, constants and plain data structs for the cube link core.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum SessionPhase : uint8_t {
  PHASE_IDLE,
  PHASE_SCANNING,
  PHASE_CONNECTING,
  PHASE_SERVICE_DISCOVERY,
  PHASE_CHAR_DISCOVERY,
  PHASE_CCCD_ENABLE,
  PHASE_READY,
  PHASE_DISCONNECTED
};

enum CubeError : uint8_t {
  CUBE_OK,
  ERR_INVALID_IDENTITY,
  ERR_SHORT_FRAME,
  ERR_INVALID_LENGTH,
  ERR_MALFORMED_STATE,
  ERR_TRANSPORT_BUSY,
  ERR_DISCOVERY_INCOMPLETE,
  ERR_CIPHER_FAILURE
};

enum TransportStatus : uint8_t { TRANSPORT_OK, TRANSPORT_BUSY, TRANSPORT_FAILED };
enum WriteMode : uint8_t { WRITE_NO_RESPONSE, WRITE_WITH_RESPONSE };
enum FrameKind : uint8_t { FRAME_UNRECOGNIZED, FRAME_MOVE, FRAME_STATE };
enum ChunkOrder : uint8_t { ORDER_TRAILING_FIRST, ORDER_LEADING_FIRST };
enum CubeCommand : uint8_t { CMD_REQUEST_STATE, CMD_RESET, CMD_REQUEST_BATTERY, CMD_REQUEST_HARDWARE };

enum TransportEventType : uint8_t {
  EVT_SCAN_RESULT,
  EVT_SCAN_COMPLETE,
  EVT_CONNECTED,
  EVT_CONNECT_FAILED,
  EVT_DISCONNECTED,
  EVT_SERVICE_FOUND,
  EVT_SERVICE_DISCOVERY_DONE,
  EVT_CHAR_FOUND,
  EVT_CHAR_DISCOVERY_DONE,
  EVT_CCCD_WRITTEN,
  EVT_WRITE_COMPLETE
};

// --- Constants ---

// Protocol
#define CUBE_ADDRESS_LENGTH 6
#define CUBE_ADDRESS_TEXT_LENGTH 40
#define CIPHER_BLOCK_SIZE 16
#define COMMAND_PAYLOAD_SIZE 16
#define MAX_FRAME_LENGTH 32
#define FRAME_MARKER 0x55
#define FACELET_COUNT 54
#define MOVE_CODE_COUNT 12
#define MOVE_CODE_UNKNOWN 0xFF

// GATT characteristic property bits (Core Spec Vol 3, Part G, 3.3.1.1)
#define CHAR_PROP_NOTIFY 0x10
#define CHAR_PROP_INDICATE 0x20

// Session capacity
#define MAX_SERVICE_RANGES 16
#define MAX_NOTIFY_HANDLES 8

// Queues
#define EVENT_QUEUE_SIZE 32
#define NOTIFY_QUEUE_SIZE 8
#define COMMAND_QUEUE_SIZE 8

// Logging
#define SERIAL_QUEUE_SIZE 50
#define LOG_BUFFER_SIZE 100
#define MAX_LOG_LENGTH 150

// --- Protocol Structs ---
struct DeviceIdentity {
  uint8_t bytes[CUBE_ADDRESS_LENGTH]; // Display order (MSB first)
};

struct SessionKeys {
  uint8_t key[CIPHER_BLOCK_SIZE];
  uint8_t iv[CIPHER_BLOCK_SIZE];
};

struct Uuid128 {
  uint8_t bytes[16]; // Textual order
};

struct HandleRange {
  uint16_t start;
  uint16_t end;
};

struct CubeState {
  uint8_t cp[8];
  uint8_t co[8];
  uint8_t ep[12];
  uint8_t eo[12];
};

struct MoveEvent {
  uint8_t code; // Index into the face-turn alphabet, MOVE_CODE_UNKNOWN for legacy frames
  uint16_t serial;
  bool legacy;
};

struct DecodedFrame {
  FrameKind kind;
  MoveEvent move;
  CubeState state;
  bool solved;
  char facelets[FACELET_COUNT + 1];
};

// --- Transport Structs ---
struct ScanConfig {
  uint32_t durationMs; // 0 = scan until stopped
  uint32_t intervalUs;
  uint32_t windowUs;
  bool active;
};

struct TransportEvent {
  TransportEventType type;
  TransportStatus status;
  uint16_t connHandle;

  // Scan / connect
  DeviceIdentity address;
  uint8_t addressType;
  int8_t rssi;

  // Service discovery
  HandleRange range;

  // Characteristic discovery / descriptor writes
  uint16_t valueHandle;
  uint8_t properties;
  Uuid128 uuid;
};

struct NotificationFrame {
  uint16_t connHandle;
  uint16_t valueHandle;
  uint8_t length;
  uint8_t data[MAX_FRAME_LENGTH];
};

// --- Session ---
// One connection lifetime. Reset wholesale on every new connection.
struct Session {
  bool active;
  uint16_t connHandle;
  DeviceIdentity peer;
  SessionKeys keys;

  // Service ranges double as the pending characteristic-discovery queue
  HandleRange serviceRanges[MAX_SERVICE_RANGES];
  uint8_t serviceRangeCount;
  uint8_t nextRangeIndex;
  bool discoveryInFlight;

  uint16_t commandHandle;
  uint16_t stateHandle;

  // Value handles awaiting CCCD enablement
  uint16_t cccdHandles[MAX_NOTIFY_HANDLES];
  uint8_t cccdCount;
  uint8_t cccdNext;
  bool stateNotifyRequested;
  bool stateNotifyConfirmed;
  uint32_t stateNotifyRequestedAt;

  // Cooldown gate for the next transport operation
  uint32_t nextOpAllowedMs;
};

// --- Configuration Structs ---
struct CubeDefaults {
  uint32_t tickIntervalMs;

  // Scanning
  uint32_t scanDurationMs;
  uint32_t scanIntervalUs;
  uint32_t scanWindowUs;
  bool activeScan;

  // Bring-up
  uint32_t connectTimeoutMs;
  uint32_t discoveryTimeoutMs;
  uint32_t reconnectDelayMs;
  uint32_t busyRearmMs;
  uint32_t cccdCooldownMs;
  uint32_t cccdConfirmTimeoutMs;
  uint32_t initialStateTimeoutMs;
  uint8_t initialStateMaxRequests;

  // Commands
  uint32_t writeCooldownMs;
  uint8_t commandRetryBudget;
  uint32_t commandRetryIntervalMs;
  uint32_t commandBusyRetryMs;
  uint32_t statePollDelayMs;
  uint32_t statePollRateLimitMs;

  // Notifications
  uint8_t notificationsPerTick;

  // Inputs
  uint32_t longPressDuration; // ms
};

struct CubeSettings {
  char targetAddress[CUBE_ADDRESS_TEXT_LENGTH];
  WriteMode writeMode;
  bool alarmEnabled;
  uint8_t alarmHour;
  uint8_t alarmMinute;
  bool ringOnScramble;
};

// --- String Helpers ---
const char *phaseToString(SessionPhase p);
const char *errorToString(CubeError e);
const char *commandToString(CubeCommand c);
const char *writeModeToString(WriteMode m);
const char *transportStatusToString(TransportStatus s);
