/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      include/Esp32BleTransport.h
 * Description: ESP-IDF Bluedroid implementation of ICubeTransport.
 * Single GATT client connection. Bluedroid callbacks run in the Bluetooth task;
 * every event is handed to the sink while holding the HAL state mutex.
 * =================================================================================
 */
#pragma once

#include "CubeContext.h"
#include "Types.h"
#include <esp_gap_ble_api.h>
#include <esp_gatt_common_api.h>
#include <esp_gattc_api.h>

class Esp32CubeHAL;

class Esp32BleTransport : public ICubeTransport {
public:
  static Esp32BleTransport &getInstance();

  // Brings up the controller and Bluedroid and registers the GATT client app.
  bool initialize(Esp32CubeHAL &hal);

  void setEventSink(ITransportEventSink *sink) override { _sink = sink; }

  // --- ICubeTransport ---
  TransportStatus startScan(const ScanConfig &config) override;
  TransportStatus stopScan() override;

  TransportStatus connect(const DeviceIdentity &address, uint8_t addressType) override;
  TransportStatus cancelConnect() override;
  TransportStatus disconnect(uint16_t connHandle) override;

  TransportStatus discoverServices(uint16_t connHandle) override;
  TransportStatus discoverCharacteristics(uint16_t connHandle, const HandleRange &range) override;

  TransportStatus enableNotifications(uint16_t connHandle, uint16_t valueHandle) override;
  TransportStatus write(uint16_t connHandle, uint16_t valueHandle, const uint8_t *data, size_t length, WriteMode mode) override;

  uint32_t getDroppedEvents() const { return _droppedEvents; }

private:
  Esp32BleTransport();

  struct CccdEntry {
    uint16_t valueHandle;
    uint16_t descrHandle;
    uint8_t properties;
  };

  Esp32CubeHAL *_hal;
  ITransportEventSink *_sink;

  // --- Stack State ---
  esp_gatt_if_t _gattcIf;
  bool _registered;

  // --- Scan State ---
  bool _scanning;
  uint32_t _scanDurationMs;

  // --- Connection State ---
  bool _connectPending;
  esp_bd_addr_t _pendingAddress;
  bool _connected;
  uint16_t _connId;
  esp_bd_addr_t _peer;
  bool _searchInFlight;

  // Descriptor handles learned during characteristic discovery
  CccdEntry _cccd[MAX_NOTIFY_HANDLES];
  uint8_t _cccdCount;

  volatile uint32_t _droppedEvents;

  // --- Static Callback Handlers (route to the instance) ---
  static void gapEventHandler(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param);
  static void gattcEventHandler(esp_gattc_cb_event_t event, esp_gatt_if_t gattcIf, esp_ble_gattc_cb_param_t *param);

  void handleGapEvent(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param);
  void handleGattcEvent(esp_gattc_cb_event_t event, esp_gatt_if_t gattcIf, esp_ble_gattc_cb_param_t *param);

  // --- Helpers ---
  void dispatch(const TransportEvent &event);
  void dispatchSimple(TransportEventType type, TransportStatus status, uint16_t connHandle);
  void report(const char *message);
  void resetConnection();
  const CccdEntry *findCccd(uint16_t valueHandle) const;
  const CccdEntry *findCccdByDescriptor(uint16_t descrHandle) const;
  bool isCurrent(uint16_t connHandle) const { return _connected && connHandle == _connId; }

  static TransportStatus fromEspErr(esp_err_t err);
  static TransportStatus fromGattStatus(esp_gatt_status_t status);
  static void toUuid128(const esp_bt_uuid_t &in, Uuid128 &out);
};
