/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      src/Esp32BleTransport.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Bluedroid GATT client. Translates GAP/GATTC callbacks into TransportEvents.
 * - Service discovery uses a full search (SEARCH_RES per service).
 * - Characteristic discovery reads the local attribute cache filled by that
 *   search, so its events are reported synchronously.
 * - CCCD writes target the discovered descriptor, falling back to value + 1.
 * =================================================================================
 */
#include "Esp32BleTransport.h"
#include "Esp32CubeHAL.h"

#include <Arduino.h>
#include <esp_bt.h>
#include <esp_bt_main.h>
#include <string.h>

#define GATTC_APP_ID 0
#define CCCD_UUID16 0x2902
#define MAX_CHARS_PER_RANGE 16

// Bluetooth Base UUID 00000000-0000-1000-8000-00805F9B34FB (textual order)
static const uint8_t BASE_UUID[16] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
                                      0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB};

// =================================================================================
// SECTION: SINGLETON
// =================================================================================

Esp32BleTransport::Esp32BleTransport()
    : _hal(nullptr), _sink(nullptr), _gattcIf(ESP_GATT_IF_NONE), _registered(false), _scanning(false), _scanDurationMs(0),
      _connectPending(false), _connected(false), _connId(0), _searchInFlight(false), _cccdCount(0), _droppedEvents(0) {
  memset(_pendingAddress, 0, sizeof(_pendingAddress));
  memset(_peer, 0, sizeof(_peer));
  memset(_cccd, 0, sizeof(_cccd));
}

Esp32BleTransport &Esp32BleTransport::getInstance() {
  static Esp32BleTransport instance;
  return instance;
}

void Esp32BleTransport::gapEventHandler(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param) {
  getInstance().handleGapEvent(event, param);
}

void Esp32BleTransport::gattcEventHandler(esp_gattc_cb_event_t event, esp_gatt_if_t gattcIf, esp_ble_gattc_cb_param_t *param) {
  getInstance().handleGattcEvent(event, gattcIf, param);
}

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

bool Esp32BleTransport::initialize(Esp32CubeHAL &hal) {
  _hal = &hal;
  esp_err_t ret;

  // Release classic BT memory, BLE only
  ret = esp_bt_controller_mem_release(ESP_BT_MODE_CLASSIC_BT);
  if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
    _hal->logKeyValue("BLE", "Could not release classic BT memory.");
  }

  esp_bt_controller_config_t btCfg = BT_CONTROLLER_INIT_CONFIG_DEFAULT();
  ret = esp_bt_controller_init(&btCfg);
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "Controller init failed.");
    return false;
  }

  ret = esp_bt_controller_enable(ESP_BT_MODE_BLE);
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "Controller enable failed.");
    return false;
  }

  ret = esp_bluedroid_init();
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "Bluedroid init failed.");
    return false;
  }

  ret = esp_bluedroid_enable();
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "Bluedroid enable failed.");
    return false;
  }

  ret = esp_ble_gap_register_callback(gapEventHandler);
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "GAP callback register failed.");
    return false;
  }

  ret = esp_ble_gattc_register_callback(gattcEventHandler);
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "GATTC callback register failed.");
    return false;
  }

  // Completion arrives as ESP_GATTC_REG_EVT
  ret = esp_ble_gattc_app_register(GATTC_APP_ID);
  if (ret != ESP_OK) {
    _hal->logKeyValue("BLE", "GATTC app register failed.");
    return false;
  }

  _hal->logKeyValue("BLE", "Bluedroid GATT client initialized.");
  return true;
}

// =================================================================================
// SECTION: SCANNING
// =================================================================================

TransportStatus Esp32BleTransport::startScan(const ScanConfig &config) {
  if (!_registered) return TRANSPORT_BUSY;
  if (_scanning) return TRANSPORT_BUSY;

  esp_ble_scan_params_t scanParams = {};
  scanParams.scan_type = config.active ? BLE_SCAN_TYPE_ACTIVE : BLE_SCAN_TYPE_PASSIVE;
  scanParams.own_addr_type = BLE_ADDR_TYPE_PUBLIC;
  scanParams.scan_filter_policy = BLE_SCAN_FILTER_ALLOW_ALL;
  scanParams.scan_interval = (uint16_t)(config.intervalUs / 625);
  scanParams.scan_window = (uint16_t)(config.windowUs / 625);
  scanParams.scan_duplicate = BLE_SCAN_DUPLICATE_DISABLE;

  // Scanning starts once the parameters are confirmed
  esp_err_t ret = esp_ble_gap_set_scan_params(&scanParams);
  if (ret != ESP_OK) return fromEspErr(ret);

  _scanDurationMs = config.durationMs;
  _scanning = true;
  return TRANSPORT_OK;
}

TransportStatus Esp32BleTransport::stopScan() {
  if (!_scanning) return TRANSPORT_OK;
  esp_err_t ret = esp_ble_gap_stop_scanning();
  if (ret == ESP_OK) _scanning = false;
  return fromEspErr(ret);
}

// =================================================================================
// SECTION: CONNECTION
// =================================================================================

TransportStatus Esp32BleTransport::connect(const DeviceIdentity &address, uint8_t addressType) {
  if (!_registered || _connectPending || _connected) return TRANSPORT_BUSY;

  memcpy(_pendingAddress, address.bytes, CUBE_ADDRESS_LENGTH);
  esp_err_t ret = esp_ble_gattc_open(_gattcIf, _pendingAddress, (esp_ble_addr_type_t)addressType, true);
  if (ret != ESP_OK) return fromEspErr(ret);

  _connectPending = true;
  return TRANSPORT_OK;
}

TransportStatus Esp32BleTransport::cancelConnect() {
  if (!_connectPending) return TRANSPORT_OK;

  // A late OPEN_EVT is still reported; the session drops it
  esp_err_t ret = esp_ble_gap_disconnect(_pendingAddress);
  _connectPending = false;
  return fromEspErr(ret);
}

TransportStatus Esp32BleTransport::disconnect(uint16_t connHandle) {
  if (!isCurrent(connHandle)) return TRANSPORT_FAILED;
  return fromEspErr(esp_ble_gattc_close(_gattcIf, _connId));
}

// =================================================================================
// SECTION: DISCOVERY
// =================================================================================

TransportStatus Esp32BleTransport::discoverServices(uint16_t connHandle) {
  if (!isCurrent(connHandle)) return TRANSPORT_FAILED;
  if (_searchInFlight) return TRANSPORT_BUSY;

  esp_err_t ret = esp_ble_gattc_search_service(_gattcIf, _connId, NULL);
  if (ret != ESP_OK) return fromEspErr(ret);

  _searchInFlight = true;
  return TRANSPORT_OK;
}

TransportStatus Esp32BleTransport::discoverCharacteristics(uint16_t connHandle, const HandleRange &range) {
  if (!isCurrent(connHandle)) return TRANSPORT_FAILED;
  if (_searchInFlight) return TRANSPORT_BUSY;

  // Fixed stack buffer; the cube's services hold only a few characteristics
  esp_gattc_char_elem_t chars[MAX_CHARS_PER_RANGE];
  uint16_t count = MAX_CHARS_PER_RANGE;
  esp_gatt_status_t status = esp_ble_gattc_get_all_char(_gattcIf, _connId, range.start, range.end, chars, &count, 0);

  if (status == ESP_GATT_INVALID_HANDLE || status == ESP_GATT_NOT_FOUND) {
    // Empty range
    count = 0;
  } else if (status != ESP_GATT_OK) {
    return fromGattStatus(status);
  }

  for (uint16_t i = 0; i < count; i++) {
    TransportEvent event;
    memset(&event, 0, sizeof(event));
    event.type = EVT_CHAR_FOUND;
    event.status = TRANSPORT_OK;
    event.connHandle = connHandle;
    event.valueHandle = chars[i].char_handle;
    event.properties = chars[i].properties;
    toUuid128(chars[i].uuid, event.uuid);

    // Remember the CCCD for anything that can notify or indicate
    if ((chars[i].properties & (CHAR_PROP_NOTIFY | CHAR_PROP_INDICATE)) && _cccdCount < MAX_NOTIFY_HANDLES) {
      CccdEntry &entry = _cccd[_cccdCount++];
      entry.valueHandle = chars[i].char_handle;
      entry.descrHandle = chars[i].char_handle + 1;
      entry.properties = chars[i].properties;

      esp_bt_uuid_t cccdUuid;
      cccdUuid.len = ESP_UUID_LEN_16;
      cccdUuid.uuid.uuid16 = CCCD_UUID16;
      esp_gattc_descr_elem_t descr;
      uint16_t descrCount = 1;
      if (esp_ble_gattc_get_descr_by_char_handle(_gattcIf, _connId, chars[i].char_handle, cccdUuid, &descr, &descrCount) ==
              ESP_GATT_OK &&
          descrCount > 0) {
        entry.descrHandle = descr.handle;
      }
    }

    dispatch(event);
  }

  dispatchSimple(EVT_CHAR_DISCOVERY_DONE, TRANSPORT_OK, connHandle);
  return TRANSPORT_OK;
}

// =================================================================================
// SECTION: DATA
// =================================================================================

TransportStatus Esp32BleTransport::enableNotifications(uint16_t connHandle, uint16_t valueHandle) {
  if (!isCurrent(connHandle)) return TRANSPORT_FAILED;

  // 1. Route NOTIFY_EVT for this handle to us
  esp_err_t ret = esp_ble_gattc_register_for_notify(_gattcIf, _peer, valueHandle);
  if (ret != ESP_OK) return fromEspErr(ret);

  // 2. Write the CCCD on the peripheral
  uint16_t descrHandle = valueHandle + 1;
  uint8_t value[2] = {0x01, 0x00};
  const CccdEntry *entry = findCccd(valueHandle);
  if (entry != nullptr) {
    descrHandle = entry->descrHandle;
    if (!(entry->properties & CHAR_PROP_NOTIFY)) value[0] = 0x02; // Indicate only
  } else if (_cccdCount < MAX_NOTIFY_HANDLES) {
    CccdEntry &added = _cccd[_cccdCount++];
    added.valueHandle = valueHandle;
    added.descrHandle = descrHandle;
    added.properties = CHAR_PROP_NOTIFY;
  }

  ret = esp_ble_gattc_write_char_descr(_gattcIf, _connId, descrHandle, sizeof(value), value, ESP_GATT_WRITE_TYPE_RSP,
                                       ESP_GATT_AUTH_REQ_NONE);
  return fromEspErr(ret);
}

TransportStatus Esp32BleTransport::write(uint16_t connHandle, uint16_t valueHandle, const uint8_t *data, size_t length, WriteMode mode) {
  if (!isCurrent(connHandle)) return TRANSPORT_FAILED;

  esp_err_t ret = esp_ble_gattc_write_char(_gattcIf, _connId, valueHandle, (uint16_t)length, const_cast<uint8_t *>(data),
                                           mode == WRITE_WITH_RESPONSE ? ESP_GATT_WRITE_TYPE_RSP : ESP_GATT_WRITE_TYPE_NO_RSP,
                                           ESP_GATT_AUTH_REQ_NONE);

  // Yield to let the BLE stack process
  taskYIELD();
  return fromEspErr(ret);
}

// =================================================================================
// SECTION: GAP EVENTS (Bluetooth Task)
// =================================================================================

void Esp32BleTransport::handleGapEvent(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t *param) {
  switch (event) {
  case ESP_GAP_BLE_SCAN_PARAM_SET_COMPLETE_EVT: {
    if (!_scanning) break; // Stopped before the stack confirmed

    esp_err_t ret = ESP_FAIL;
    if (param->scan_param_cmpl.status == ESP_BT_STATUS_SUCCESS) {
      // Seconds, rounded up; 0 = until stopped
      uint32_t durationSec = (_scanDurationMs + 999) / 1000;
      ret = esp_ble_gap_start_scanning(durationSec);
    }
    if (ret != ESP_OK) {
      _scanning = false;
      dispatchSimple(EVT_SCAN_COMPLETE, TRANSPORT_FAILED, 0);
    }
    break;
  }

  case ESP_GAP_BLE_SCAN_START_COMPLETE_EVT:
    if (param->scan_start_cmpl.status != ESP_BT_STATUS_SUCCESS) {
      _scanning = false;
      dispatchSimple(EVT_SCAN_COMPLETE, TRANSPORT_FAILED, 0);
    }
    break;

  case ESP_GAP_BLE_SCAN_RESULT_EVT:
    if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_RES_EVT) {
      TransportEvent result;
      memset(&result, 0, sizeof(result));
      result.type = EVT_SCAN_RESULT;
      result.status = TRANSPORT_OK;
      memcpy(result.address.bytes, param->scan_rst.bda, CUBE_ADDRESS_LENGTH);
      result.addressType = (uint8_t)param->scan_rst.ble_addr_type;
      result.rssi = (int8_t)param->scan_rst.rssi;
      dispatch(result);
    } else if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_CMPL_EVT) {
      // Timed window elapsed
      _scanning = false;
      dispatchSimple(EVT_SCAN_COMPLETE, TRANSPORT_OK, 0);
    }
    break;

  case ESP_GAP_BLE_SCAN_STOP_COMPLETE_EVT:
    _scanning = false;
    break;

  default:
    break;
  }
}

// =================================================================================
// SECTION: GATTC EVENTS (Bluetooth Task)
// =================================================================================

void Esp32BleTransport::handleGattcEvent(esp_gattc_cb_event_t event, esp_gatt_if_t gattcIf, esp_ble_gattc_cb_param_t *param) {
  switch (event) {
  case ESP_GATTC_REG_EVT:
    if (param->reg.status == ESP_GATT_OK) {
      _gattcIf = gattcIf;
      _registered = true;
      report("GATT client registered.");
    } else {
      report("GATT client registration failed.");
    }
    break;

  case ESP_GATTC_OPEN_EVT: {
    bool wasPending = _connectPending;
    _connectPending = false;

    if (param->open.status != ESP_GATT_OK) {
      if (wasPending) dispatchSimple(EVT_CONNECT_FAILED, fromGattStatus(param->open.status), 0);
      break;
    }

    resetConnection();
    _connected = true;
    _connId = param->open.conn_id;
    memcpy(_peer, param->open.remote_bda, sizeof(_peer));

    TransportEvent connected;
    memset(&connected, 0, sizeof(connected));
    connected.type = EVT_CONNECTED;
    connected.status = TRANSPORT_OK;
    connected.connHandle = _connId;
    memcpy(connected.address.bytes, param->open.remote_bda, CUBE_ADDRESS_LENGTH);
    dispatch(connected);

    // Default MTU still fits every frame
    if (esp_ble_gattc_send_mtu_req(_gattcIf, _connId) != ESP_OK) {
      report("MTU request failed. Using default.");
    }
    break;
  }

  case ESP_GATTC_DISCONNECT_EVT:
    if (isCurrent(param->disconnect.conn_id)) {
      uint16_t connHandle = _connId;
      resetConnection();
      dispatchSimple(EVT_DISCONNECTED, TRANSPORT_OK, connHandle);
    }
    break;

  case ESP_GATTC_CLOSE_EVT:
    if (isCurrent(param->close.conn_id)) {
      uint16_t connHandle = _connId;
      resetConnection();
      dispatchSimple(EVT_DISCONNECTED, TRANSPORT_OK, connHandle);
    }
    break;

  case ESP_GATTC_SEARCH_RES_EVT: {
    if (!isCurrent(param->search_res.conn_id)) break;
    TransportEvent found;
    memset(&found, 0, sizeof(found));
    found.type = EVT_SERVICE_FOUND;
    found.status = TRANSPORT_OK;
    found.connHandle = _connId;
    found.range.start = param->search_res.start_handle;
    found.range.end = param->search_res.end_handle;
    dispatch(found);
    break;
  }

  case ESP_GATTC_SEARCH_CMPL_EVT:
    if (!isCurrent(param->search_cmpl.conn_id)) break;
    _searchInFlight = false;
    dispatchSimple(EVT_SERVICE_DISCOVERY_DONE, fromGattStatus(param->search_cmpl.status), _connId);
    break;

  case ESP_GATTC_NOTIFY_EVT:
    if (!isCurrent(param->notify.conn_id) || _sink == nullptr) break;
    // Hot path - no logging
    if (_hal->lockState(1000)) {
      _sink->onNotification(_connId, param->notify.handle, param->notify.value, param->notify.value_len);
      _hal->unlockState();
    } else {
      _droppedEvents++;
    }
    break;

  case ESP_GATTC_WRITE_DESCR_EVT: {
    if (!isCurrent(param->write.conn_id)) break;
    const CccdEntry *entry = findCccdByDescriptor(param->write.handle);
    TransportEvent written;
    memset(&written, 0, sizeof(written));
    written.type = EVT_CCCD_WRITTEN;
    written.status = fromGattStatus(param->write.status);
    written.connHandle = _connId;
    written.valueHandle = (entry != nullptr) ? entry->valueHandle : (uint16_t)(param->write.handle - 1);
    dispatch(written);
    break;
  }

  case ESP_GATTC_WRITE_CHAR_EVT: {
    if (!isCurrent(param->write.conn_id)) break;
    TransportEvent written;
    memset(&written, 0, sizeof(written));
    written.type = EVT_WRITE_COMPLETE;
    written.status = fromGattStatus(param->write.status);
    written.connHandle = _connId;
    written.valueHandle = param->write.handle;
    dispatch(written);
    break;
  }

  default:
    break;
  }
}

// =================================================================================
// SECTION: HELPERS
// =================================================================================

void Esp32BleTransport::dispatch(const TransportEvent &event) {
  if (_sink == nullptr || _hal == nullptr) return;

  // Recursive: also taken when reporting synchronously from tick()
  if (_hal->lockState(1000)) {
    _sink->onTransportEvent(event);
    _hal->unlockState();
  } else {
    _droppedEvents++;
  }
}

void Esp32BleTransport::dispatchSimple(TransportEventType type, TransportStatus status, uint16_t connHandle) {
  TransportEvent event;
  memset(&event, 0, sizeof(event));
  event.type = type;
  event.status = status;
  event.connHandle = connHandle;
  dispatch(event);
}

void Esp32BleTransport::report(const char *message) {
  if (_hal == nullptr) return;
  if (_hal->lockState(1000)) {
    _hal->logKeyValue("BLE", message);
    _hal->unlockState();
  }
}

void Esp32BleTransport::resetConnection() {
  _connected = false;
  _connId = 0;
  _searchInFlight = false;
  memset(_peer, 0, sizeof(_peer));
  memset(_cccd, 0, sizeof(_cccd));
  _cccdCount = 0;
}

const Esp32BleTransport::CccdEntry *Esp32BleTransport::findCccd(uint16_t valueHandle) const {
  for (uint8_t i = 0; i < _cccdCount; i++) {
    if (_cccd[i].valueHandle == valueHandle) return &_cccd[i];
  }
  return nullptr;
}

const Esp32BleTransport::CccdEntry *Esp32BleTransport::findCccdByDescriptor(uint16_t descrHandle) const {
  for (uint8_t i = 0; i < _cccdCount; i++) {
    if (_cccd[i].descrHandle == descrHandle) return &_cccd[i];
  }
  return nullptr;
}

TransportStatus Esp32BleTransport::fromEspErr(esp_err_t err) {
  switch (err) {
  case ESP_OK:
    return TRANSPORT_OK;
  case ESP_ERR_NO_MEM:
  case ESP_ERR_TIMEOUT:
    return TRANSPORT_BUSY; // Stack queue full, try again later
  default:
    return TRANSPORT_FAILED;
  }
}

TransportStatus Esp32BleTransport::fromGattStatus(esp_gatt_status_t status) {
  switch (status) {
  case ESP_GATT_OK:
    return TRANSPORT_OK;
  case ESP_GATT_BUSY:
  case ESP_GATT_PRC_IN_PROGRESS:
  case ESP_GATT_CONGESTED:
    return TRANSPORT_BUSY;
  default:
    return TRANSPORT_FAILED;
  }
}

void Esp32BleTransport::toUuid128(const esp_bt_uuid_t &in, Uuid128 &out) {
  memcpy(out.bytes, BASE_UUID, sizeof(out.bytes));

  if (in.len == ESP_UUID_LEN_16) {
    out.bytes[2] = (uint8_t)(in.uuid.uuid16 >> 8);
    out.bytes[3] = (uint8_t)(in.uuid.uuid16 & 0xFF);
  } else if (in.len == ESP_UUID_LEN_32) {
    out.bytes[0] = (uint8_t)(in.uuid.uuid32 >> 24);
    out.bytes[1] = (uint8_t)(in.uuid.uuid32 >> 16);
    out.bytes[2] = (uint8_t)(in.uuid.uuid32 >> 8);
    out.bytes[3] = (uint8_t)(in.uuid.uuid32 & 0xFF);
  } else {
    // Bluedroid stores 128-bit UUIDs least-significant byte first
    for (int i = 0; i < 16; i++) {
      out.bytes[i] = in.uuid.uuid128[15 - i];
    }
  }
}
