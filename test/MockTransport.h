/*
 * File: test/MockTransport.h
 * Description: Scriptable BLE transport for Native Unit Tests.
 * Records every operation and lets tests inject events the way the stack's
 * callback would.
 */
#pragma once
#include "CubeContext.h"
#include "CubeCipher.h"
#include "CubeProtocol.h"
#include <deque>
#include <vector>
#include <cstring>

struct WrittenFrame {
    uint16_t connHandle;
    uint16_t valueHandle;
    std::vector<uint8_t> data;
    WriteMode mode;
};

class MockTransport : public ICubeTransport {
public:
    ITransportEventSink* sink = nullptr;

    // --- Call Counters ---
    int scanStarts = 0;
    int scanStops = 0;
    int connectCalls = 0;
    int cancelConnectCalls = 0;
    int disconnectCalls = 0;
    int serviceDiscoveries = 0;
    std::vector<HandleRange> charDiscoveries;
    std::vector<uint16_t> cccdWrites;
    std::vector<WrittenFrame> writes;
    ScanConfig lastScanConfig = {};
    DeviceIdentity lastConnectAddress = {};
    uint16_t lastDisconnectHandle = 0;

    // --- Scripted Results (front is consumed first, default OK) ---
    std::deque<TransportStatus> scanResults;
    std::deque<TransportStatus> connectResults;
    std::deque<TransportStatus> serviceResults;
    std::deque<TransportStatus> charResults;
    std::deque<TransportStatus> cccdResults;
    std::deque<TransportStatus> writeResults;

    // --- ICubeTransport Implementation ---

    void setEventSink(ITransportEventSink* s) override { sink = s; }

    TransportStatus startScan(const ScanConfig& config) override {
        lastScanConfig = config;
        TransportStatus st = next(scanResults);
        if (st == TRANSPORT_OK) scanStarts++;
        return st;
    }

    TransportStatus stopScan() override {
        scanStops++;
        return TRANSPORT_OK;
    }

    TransportStatus connect(const DeviceIdentity& address, uint8_t addressType) override {
        (void)addressType;
        TransportStatus st = next(connectResults);
        if (st == TRANSPORT_OK) {
            connectCalls++;
            lastConnectAddress = address;
        }
        return st;
    }

    TransportStatus cancelConnect() override {
        cancelConnectCalls++;
        return TRANSPORT_OK;
    }

    TransportStatus disconnect(uint16_t connHandle) override {
        disconnectCalls++;
        lastDisconnectHandle = connHandle;
        return TRANSPORT_OK;
    }

    TransportStatus discoverServices(uint16_t connHandle) override {
        (void)connHandle;
        TransportStatus st = next(serviceResults);
        if (st == TRANSPORT_OK) serviceDiscoveries++;
        return st;
    }

    TransportStatus discoverCharacteristics(uint16_t connHandle, const HandleRange& range) override {
        (void)connHandle;
        TransportStatus st = next(charResults);
        if (st == TRANSPORT_OK) charDiscoveries.push_back(range);
        return st;
    }

    TransportStatus enableNotifications(uint16_t connHandle, uint16_t valueHandle) override {
        (void)connHandle;
        TransportStatus st = next(cccdResults);
        if (st == TRANSPORT_OK) cccdWrites.push_back(valueHandle);
        return st;
    }

    TransportStatus write(uint16_t connHandle, uint16_t valueHandle, const uint8_t* data, size_t length, WriteMode mode) override {
        TransportStatus st = next(writeResults);
        WrittenFrame f;
        f.connHandle = connHandle;
        f.valueHandle = valueHandle;
        f.data.assign(data, data + length);
        f.mode = mode;
        attemptedWrites.push_back(f);
        if (st == TRANSPORT_OK) writes.push_back(f);
        return st;
    }

    std::vector<WrittenFrame> attemptedWrites;

    // --- Event Injection (acts as the stack callback) ---

    static TransportEvent makeEvent(TransportEventType type, uint16_t connHandle = 0) {
        TransportEvent e;
        memset(&e, 0, sizeof(e));
        e.type = type;
        e.status = TRANSPORT_OK;
        e.connHandle = connHandle;
        return e;
    }

    void emit(const TransportEvent& e) {
        if (sink) sink->onTransportEvent(e);
    }

    void emitScanResult(const DeviceIdentity& address, int8_t rssi = -60) {
        TransportEvent e = makeEvent(EVT_SCAN_RESULT);
        e.address = address;
        e.rssi = rssi;
        emit(e);
    }

    void emitConnected(uint16_t conn, const DeviceIdentity& address) {
        TransportEvent e = makeEvent(EVT_CONNECTED, conn);
        e.address = address;
        emit(e);
    }

    void emitDisconnected(uint16_t conn) { emit(makeEvent(EVT_DISCONNECTED, conn)); }

    void emitService(uint16_t conn, uint16_t start, uint16_t end) {
        TransportEvent e = makeEvent(EVT_SERVICE_FOUND, conn);
        e.range.start = start;
        e.range.end = end;
        emit(e);
    }

    void emitServicesDone(uint16_t conn, TransportStatus status = TRANSPORT_OK) {
        TransportEvent e = makeEvent(EVT_SERVICE_DISCOVERY_DONE, conn);
        e.status = status;
        emit(e);
    }

    void emitChar(uint16_t conn, const Uuid128& uuid, uint16_t valueHandle, uint8_t properties) {
        TransportEvent e = makeEvent(EVT_CHAR_FOUND, conn);
        e.uuid = uuid;
        e.valueHandle = valueHandle;
        e.properties = properties;
        emit(e);
    }

    void emitCharsDone(uint16_t conn, TransportStatus status = TRANSPORT_OK) {
        TransportEvent e = makeEvent(EVT_CHAR_DISCOVERY_DONE, conn);
        e.status = status;
        emit(e);
    }

    void emitCccdWritten(uint16_t conn, uint16_t valueHandle, TransportStatus status = TRANSPORT_OK) {
        TransportEvent e = makeEvent(EVT_CCCD_WRITTEN, conn);
        e.valueHandle = valueHandle;
        e.status = status;
        emit(e);
    }

    void emitNotification(uint16_t conn, uint16_t valueHandle, const uint8_t* data, size_t length) {
        if (sink) sink->onNotification(conn, valueHandle, data, length);
    }

private:
    static TransportStatus next(std::deque<TransportStatus>& q) {
        if (q.empty()) return TRANSPORT_OK;
        TransportStatus st = q.front();
        q.pop_front();
        return st;
    }
};
