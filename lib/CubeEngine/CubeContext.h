/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeContext.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Abstraction layer between the cube link core and the platform:
 * - ICubeTransport: the BLE central stack (scan, connect, GATT discovery, writes).
 * - ITransportEventSink: callback surface the transport reports into.
 * - ICubeHAL: UI, audio, buttons, logging and time.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ITransportEventSink {
public:
    virtual ~ITransportEventSink() {}

    // Invoked from the transport's callback context. Implementations must only
    // record the event; no transport operation may be issued from here.
    virtual void onTransportEvent(const TransportEvent& event) = 0;

    // Notify/indicate payload for a subscribed value handle.
    virtual void onNotification(uint16_t connHandle, uint16_t valueHandle, const uint8_t* data, size_t length) = 0;
};

class ICubeTransport {
public:
    virtual ~ICubeTransport() {}

    virtual void setEventSink(ITransportEventSink* sink) = 0;

    // --- Scanning ---
    // Results arrive as EVT_SCAN_RESULT, the end of a timed window as EVT_SCAN_COMPLETE.
    virtual TransportStatus startScan(const ScanConfig& config) = 0;
    virtual TransportStatus stopScan() = 0;

    // --- Connection ---
    // Completion arrives as EVT_CONNECTED or EVT_CONNECT_FAILED.
    virtual TransportStatus connect(const DeviceIdentity& address, uint8_t addressType) = 0;
    virtual TransportStatus cancelConnect() = 0;
    virtual TransportStatus disconnect(uint16_t connHandle) = 0;

    // --- Discovery ---
    // One EVT_SERVICE_FOUND per primary service, then EVT_SERVICE_DISCOVERY_DONE.
    virtual TransportStatus discoverServices(uint16_t connHandle) = 0;

    // One EVT_CHAR_FOUND per characteristic in the range, then EVT_CHAR_DISCOVERY_DONE.
    // Only one discovery operation may be outstanding at a time.
    virtual TransportStatus discoverCharacteristics(uint16_t connHandle, const HandleRange& range) = 0;

    // --- Data ---
    // Writes the notification-enable value to the characteristic's CCCD.
    // Confirmation (if the stack reports one) arrives as EVT_CCCD_WRITTEN.
    virtual TransportStatus enableNotifications(uint16_t connHandle, uint16_t valueHandle) = 0;

    virtual TransportStatus write(uint16_t connHandle, uint16_t valueHandle, const uint8_t* data, size_t length, WriteMode mode) = 0;
};

class ICubeHAL {
public:
    virtual ~ICubeHAL() {}

    // --- UI ---
    // Short status line for the display (e.g. "Scanning...", "Solved!").
    virtual void showStatus(const char* status) = 0;

    // Connection phase for the link indicator (status LED).
    virtual void setLinkIndicator(SessionPhase phase) = 0;

    // Current time of day. Returns false while the wall clock is unset.
    virtual bool getTimeOfDay(uint8_t& hour, uint8_t& minute) = 0;

    // Time of day for the display. Called when the minute changes.
    virtual void showClock(uint8_t hour, uint8_t minute) = 0;

    // --- Audio ---
    virtual void startAlarm() = 0;
    virtual void stopAlarm() = 0;

    // Services the tone generator. Called every tick while ringing.
    virtual void pollAlarm() = 0;

    // --- Input Events ---
    // All of these read and clear their flag (Consume).

    // Returns true once when the configured wake-up time is reached.
    virtual bool checkAlarmDue() = 0;

    // Long press: silence the alarm.
    virtual bool checkCancelAction() = 0;

    // Diagnostic requests.
    virtual bool checkStatePollAction() = 0;
    virtual bool checkResetAction() = 0;
    virtual bool checkBatteryAction() = 0;
    virtual bool checkHardwareInfoAction() = 0;

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Utils ---
    virtual unsigned long getMillis() = 0;
};
