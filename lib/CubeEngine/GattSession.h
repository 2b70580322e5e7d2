/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/GattSession.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * GATT client state machine for the cube link.
 *
 *   IDLE -> SCANNING -> CONNECTING -> SERVICE_DISCOVERY -> CHAR_DISCOVERY
 *        -> CCCD_ENABLE -> READY -> (DISCONNECTED -> SCANNING)
 *
 * NOTES:
 * 1. The transport callback only enqueues (onTransportEvent / onNotification).
 *    Every transport operation is issued from tick().
 * 2. One outstanding discovery operation at a time; CCCD writes are spaced by
 *    a cooldown window.
 * 3. A busy transport never advances or fails a step; the step is re-armed.
 * 4. All per-connection state lives in one Session struct, reset on every
 *    connect and disconnect.
 * =================================================================================
 */
#pragma once
#include "CubeContext.h"
#include "EventQueues.h"
#include "Types.h"

class ICubeLinkListener {
public:
    virtual ~ICubeLinkListener() {}

    // Notifications are enabled; commands may be queued.
    virtual void onLinkReady(Session& session) = 0;

    // The session ended (disconnect, timeout or aborted discovery).
    virtual void onLinkLost() = 0;

    // Decrypted state-characteristic payload.
    virtual void onFrame(const uint8_t* plaintext, size_t length) = 0;
};

class GattSession : public ITransportEventSink {
public:
    GattSession(ICubeHAL& hal, ICubeTransport& transport, const CubeDefaults& defaults);

    void setListener(ICubeLinkListener* listener) { _listener = listener; }

    // Target peripheral. Returns ERR_INVALID_IDENTITY for an unparseable address.
    CubeError setTarget(const char* address);
    void setTarget(const DeviceIdentity& target);

    // --- Monitoring Control ---
    void start();
    void stop();

    // --- Main Loop Tick ---
    void tick();

    // --- ITransportEventSink ---
    void onTransportEvent(const TransportEvent& event) override;
    void onNotification(uint16_t connHandle, uint16_t valueHandle, const uint8_t* data, size_t length) override;

    // --- Accessors ---
    SessionPhase getPhase() const { return _phase; }
    bool isMonitoring() const { return _monitoring; }
    bool hasTarget() const { return _hasTarget; }
    const DeviceIdentity& getTarget() const { return _target; }
    Session& session() { return _session; }
    const Session& getSession() const { return _session; }

    uint32_t getDroppedNotifications() const { return _notifications.getDropped() + _oversizeFrames; }
    uint32_t getDroppedEvents() const { return _events.getDropped(); }
    uint32_t getCipherErrors() const { return _cipherErrors; }

private:
    ICubeHAL& _hal;
    ICubeTransport& _transport;
    const CubeDefaults& _defaults;
    ICubeLinkListener* _listener;

    // --- Target ---
    bool _hasTarget;
    DeviceIdentity _target;
    bool _monitoring;

    // --- Phase ---
    SessionPhase _phase;
    uint32_t _phaseStartMs;
    uint32_t _nextStepMs;
    bool _stepIssued;
    uint32_t _connectStartMs;

    // Candidate picked from a scan result, used by the connect step
    DeviceIdentity _candidate;
    uint8_t _candidateAddressType;

    Session _session;

    // --- Deferred Work ---
    BoundedQueue<TransportEvent, EVENT_QUEUE_SIZE> _events;
    BoundedQueue<NotificationFrame, NOTIFY_QUEUE_SIZE> _notifications;
    uint32_t _oversizeFrames;
    uint32_t _cipherErrors;

    // --- Internal Logic ---
    void changePhase(SessionPhase next);
    void handleEvent(const TransportEvent& event, uint32_t now);
    void recordCharacteristic(const TransportEvent& event);
    void queueCccd(uint16_t valueHandle);
    bool handlesResolved() const;
    bool isCurrent(uint16_t connHandle) const;

    void stepScanning(uint32_t now);
    void stepConnecting(uint32_t now);
    void stepServiceDiscovery(uint32_t now);
    void stepCharDiscovery(uint32_t now);
    void stepCccdEnable(uint32_t now);
    void stepDisconnected(uint32_t now);
    void drainNotifications();

    void beginSession(const TransportEvent& event, uint32_t now);
    void enterReady(uint32_t now, const char* reason);
    void endSession(const char* reason);
    void abortSession(CubeError reason);
    void resetSession();

    bool matchesTarget(const DeviceIdentity& address) const;
    uint32_t now() { return (uint32_t)_hal.getMillis(); }

    // --- Logging Helper ---
    void logKeyValue(const char* key, const char* value);
};
