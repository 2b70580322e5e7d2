/*
 * File: test/test_command_dispatcher/test_command_dispatcher.cpp
 * Description: Unit tests for CommandDispatcher.
 * Covers write pacing, busy vs. failed retry accounting, queue limits and the
 * move-triggered state poll rate limiter.
 */
#include <unity.h>
#include "CommandDispatcher.h"
#include "CubeCipher.h"
#include "CubeProtocol.h"
#include "MockCubeHAL.h"
#include "MockTransport.h"
#include <string.h>

// --- Constants ---
const CubeDefaults defaults = {
    5,                             // tickIntervalMs
    10000, 100000, 50000, true,    // scan
    5000, 5000, 2000, 100,         // connect, discovery, reconnect, busy re-arm
    200, 1000,                     // CCCD cooldown / confirm
    1500, 3,                       // initial state
    100, 3, 300, 50,               // write cooldown, budget, retry, busy retry
    80, 250,                       // state poll delay / rate limit
    4,                             // notificationsPerTick
    1500                           // longPressDuration
};

#define CONN_HANDLE 1
#define COMMAND_HANDLE 0x0020

static Session makeSession() {
    Session s;
    memset(&s, 0, sizeof(s));
    s.active = true;
    s.connHandle = CONN_HANDLE;
    s.commandHandle = COMMAND_HANDLE;
    CubeCipher::deriveKeys("CF:AA:79:C9:96:9C", s.keys);
    return s;
}

static void decryptWrite(const WrittenFrame &w, const Session &s, uint8_t *plain) {
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(w.data.data(), w.data.size(), s.keys, plain));
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// BASIC WRITES
// ============================================================================

void test_submit_writes_encrypted_command(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    TEST_ASSERT_EQUAL(CUBE_OK, dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session));
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);

    TEST_ASSERT_EQUAL(1, (int)transport.writes.size());
    const WrittenFrame &w = transport.writes[0];
    TEST_ASSERT_EQUAL_UINT16(CONN_HANDLE, w.connHandle);
    TEST_ASSERT_EQUAL_UINT16(COMMAND_HANDLE, w.valueHandle);
    TEST_ASSERT_EQUAL(WRITE_WITH_RESPONSE, w.mode);
    TEST_ASSERT_EQUAL(16, (int)w.data.size());

    uint8_t expected[16];
    uint8_t plain[16];
    CubeProtocol::buildCommand(CMD_REQUEST_STATE, expected);
    decryptWrite(w, session, plain);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, plain, 16);

    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getSentCount());
    TEST_ASSERT_EQUAL(0, (int)dispatcher.getPendingCount());
    TEST_ASSERT_EQUAL_UINT32(hal.currentMillis + 100, session.nextOpAllowedMs);
}

void test_reset_payload_literal(void) {
    uint8_t out[16];
    CubeProtocol::buildCommand(CMD_RESET, out);

    const uint8_t expected[16] = {0x68, 0x05, 0x05, 0x39, 0x77, 0x00, 0x00, 0x01,
                                  0x23, 0x45, 0x67, 0x89, 0xAB, 0x00, 0x00, 0x00};
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, out, 16);

    CubeProtocol::buildCommand(CMD_REQUEST_BATTERY, out);
    TEST_ASSERT_EQUAL_HEX8(0x03, out[0]);
    CubeProtocol::buildCommand(CMD_REQUEST_HARDWARE, out);
    TEST_ASSERT_EQUAL_HEX8(0x01, out[0]);
}

void test_commands_leave_in_submission_order(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    dispatcher.submit(CMD_RESET, hal.currentMillis, session);
    dispatcher.submit(CMD_REQUEST_BATTERY, hal.currentMillis, session);

    dispatcher.tick(hal.currentMillis, session, WRITE_NO_RESPONSE);
    hal.advanceTime(100);
    dispatcher.tick(hal.currentMillis, session, WRITE_NO_RESPONSE);

    TEST_ASSERT_EQUAL(2, (int)transport.writes.size());

    uint8_t plain[16];
    decryptWrite(transport.writes[0], session, plain);
    TEST_ASSERT_EQUAL_HEX8(0x68, plain[0]);
    decryptWrite(transport.writes[1], session, plain);
    TEST_ASSERT_EQUAL_HEX8(0x03, plain[0]);
    TEST_ASSERT_EQUAL(WRITE_NO_RESPONSE, transport.writes[1].mode);
}

void test_cooldown_gate_spaces_writes(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session);
    dispatcher.submit(CMD_REQUEST_BATTERY, hal.currentMillis, session);

    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.attemptedWrites.size());

    hal.advanceTime(99);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.attemptedWrites.size());

    hal.advanceTime(1);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(2, (int)transport.attemptedWrites.size());
}

void test_submit_respects_session_gate(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();
    session.nextOpAllowedMs = hal.currentMillis + 500;

    dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session);

    hal.advanceTime(400);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(0, (int)transport.attemptedWrites.size());

    hal.advanceTime(100);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.writes.size());
}

void test_no_write_without_command_handle(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();
    session.commandHandle = 0;

    dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(0, (int)transport.attemptedWrites.size());

    session.commandHandle = COMMAND_HANDLE;
    session.active = false;
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(0, (int)transport.attemptedWrites.size());
    TEST_ASSERT_EQUAL(1, (int)dispatcher.getPendingCount());
}

// ============================================================================
// RETRY ACCOUNTING
// ============================================================================

void test_busy_does_not_consume_attempts(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    for (int i = 0; i < 5; i++) transport.writeResults.push_back(TRANSPORT_BUSY);

    dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session);
    for (int i = 0; i < 6; i++) {
        dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
        hal.advanceTime(50);
    }

    TEST_ASSERT_EQUAL(6, (int)transport.attemptedWrites.size());
    TEST_ASSERT_EQUAL(1, (int)transport.writes.size());
    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getSentCount());
    TEST_ASSERT_EQUAL_UINT32(0, dispatcher.getDroppedCount());
}

void test_busy_rearms_after_short_interval(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    transport.writeResults.push_back(TRANSPORT_BUSY);
    dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session);

    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    hal.advanceTime(49);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.attemptedWrites.size());

    hal.advanceTime(1);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(2, (int)transport.attemptedWrites.size());
    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getSentCount());
}

void test_failures_exhaust_budget(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    for (int i = 0; i < 3; i++) transport.writeResults.push_back(TRANSPORT_FAILED);

    dispatcher.submit(CMD_RESET, hal.currentMillis, session);

    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.attemptedWrites.size());

    // Not before the retry interval
    hal.advanceTime(100);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.attemptedWrites.size());

    hal.advanceTime(200);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(2, (int)transport.attemptedWrites.size());

    hal.advanceTime(300);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(3, (int)transport.attemptedWrites.size());

    TEST_ASSERT_EQUAL(0, (int)dispatcher.getPendingCount());
    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getDroppedCount());
    TEST_ASSERT_EQUAL_UINT32(0, dispatcher.getSentCount());
    TEST_ASSERT_TRUE(hal.hasLogContaining("dropped after 3 attempts"));

    // Nothing left to retry
    hal.advanceTime(1000);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(3, (int)transport.attemptedWrites.size());
}

void test_failure_then_success(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    transport.writeResults.push_back(TRANSPORT_FAILED);
    dispatcher.submit(CMD_REQUEST_HARDWARE, hal.currentMillis, session);

    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    hal.advanceTime(300);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);

    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getSentCount());
    TEST_ASSERT_EQUAL_UINT32(0, dispatcher.getDroppedCount());
}

// ============================================================================
// QUEUE LIMITS
// ============================================================================

void test_invalid_payload_length_rejected(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    uint8_t payload[32] = {0};
    TEST_ASSERT_EQUAL(ERR_INVALID_LENGTH, dispatcher.submitPayload(CMD_RESET, payload, 20, hal.currentMillis, session));
    TEST_ASSERT_EQUAL(0, (int)dispatcher.getPendingCount());

    TEST_ASSERT_EQUAL(CUBE_OK, dispatcher.submitPayload(CMD_RESET, payload, 32, hal.currentMillis, session));
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(32, (int)transport.writes[0].data.size());
}

void test_queue_full_reports_busy(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    for (int i = 0; i < COMMAND_QUEUE_SIZE; i++) {
        TEST_ASSERT_EQUAL(CUBE_OK, dispatcher.submit(CMD_REQUEST_BATTERY, hal.currentMillis, session));
    }
    TEST_ASSERT_EQUAL(ERR_TRANSPORT_BUSY, dispatcher.submit(CMD_REQUEST_BATTERY, hal.currentMillis, session));
    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.getDroppedCount());
}

void test_clear_discards_pending(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    dispatcher.submit(CMD_RESET, hal.currentMillis, session);
    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));
    dispatcher.clear();

    TEST_ASSERT_EQUAL(0, (int)dispatcher.getPendingCount());
    TEST_ASSERT_FALSE(dispatcher.hasPending(CMD_REQUEST_STATE));

    // Poll gate is gone too
    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));
}

// ============================================================================
// STATE POLL RATE LIMITER
// ============================================================================

void test_state_poll_is_delayed(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));

    hal.advanceTime(79);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(0, (int)transport.attemptedWrites.size());

    hal.advanceTime(1);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.writes.size());
}

void test_state_poll_coalesces_while_pending(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));
    TEST_ASSERT_FALSE(dispatcher.requestStatePoll(hal.currentMillis, session));
    TEST_ASSERT_EQUAL(1, (int)dispatcher.getPendingCount());
}

void test_state_poll_rate_limited(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    uint32_t first = hal.currentMillis;
    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(first, session));

    hal.advanceTime(80);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(1, (int)transport.writes.size());

    // Sent, but still inside the rate window
    TEST_ASSERT_FALSE(dispatcher.requestStatePoll(hal.currentMillis, session));

    hal.currentMillis = first + 249;
    TEST_ASSERT_FALSE(dispatcher.requestStatePoll(hal.currentMillis, session));

    hal.currentMillis = first + 250;
    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));
}

void test_explicit_state_request_bypasses_rate_limit(void) {
    MockCubeHAL hal;
    MockTransport transport;
    CommandDispatcher dispatcher(hal, transport, defaults);
    Session session = makeSession();

    TEST_ASSERT_TRUE(dispatcher.requestStatePoll(hal.currentMillis, session));
    hal.advanceTime(80);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);

    TEST_ASSERT_EQUAL(CUBE_OK, dispatcher.submit(CMD_REQUEST_STATE, hal.currentMillis, session));
    hal.advanceTime(100);
    dispatcher.tick(hal.currentMillis, session, WRITE_WITH_RESPONSE);
    TEST_ASSERT_EQUAL(2, (int)transport.writes.size());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_submit_writes_encrypted_command);
    RUN_TEST(test_reset_payload_literal);
    RUN_TEST(test_commands_leave_in_submission_order);
    RUN_TEST(test_cooldown_gate_spaces_writes);
    RUN_TEST(test_submit_respects_session_gate);
    RUN_TEST(test_no_write_without_command_handle);

    RUN_TEST(test_busy_does_not_consume_attempts);
    RUN_TEST(test_busy_rearms_after_short_interval);
    RUN_TEST(test_failures_exhaust_budget);
    RUN_TEST(test_failure_then_success);

    RUN_TEST(test_invalid_payload_length_rejected);
    RUN_TEST(test_queue_full_reports_busy);
    RUN_TEST(test_clear_discards_pending);

    RUN_TEST(test_state_poll_is_delayed);
    RUN_TEST(test_state_poll_coalesces_while_pending);
    RUN_TEST(test_state_poll_rate_limited);
    RUN_TEST(test_explicit_state_request_bypasses_rate_limit);

    return UNITY_END();
}
