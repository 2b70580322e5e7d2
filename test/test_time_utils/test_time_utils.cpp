/*
 * File: test/test_time_utils/test_time_utils.cpp
 * Description: Unit tests for the static TimeUtils class.
 * Verifies wraparound-safe deadline checks and human-readable formatting of
 * milliseconds into d/h/min/s/ms.
 */

#include <unity.h>
#include "TimeUtils.h"
#include <string.h>

void setUp(void) {}
void tearDown(void) {}

// --- Deadline Tests ---

void test_is_due_basic(void) {
    TEST_ASSERT_FALSE(TimeUtils::isDue(999, 1000));
    TEST_ASSERT_TRUE(TimeUtils::isDue(1000, 1000));
    TEST_ASSERT_TRUE(TimeUtils::isDue(1001, 1000));
}

void test_is_due_across_rollover(void) {
    // Deadline set just before millis() wraps
    uint32_t deadline = 0xFFFFFFF0u + 0x20u; // wraps to 0x10
    TEST_ASSERT_FALSE(TimeUtils::isDue(0xFFFFFFF0u, deadline));
    TEST_ASSERT_FALSE(TimeUtils::isDue(0x0000000Fu, deadline));
    TEST_ASSERT_TRUE(TimeUtils::isDue(0x00000010u, deadline));
}

void test_has_elapsed_across_rollover(void) {
    uint32_t since = 0xFFFFFF00u;
    TEST_ASSERT_FALSE(TimeUtils::hasElapsed(0xFFFFFFFFu, since, 0x200));
    TEST_ASSERT_TRUE(TimeUtils::hasElapsed(0x00000100u, since, 0x200));
    TEST_ASSERT_EQUAL_UINT32(0x200, TimeUtils::elapsed(0x00000100u, since));
}

void test_latest_picks_later_timestamp(void) {
    TEST_ASSERT_EQUAL_UINT32(2000, TimeUtils::latest(1000, 2000));
    TEST_ASSERT_EQUAL_UINT32(2000, TimeUtils::latest(2000, 1000));
    // 0x10 comes after 0xFFFFFFF0 once wrapped
    TEST_ASSERT_EQUAL_UINT32(0x10, TimeUtils::latest(0xFFFFFFF0u, 0x10));
}

// --- Basic Format Tests ---

void test_format_zero(void) {
    char buf[32];
    TimeUtils::formatMillis(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0ms", buf);
}

void test_format_millis_only(void) {
    char buf[32];
    TimeUtils::formatMillis(250, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("250ms", buf);
}

void test_format_seconds_only(void) {
    char buf[32];
    TimeUtils::formatMillis(45000, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("45s", buf);
}

void test_format_minutes_only(void) {
    char buf[32];
    // 2 minutes = 120000ms
    TimeUtils::formatMillis(120000, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2min", buf);
}

// --- Combination & Skipping Tests ---

void test_format_seconds_and_millis(void) {
    char buf[32];
    TimeUtils::formatMillis(1500, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1s 500ms", buf);
}

void test_format_skips_zero_middle_units(void) {
    char buf[64];
    // 1h (3600000) + 5s (5000)
    TimeUtils::formatMillis(3605000, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 5s", buf);
}

void test_format_full_complexity(void) {
    char buf[64];
    uint32_t total =
        86400000 + // 1d
        3600000 +  // 1h
        60000 +    // 1min
        1000 +     // 1s
        1;         // 1ms
    TimeUtils::formatMillis(total, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1d 1h 1min 1s 1ms", buf);
}

// --- Safety Tests ---

void test_buffer_truncation_safety(void) {
    // "1h 5s" needs 6 bytes; only 4 are available.
    char buf[4];
    memset(buf, 'X', sizeof(buf));

    TimeUtils::formatMillis(3605000, buf, sizeof(buf));

    // Ensure null termination is present within bounds
    TEST_ASSERT_EQUAL_INT8('\0', buf[3]);
    // Trailing separator is trimmed even when truncated
    TEST_ASSERT_EQUAL_STRING("1h", buf);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_is_due_basic);
    RUN_TEST(test_is_due_across_rollover);
    RUN_TEST(test_has_elapsed_across_rollover);
    RUN_TEST(test_latest_picks_later_timestamp);

    RUN_TEST(test_format_zero);
    RUN_TEST(test_format_millis_only);
    RUN_TEST(test_format_seconds_only);
    RUN_TEST(test_format_minutes_only);

    RUN_TEST(test_format_seconds_and_millis);
    RUN_TEST(test_format_skips_zero_middle_units);
    RUN_TEST(test_format_full_complexity);

    RUN_TEST(test_buffer_truncation_safety);

    return UNITY_END();
}
