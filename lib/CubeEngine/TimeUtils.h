/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/TimeUtils.h
 *
 * Description:
 * Static utility class for millisecond timestamps.
 * All comparisons are wraparound-safe: the 32-bit millis() counter rolls over
 * after ~49.7 days and deadlines straddling the rollover must still work.
 * Also formats durations (e.g., "1h 5s 250ms") for logging.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

class TimeUtils {
public:
    // True once 'now' has reached or passed 'deadline'.
    static bool isDue(uint32_t now, uint32_t deadline) {
        return (int32_t)(now - deadline) >= 0;
    }

    // True if at least 'interval' ms have passed since 'since'.
    static bool hasElapsed(uint32_t now, uint32_t since, uint32_t interval) {
        return (uint32_t)(now - since) >= interval;
    }

    static uint32_t elapsed(uint32_t now, uint32_t since) {
        return now - since;
    }

    // The later of two timestamps.
    static uint32_t latest(uint32_t a, uint32_t b) {
        return isDue(a, b) ? a : b;
    }

    /**
     * Formats milliseconds into a human-readable string (e.g., "2h 3min 4s 5ms").
     * Units with 0 values are omitted unless the total is 0ms.
     * @param totalMs The duration in milliseconds.
     * @param buffer  The destination buffer.
     * @param size    The size of the buffer.
     */
    static void formatMillis(uint32_t totalMs, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalMs == 0) {
            snprintf(buffer, size, "0ms");
            return;
        }

        const uint32_t MS_SEC  = 1000;
        const uint32_t MS_MIN  = 60000;
        const uint32_t MS_HOUR = 3600000;
        const uint32_t MS_DAY  = 86400000;

        uint32_t rem = totalMs;

        uint32_t d = rem / MS_DAY;
        rem %= MS_DAY;

        uint32_t h = rem / MS_HOUR;
        rem %= MS_HOUR;

        uint32_t m = rem / MS_MIN;
        rem %= MS_MIN;

        uint32_t s = rem / MS_SEC;
        uint32_t ms = rem % MS_SEC;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](uint32_t val, const char *suffix) {
            if (val > 0 && offset < size) {
                int written = snprintf(buffer + offset, size - offset, "%lu%s ", (unsigned long)val, suffix);
                if (written > 0) offset += (size_t)written;
            }
        };

        append(d, "d");
        append(h, "h");
        append(m, "min");
        append(s, "s");
        append(ms, "ms");

        // Trim trailing space
        if (offset > size - 1) offset = size - 1;
        if (offset > 0 && buffer[offset - 1] == ' ') {
            buffer[offset - 1] = '\0';
        }
    }
};
