#pragma once
#include <ArduinoJson.h>
#include <string.h>
#include <string>
#include "Types.h"

class ConfigValidators {
public:
    // Checks that the address normalizes to a 6-byte hardware address
    // (colon/hyphen separated or bare hex) or a 32-hex-digit identifier.
    static bool validateCubeAddress(const char* address, std::string& errorMsg);

    // Parses "HH:MM" (24h clock).
    static bool parseClockTime(const char* text, uint8_t& hour, uint8_t& minute, std::string& errorMsg);

    // Applies a JSON settings update on top of 'settings'.
    // Recognised keys: address, writeMode, alarm ("HH:MM" | "off"), ringOnScramble.
    // On failure 'settings' is left untouched and errorMsg explains why.
    static bool parseSettingsUpdate(const JsonVariant& json, CubeSettings& settings, std::string& errorMsg);
};
