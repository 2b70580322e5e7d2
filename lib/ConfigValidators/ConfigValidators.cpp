#include "ConfigValidators.h"
#include "CubeCipher.h"

bool ConfigValidators::validateCubeAddress(const char* address, std::string& errorMsg) {
    if (!address || strlen(address) == 0) {
        errorMsg = "Address cannot be empty.";
        return false;
    }
    if (strlen(address) >= CUBE_ADDRESS_TEXT_LENGTH) {
        errorMsg = "Address too long.";
        return false;
    }

    DeviceIdentity identity;
    if (CubeCipher::parseAddress(address, identity) != CUBE_OK) {
        errorMsg = "Invalid address: " + std::string(address);
        return false;
    }
    return true;
}

bool ConfigValidators::parseClockTime(const char* text, uint8_t& hour, uint8_t& minute, std::string& errorMsg) {
    if (!text || strlen(text) != 5 || text[2] != ':') {
        errorMsg = "Time must be HH:MM.";
        return false;
    }

    int digits[4] = {text[0], text[1], text[3], text[4]};
    for (int i = 0; i < 4; i++) {
        if (digits[i] < '0' || digits[i] > '9') {
            errorMsg = "Time must be HH:MM.";
            return false;
        }
        digits[i] -= '0';
    }

    int h = digits[0] * 10 + digits[1];
    int m = digits[2] * 10 + digits[3];
    if (h > 23 || m > 59) {
        errorMsg = "Time out of range: " + std::string(text);
        return false;
    }

    hour = (uint8_t)h;
    minute = (uint8_t)m;
    return true;
}

bool ConfigValidators::parseSettingsUpdate(const JsonVariant& json, CubeSettings& settings, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Expected a JSON object.";
        return false;
    }

    // Work on a copy, commit only if everything validates
    CubeSettings updated = settings;
    JsonObjectConst obj = json.as<JsonObjectConst>();

    for (JsonPairConst kv : obj) {
        std::string key = kv.key().c_str();
        JsonVariantConst value = kv.value();

        // 1. Target Cube
        if (key == "address") {
            if (!value.is<const char*>()) {
                errorMsg = "address must be a string.";
                return false;
            }
            const char* address = value.as<const char*>();
            if (!validateCubeAddress(address, errorMsg)) return false;
            strncpy(updated.targetAddress, address, CUBE_ADDRESS_TEXT_LENGTH - 1);
            updated.targetAddress[CUBE_ADDRESS_TEXT_LENGTH - 1] = '\0';
        }
        // 2. Write Mode
        else if (key == "writeMode") {
            std::string mode = value | "";
            if (mode == "ack") updated.writeMode = WRITE_WITH_RESPONSE;
            else if (mode == "no-ack") updated.writeMode = WRITE_NO_RESPONSE;
            else {
                errorMsg = "Invalid writeMode: " + mode;
                return false;
            }
        }
        // 3. Alarm Time
        else if (key == "alarm") {
            if (!value.is<const char*>()) {
                errorMsg = "alarm must be \"HH:MM\" or \"off\".";
                return false;
            }
            const char* text = value.as<const char*>();
            if (strcmp(text, "off") == 0) {
                updated.alarmEnabled = false;
            } else {
                if (!parseClockTime(text, updated.alarmHour, updated.alarmMinute, errorMsg)) return false;
                updated.alarmEnabled = true;
            }
        }
        // 4. Booleans
        else if (key == "ringOnScramble") {
            if (!value.is<bool>()) {
                errorMsg = "ringOnScramble must be true or false.";
                return false;
            }
            updated.ringOnScramble = value.as<bool>();
        }
        else {
            errorMsg = "Unknown setting: " + key;
            return false;
        }
    }

    settings = updated;
    return true;
}
