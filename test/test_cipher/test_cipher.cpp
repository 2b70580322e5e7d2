/*
 * File: test/test_cipher/test_cipher.cpp
 * Description: Unit tests for CubeCipher.
 * Covers address parsing, key derivation against the reference vector,
 * windowed decryption (including the overlapping 19-byte facelets frame) and
 * the command encryption length rules.
 */
#include <unity.h>
#include "CubeCipher.h"
#include "CubeStateDecoder.h"
#include "TestFrames.h"
#include <string.h>

static const char *REFERENCE_ADDRESS = "CF:AA:79:C9:96:9C";

static const uint8_t EXPECTED_KEY[16] = {157, 152, 12, 161, 219, 97, 22, 7, 32, 5, 24, 84, 66, 17, 18, 83};
static const uint8_t EXPECTED_IV[16] = {173, 153, 251, 161, 203, 208, 118, 39, 32, 149, 120, 20, 50, 18, 2, 67};

// 32-byte frame, checked against an independent AES implementation
static const uint8_t CIPHER_32[32] = {18,  52,  86,  120, 154, 188, 222, 240, 17,  34, 51, 68,  85,  102, 119, 136,
                                      170, 187, 204, 221, 238, 255, 0,   17,  34,  51, 68, 85,  102, 119, 136, 153};
static const uint8_t PLAIN_32[32] = {236, 40, 65, 189, 44, 43, 238, 8,   25, 9,  55, 127, 4,   86,  1,   236,
                                     150, 79, 106, 234, 85, 157, 183, 95, 44, 43, 26, 77,  132, 103, 166, 105};

// Solved 19-byte facelets frame as sent by the cube. Each window was decrypted
// from these bytes independently, trailing first, by an independent AES tool.
static const uint8_t SOLVED_CIPHER_19[19] = {70, 82, 146, 101, 15, 242, 97, 41, 131, 195,
                                             124, 200, 8, 205, 163, 117, 0, 1, 54};
static const uint8_t SOLVED_PLAIN_19[19] = {85, 2, 0, 0, 0, 5, 57, 112, 0, 0, 9, 26, 43, 60, 77, 0, 0, 28, 127};

// Same frame with the trailing window written last
static const uint8_t SOLVED_PLAIN_19_LEADING[19] = {85, 2,   0,  174, 233, 149, 108, 142, 82, 121,
                                                    222, 38, 93, 61,  57,  246, 0,   28,  127};

static SessionKeys referenceKeys() {
    SessionKeys keys;
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::deriveKeys(REFERENCE_ADDRESS, keys));
    return keys;
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// ADDRESS PARSING
// ============================================================================

void test_parse_colon_address(void) {
    DeviceIdentity id;
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::parseAddress(REFERENCE_ADDRESS, id));

    const uint8_t expected[6] = {0xCF, 0xAA, 0x79, 0xC9, 0x96, 0x9C};
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, id.bytes, 6);
}

void test_parse_accepts_hyphens_and_lowercase(void) {
    DeviceIdentity a, b;
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::parseAddress("cf-aa-79-c9-96-9c", a));
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::parseAddress("CFAA79C9969C", b));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(a.bytes, b.bytes, 6);
}

void test_parse_long_identifier_uses_first_six_bytes(void) {
    DeviceIdentity id;
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::parseAddress("CFAA79C9-969C-0000-0000-000000000000", id));

    const uint8_t expected[6] = {0xCF, 0xAA, 0x79, 0xC9, 0x96, 0x9C};
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, id.bytes, 6);
}

void test_parse_rejects_bad_input(void) {
    DeviceIdentity id;
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::parseAddress(nullptr, id));
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::parseAddress("", id));
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::parseAddress("CF:AA:79:C9:96", id));
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::parseAddress("CF:AA:79:C9:96:9G", id));
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::parseAddress("CF AA 79 C9 96 9C", id));
}

void test_format_address(void) {
    DeviceIdentity id;
    CubeCipher::parseAddress("cf-aa-79-c9-96-9c", id);

    char buf[24];
    CubeCipher::formatAddress(id, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING(REFERENCE_ADDRESS, buf);
}

// ============================================================================
// KEY DERIVATION
// ============================================================================

void test_derive_keys_reference_vector(void) {
    SessionKeys keys = referenceKeys();
    TEST_ASSERT_EQUAL_UINT8_ARRAY(EXPECTED_KEY, keys.key, 16);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(EXPECTED_IV, keys.iv, 16);
}

void test_derive_keys_is_deterministic(void) {
    SessionKeys a = referenceKeys();
    SessionKeys b = referenceKeys();
    TEST_ASSERT_EQUAL_UINT8_ARRAY(a.key, b.key, 16);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(a.iv, b.iv, 16);
}

void test_derive_keys_rejects_invalid_address(void) {
    SessionKeys keys;
    TEST_ASSERT_EQUAL(ERR_INVALID_IDENTITY, CubeCipher::deriveKeys("not-an-address", keys));
}

void test_derive_keys_only_salts_first_six_bytes(void) {
    SessionKeys a, b;
    CubeCipher::deriveKeys("00:00:00:00:00:01", a);
    CubeCipher::deriveKeys("00:00:00:00:00:02", b);

    // Last address byte salts key[0]
    TEST_ASSERT_EQUAL_UINT8(0x02, a.key[0]);
    TEST_ASSERT_EQUAL_UINT8(0x03, b.key[0]);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(a.key + 6, b.key + 6, 10);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(a.iv + 6, b.iv + 6, 10);
}

// ============================================================================
// DECRYPTION
// ============================================================================

void test_decrypt_32_byte_reference(void) {
    SessionKeys keys = referenceKeys();
    uint8_t out[32];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(CIPHER_32, 32, keys, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(PLAIN_32, out, 32);
}

void test_decrypt_single_block(void) {
    SessionKeys keys = referenceKeys();
    uint8_t out[16];

    // Each window restarts the IV, so the first block decrypts on its own
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(CIPHER_32, 16, keys, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(PLAIN_32, out, 16);
}

void test_decrypt_rejects_short_frame(void) {
    SessionKeys keys = referenceKeys();
    uint8_t out[32];
    TEST_ASSERT_EQUAL(ERR_SHORT_FRAME, CubeCipher::decrypt(CIPHER_32, 15, keys, out));
    TEST_ASSERT_EQUAL(ERR_SHORT_FRAME, CubeCipher::decrypt(CIPHER_32, 0, keys, out));
}

void test_decrypt_rejects_oversize_frame(void) {
    SessionKeys keys = referenceKeys();
    uint8_t in[40] = {0};
    uint8_t out[40];
    TEST_ASSERT_EQUAL(ERR_INVALID_LENGTH, CubeCipher::decrypt(in, 33, keys, out));
}

void test_decrypt_overlapping_frame_reads_both_windows(void) {
    SessionKeys keys = referenceKeys();
    uint8_t out[19];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(SOLVED_CIPHER_19, 19, keys, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(SOLVED_PLAIN_19, out, 19);

    DecodedFrame frame;
    TEST_ASSERT_EQUAL(CUBE_OK, CubeStateDecoder::decode(out, 19, frame));
    TEST_ASSERT_EQUAL(FRAME_STATE, frame.kind);
    TEST_ASSERT_TRUE(frame.solved);
}

void test_decrypt_in_place_buffer(void) {
    SessionKeys keys = referenceKeys();
    uint8_t buf[19];
    memcpy(buf, SOLVED_CIPHER_19, sizeof(buf));

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(buf, 19, keys, buf));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(SOLVED_PLAIN_19, buf, 19);
}

void test_window_order_only_changes_the_overlap(void) {
    SessionKeys keys = referenceKeys();
    uint8_t out[19];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decryptWithOrder(SOLVED_CIPHER_19, 19, keys, ORDER_LEADING_FIRST, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(SOLVED_PLAIN_19_LEADING, out, 19);

    // Outside the overlap both orders agree
    TEST_ASSERT_EQUAL_UINT8_ARRAY(SOLVED_PLAIN_19, out, 3);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(SOLVED_PLAIN_19 + 16, out + 16, 3);
}

void test_window_order_irrelevant_for_32_bytes(void) {
    SessionKeys keys = referenceKeys();
    uint8_t trailingFirst[32];
    uint8_t leadingFirst[32];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decryptWithOrder(CIPHER_32, 32, keys, ORDER_TRAILING_FIRST, trailingFirst));
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decryptWithOrder(CIPHER_32, 32, keys, ORDER_LEADING_FIRST, leadingFirst));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(PLAIN_32, trailingFirst, 32);
    TEST_ASSERT_EQUAL_UINT8_ARRAY(PLAIN_32, leadingFirst, 32);
}

void test_frame_builder_matches_cube_framing(void) {
    SessionKeys keys = referenceKeys();
    uint8_t plain[20];
    uint8_t cipher[20];
    uint8_t out[20];
    buildSolvedFrame(plain, sizeof(plain));

    TEST_ASSERT_TRUE(encryptTelemetryFrame(plain, sizeof(plain), keys, cipher));
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(cipher, sizeof(cipher), keys, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(plain, out, 17);
}

void test_decrypt_without_marker_keeps_trailing_first(void) {
    SessionKeys keys = referenceKeys();
    uint8_t expected[32];
    uint8_t out[32];

    CubeCipher::decryptWithOrder(CIPHER_32, 32, keys, ORDER_TRAILING_FIRST, expected);
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(CIPHER_32, 32, keys, out));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, out, 32);
}

void test_decrypt_with_wrong_key_does_not_fail(void) {
    SessionKeys keys;
    CubeCipher::deriveKeys("11:22:33:44:55:66", keys);
    uint8_t out[32];

    // Wrong keys give garbage, not an error; the decoder rejects it later
    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(CIPHER_32, 32, keys, out));
    TEST_ASSERT_FALSE(memcmp(PLAIN_32, out, 32) == 0);
}

// ============================================================================
// ENCRYPTION
// ============================================================================

void test_encrypt_inverts_decrypt(void) {
    SessionKeys keys = referenceKeys();
    uint8_t cipher[32];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::encrypt(PLAIN_32, 32, keys, cipher));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(CIPHER_32, cipher, 32);
}

void test_encrypt_single_block_command(void) {
    SessionKeys keys = referenceKeys();
    uint8_t payload[16] = {0x02};
    uint8_t cipher[16];
    uint8_t plain[16];

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::encrypt(payload, 16, keys, cipher));
    TEST_ASSERT_FALSE(memcmp(payload, cipher, 16) == 0);

    TEST_ASSERT_EQUAL(CUBE_OK, CubeCipher::decrypt(cipher, 16, keys, plain));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(payload, plain, 16);
}

void test_encrypt_rejects_other_lengths(void) {
    SessionKeys keys = referenceKeys();
    uint8_t payload[32] = {0};
    uint8_t cipher[32];

    TEST_ASSERT_EQUAL(ERR_INVALID_LENGTH, CubeCipher::encrypt(payload, 20, keys, cipher));
    TEST_ASSERT_EQUAL(ERR_INVALID_LENGTH, CubeCipher::encrypt(payload, 15, keys, cipher));
    TEST_ASSERT_EQUAL(ERR_INVALID_LENGTH, CubeCipher::encrypt(payload, 0, keys, cipher));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_parse_colon_address);
    RUN_TEST(test_parse_accepts_hyphens_and_lowercase);
    RUN_TEST(test_parse_long_identifier_uses_first_six_bytes);
    RUN_TEST(test_parse_rejects_bad_input);
    RUN_TEST(test_format_address);

    RUN_TEST(test_derive_keys_reference_vector);
    RUN_TEST(test_derive_keys_is_deterministic);
    RUN_TEST(test_derive_keys_rejects_invalid_address);
    RUN_TEST(test_derive_keys_only_salts_first_six_bytes);

    RUN_TEST(test_decrypt_32_byte_reference);
    RUN_TEST(test_decrypt_single_block);
    RUN_TEST(test_decrypt_rejects_short_frame);
    RUN_TEST(test_decrypt_rejects_oversize_frame);
    RUN_TEST(test_decrypt_overlapping_frame_reads_both_windows);
    RUN_TEST(test_decrypt_in_place_buffer);
    RUN_TEST(test_window_order_only_changes_the_overlap);
    RUN_TEST(test_window_order_irrelevant_for_32_bytes);
    RUN_TEST(test_frame_builder_matches_cube_framing);
    RUN_TEST(test_decrypt_without_marker_keeps_trailing_first);
    RUN_TEST(test_decrypt_with_wrong_key_does_not_fail);

    RUN_TEST(test_encrypt_inverts_decrypt);
    RUN_TEST(test_encrypt_single_block_command);
    RUN_TEST(test_encrypt_rejects_other_lengths);

    return UNITY_END();
}
