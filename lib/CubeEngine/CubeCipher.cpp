/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      lib/CubeEngine/CubeCipher.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Key derivation and windowed AES-128-CBC framing (mbedTLS).
 * =================================================================================
 */
#include "CubeCipher.h"
#include <ctype.h>
#include <stdio.h>
#include <string.h>
#include <mbedtls/aes.h>

// =================================================================================
// SECTION: BASE CONSTANTS
// =================================================================================

static const uint8_t BASE_KEY[CIPHER_BLOCK_SIZE] = {0x01, 0x02, 0x42, 0x28, 0x31, 0x91, 0x16, 0x07,
                                                    0x20, 0x05, 0x18, 0x54, 0x42, 0x11, 0x12, 0x53};

static const uint8_t BASE_IV[CIPHER_BLOCK_SIZE] = {0x11, 0x03, 0x32, 0x28, 0x21, 0x01, 0x76, 0x27,
                                                   0x20, 0x95, 0x78, 0x14, 0x32, 0x12, 0x02, 0x43};

static int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = (char)toupper((unsigned char)c);
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// =================================================================================
// SECTION: ADDRESS HANDLING
// =================================================================================

CubeError CubeCipher::parseAddress(const char *text, DeviceIdentity &out) {
  if (text == nullptr) return ERR_INVALID_IDENTITY;

  // Collect nibbles, skipping separators
  uint8_t raw[16];
  size_t nibbles = 0;

  for (const char *p = text; *p != '\0'; p++) {
    if (*p == ':' || *p == '-') continue;

    int v = hexNibble(*p);
    if (v < 0 || nibbles >= 32) return ERR_INVALID_IDENTITY;

    if (nibbles % 2 == 0) {
      raw[nibbles / 2] = (uint8_t)(v << 4);
    } else {
      raw[nibbles / 2] |= (uint8_t)v;
    }
    nibbles++;
  }

  // 6-byte hardware address or 16-byte identifier
  if (nibbles != 12 && nibbles != 32) return ERR_INVALID_IDENTITY;

  memcpy(out.bytes, raw, CUBE_ADDRESS_LENGTH);
  return CUBE_OK;
}

void CubeCipher::formatAddress(const DeviceIdentity &identity, char *buffer, size_t size) {
  snprintf(buffer, size, "%02X:%02X:%02X:%02X:%02X:%02X", identity.bytes[0], identity.bytes[1], identity.bytes[2],
           identity.bytes[3], identity.bytes[4], identity.bytes[5]);
}

// =================================================================================
// SECTION: KEY DERIVATION
// =================================================================================

void CubeCipher::deriveKeys(const DeviceIdentity &identity, SessionKeys &out) {
  memcpy(out.key, BASE_KEY, CIPHER_BLOCK_SIZE);
  memcpy(out.iv, BASE_IV, CIPHER_BLOCK_SIZE);

  // Salt is the address least-significant byte first
  for (int i = 0; i < CUBE_ADDRESS_LENGTH; i++) {
    uint8_t salt = identity.bytes[CUBE_ADDRESS_LENGTH - 1 - i];
    out.key[i] = (uint8_t)((BASE_KEY[i] + salt) % 255);
    out.iv[i] = (uint8_t)((BASE_IV[i] + salt) % 255);
  }
}

CubeError CubeCipher::deriveKeys(const char *address, SessionKeys &out) {
  DeviceIdentity identity;
  CubeError err = parseAddress(address, identity);
  if (err != CUBE_OK) return err;

  deriveKeys(identity, out);
  return CUBE_OK;
}

// =================================================================================
// SECTION: FRAMING
// =================================================================================

bool CubeCipher::cryptWindow(bool encrypt, const SessionKeys &keys, const uint8_t *input, uint8_t *output) {
  uint8_t iv[CIPHER_BLOCK_SIZE];
  memcpy(iv, keys.iv, CIPHER_BLOCK_SIZE);

  mbedtls_aes_context ctx;
  mbedtls_aes_init(&ctx);

  int rc = encrypt ? mbedtls_aes_setkey_enc(&ctx, keys.key, 128) : mbedtls_aes_setkey_dec(&ctx, keys.key, 128);
  if (rc == 0) {
    rc = mbedtls_aes_crypt_cbc(&ctx, encrypt ? MBEDTLS_AES_ENCRYPT : MBEDTLS_AES_DECRYPT, CIPHER_BLOCK_SIZE, iv, input, output);
  }

  mbedtls_aes_free(&ctx);
  return rc == 0;
}

CubeError CubeCipher::checkLength(size_t length) {
  if (length < CIPHER_BLOCK_SIZE) return ERR_SHORT_FRAME;
  if (length > MAX_FRAME_LENGTH) return ERR_INVALID_LENGTH;
  return CUBE_OK;
}

CubeError CubeCipher::decryptWithOrder(const uint8_t *in, size_t length, const SessionKeys &keys, ChunkOrder order, uint8_t *out) {
  CubeError err = checkLength(length);
  if (err != CUBE_OK) return err;

  if (length == CIPHER_BLOCK_SIZE) {
    return cryptWindow(false, keys, in, out) ? CUBE_OK : ERR_CIPHER_FAILURE;
  }

  // Both windows are read from the received ciphertext
  uint8_t leading[CIPHER_BLOCK_SIZE];
  uint8_t trailing[CIPHER_BLOCK_SIZE];
  size_t trailingOffset = length - CIPHER_BLOCK_SIZE;

  if (!cryptWindow(false, keys, in + trailingOffset, trailing) || !cryptWindow(false, keys, in, leading)) {
    return ERR_CIPHER_FAILURE;
  }

  // Below 32 bytes the window written last owns the overlap
  if (order == ORDER_TRAILING_FIRST) {
    memcpy(out + trailingOffset, trailing, CIPHER_BLOCK_SIZE);
    memcpy(out, leading, CIPHER_BLOCK_SIZE);
  } else {
    memcpy(out, leading, CIPHER_BLOCK_SIZE);
    memcpy(out + trailingOffset, trailing, CIPHER_BLOCK_SIZE);
  }
  return CUBE_OK;
}

CubeError CubeCipher::decrypt(const uint8_t *in, size_t length, const SessionKeys &keys, uint8_t *out) {
  CubeError err = decryptWithOrder(in, length, keys, ORDER_TRAILING_FIRST, out);
  if (err != CUBE_OK) return err;

  if (out[0] == FRAME_MARKER || length == CIPHER_BLOCK_SIZE) return CUBE_OK;

  uint8_t alternate[MAX_FRAME_LENGTH];
  err = decryptWithOrder(in, length, keys, ORDER_LEADING_FIRST, alternate);
  if (err == CUBE_OK && alternate[0] == FRAME_MARKER) {
    memcpy(out, alternate, length);
  }

  // Neither ordering produced the marker: keep the first attempt
  return CUBE_OK;
}

CubeError CubeCipher::encrypt(const uint8_t *in, size_t length, const SessionKeys &keys, uint8_t *out) {
  if (length != CIPHER_BLOCK_SIZE && length != 2 * CIPHER_BLOCK_SIZE) return ERR_INVALID_LENGTH;

  for (size_t offset = 0; offset < length; offset += CIPHER_BLOCK_SIZE) {
    if (!cryptWindow(true, keys, in + offset, out + offset)) return ERR_CIPHER_FAILURE;
  }
  return CUBE_OK;
}
