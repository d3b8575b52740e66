#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace cfi::crypto::util {

constexpr size_t AES_KEY_SIZE   = 32;      // 256-bit
constexpr size_t AES_IV_SIZE    = 16;      // CBC block-sized IV
constexpr size_t AES_BLOCK_SIZE = 16;

void ensure_sodium_init();

std::vector<uint8_t> random_bytes(size_t n);

// PKCS#7 padded. Fills out_iv with a fresh random IV on every call.
std::vector<uint8_t> encrypt_aes256_cbc(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv);

// Throws std::runtime_error on a padding or cipher failure.
std::vector<uint8_t> decrypt_aes256_cbc(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

std::string b64_encode(const std::vector<uint8_t>& data);

// Strict: rejects characters outside the standard alphabet and bad padding.
std::vector<uint8_t> b64_decode(const std::string& b64);

}
