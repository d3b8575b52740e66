#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <cstring>

namespace cfi::crypto::util {

namespace {
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx make_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    return ctx;
}
}

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::vector<uint8_t> random_bytes(const size_t n) {
    ensure_sodium_init();
    std::vector<uint8_t> buf(n);
    randombytes_buf(buf.data(), buf.size());
    return buf;
}

std::vector<uint8_t> encrypt_aes256_cbc(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv)
{
    if (key.size() != AES_KEY_SIZE) {
        log::Registry::crypto()->error("[encrypt_aes256_cbc] Invalid AES-256 key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid AES-256 key size");
    }

    out_iv = random_bytes(AES_IV_SIZE);

    const auto ctx = make_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), out_iv.data()) != 1)
        throw std::runtime_error("AES-256-CBC encrypt init failed");

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_BLOCK_SIZE);
    int len = 0, total = 0;

    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
        throw std::runtime_error("AES-256-CBC encrypt update failed");
    total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1)
        throw std::runtime_error("AES-256-CBC encrypt final failed");
    total += len;

    ciphertext.resize(static_cast<size_t>(total));
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_cbc(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE)
        throw std::invalid_argument("Invalid key or IV size");

    if (ciphertext.empty() || ciphertext.size() % AES_BLOCK_SIZE != 0)
        throw std::runtime_error("Ciphertext is not a whole number of blocks");

    const auto ctx = make_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1)
        throw std::runtime_error("AES-256-CBC decrypt init failed");

    std::vector<uint8_t> plaintext(ciphertext.size() + AES_BLOCK_SIZE);
    int len = 0, total = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1)
        throw std::runtime_error("AES-256-CBC decrypt update failed");
    total = len;

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1)
        throw std::runtime_error("Decryption failed: bad padding");
    total += len;

    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    ensure_sodium_init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0
        || end != b64.c_str() + b64.size())
    {
        throw std::runtime_error("Invalid base64 input");
    }
    decoded.resize(out_len);
    return decoded;
}

}
