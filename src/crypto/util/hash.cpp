#include "crypto/util/hash.hpp"

#include <openssl/sha.h>

namespace cfi::crypto::hash {

std::vector<uint8_t> sha256(const std::string& data) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
    return digest;
}

}
