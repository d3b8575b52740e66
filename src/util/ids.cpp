#include "util/ids.hpp"
#include "crypto/util/encrypt.hpp"

#include <algorithm>
#include <cctype>

namespace cfi::util {

std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case) {
    if (len == 0) return {};

    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }
    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }

    if (out_case == Case::Lower)
        std::transform(out.begin(), out.end(), out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string random_b32(const size_t length, const Case out_case) {
    if (length == 0) return {};
    const auto bytes = crypto::util::random_bytes((length * 5 + 7) / 8);
    auto out = b32_crockford_encode(bytes.data(), bytes.size(), out_case);
    out.resize(length);
    return out;
}

}
