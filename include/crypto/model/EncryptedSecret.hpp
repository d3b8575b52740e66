#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfi::crypto::model {

// Serialized form: {"iv":"<base64>","value":"<base64>"}
struct EncryptedSecret {
    std::vector<uint8_t> iv, value;

    [[nodiscard]] std::string serialize() const;

    // nullopt when the payload is not a JSON object carrying two non-empty,
    // strictly base64-encoded "iv" and "value" strings.
    static std::optional<EncryptedSecret> parse(const std::string& payload);
};

}
