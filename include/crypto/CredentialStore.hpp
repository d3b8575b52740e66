#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cfi::settings {
struct Settings;
class Store;
}

namespace cfi::crypto {

// Symmetric protection for stored API secrets. The 256-bit key is the SHA-256
// digest of the configured deployment secrets concatenated in order, or of
// the fallback salt when no secrets are configured.
class CredentialStore {
public:
    explicit CredentialStore(const config::SecretsConfig& secrets);

    // nullopt for an empty plaintext or a cipher failure. Each call draws a
    // fresh IV, so equal plaintexts never produce equal payloads.
    [[nodiscard]] std::optional<std::string> encrypt(const std::string& plaintext) const;

    // nullopt for empty input, an unparseable payload, bad base64, a wrong
    // key or corrupted data. Callers cannot tell these apart.
    [[nodiscard]] std::optional<std::string> decrypt(const std::string& payload) const;

    // Moves plaintext aws_access_key / aws_secret_key into their ciphertext
    // fields and drops the plaintext. Saves through the store when anything
    // was migrated.
    settings::Settings migrateLegacy(settings::Settings settings, settings::Store& store) const;

    static std::vector<uint8_t> deriveKey(const config::SecretsConfig& secrets);

private:
    std::vector<uint8_t> key_;
};

}
