#include "crypto/CredentialStore.hpp"
#include "crypto/model/EncryptedSecret.hpp"
#include "crypto/util/encrypt.hpp"
#include "crypto/util/hash.hpp"
#include "settings/Settings.hpp"
#include "settings/Store.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace cfi::crypto::util;
using namespace cfi::crypto::model;

namespace cfi::crypto {

CredentialStore::CredentialStore(const config::SecretsConfig& secrets)
    : key_(deriveKey(secrets)) {}

std::vector<uint8_t> CredentialStore::deriveKey(const config::SecretsConfig& secrets) {
    std::string material;
    for (const auto& k : secrets.keys) material += k;

    if (secrets.keys.empty()) {
        if (secrets.fallback_salt.empty())
            log::Registry::crypto()->warn("[CredentialStore] No deployment secrets or fallback salt configured; "
                                          "stored credentials are only obscured");
        material = secrets.fallback_salt;
    }

    return hash::sha256(material);
}

std::optional<std::string> CredentialStore::encrypt(const std::string& plaintext) const {
    if (plaintext.empty()) return std::nullopt;

    try {
        EncryptedSecret secret;
        const std::vector<uint8_t> bytes(plaintext.begin(), plaintext.end());
        secret.value = encrypt_aes256_cbc(bytes, key_, secret.iv);
        return secret.serialize();
    } catch (const std::exception& e) {
        log::Registry::crypto()->warn("[CredentialStore] Encryption failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> CredentialStore::decrypt(const std::string& payload) const {
    if (payload.empty()) return std::nullopt;

    const auto secret = EncryptedSecret::parse(payload);
    if (!secret) {
        log::Registry::crypto()->warn("[CredentialStore] Rejected malformed ciphertext payload");
        return std::nullopt;
    }

    try {
        const auto bytes = decrypt_aes256_cbc(secret->value, key_, secret->iv);
        return std::string(bytes.begin(), bytes.end());
    } catch (const std::exception& e) {
        log::Registry::crypto()->warn("[CredentialStore] Decryption failed: {}", e.what());
        return std::nullopt;
    }
}

settings::Settings CredentialStore::migrateLegacy(settings::Settings settings, settings::Store& store) const {
    bool updated = false;

    const auto migrate = [&](std::optional<std::string>& plaintext, std::optional<std::string>& ciphertext,
                             const char* name) {
        if (!plaintext) return;
        if (!plaintext->empty()) {
            if (auto enc = encrypt(*plaintext)) {
                ciphertext = std::move(*enc);
                settings.credentials_stored = true;
                updated = true;
                log::Registry::settings()->info("[CredentialStore] Migrated legacy plaintext field {}", name);
            }
        }
        plaintext.reset();
    };

    migrate(settings.legacy_access_key, settings.access_key_enc, settings::field::ACCESS_KEY);
    migrate(settings.legacy_secret_key, settings.secret_key_enc, settings::field::SECRET_KEY);

    if (updated && !store.save(settings))
        log::Registry::settings()->error("[CredentialStore] Failed to persist migrated credentials");

    return settings;
}

}
