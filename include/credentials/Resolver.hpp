#pragma once

#include "config/Config.hpp"
#include "settings/Settings.hpp"

#include <optional>
#include <string>

namespace cfi::crypto { class CredentialStore; }

namespace cfi::credentials {

class Environment;

struct ResolvedCredentials {
    std::string access_key;
    std::string secret_key;
};

// Resolves the effective access/secret key pair against one settings snapshot.
// Lookup order per value: deployment constant, environment variable, then the
// decrypted ciphertext field. Empty values at any tier fall through.
class Resolver {
public:
    Resolver(settings::Settings settings,
             const crypto::CredentialStore& store,
             const Environment& env,
             config::CredentialsConfig names = {});

    [[nodiscard]] std::optional<std::string> resolveValue(const std::string& overrideName,
                                                          const std::string& envName,
                                                          const std::optional<std::string>& ciphertext) const;

    // Both halves or nothing.
    [[nodiscard]] std::optional<ResolvedCredentials> resolveCredentials() const;
    [[nodiscard]] bool hasCredentials() const;

    [[nodiscard]] bool isAmbientMode() const;

    [[nodiscard]] std::string region() const;
    [[nodiscard]] std::string distributionId() const;

    [[nodiscard]] const settings::Settings& settings() const { return settings_; }

private:
    settings::Settings settings_;
    const crypto::CredentialStore& store_;
    const Environment& env_;
    config::CredentialsConfig names_;
};

}
