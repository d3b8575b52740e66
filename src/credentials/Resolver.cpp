#include "credentials/Resolver.hpp"
#include "credentials/Environment.hpp"
#include "crypto/CredentialStore.hpp"
#include "log/Registry.hpp"

namespace cfi::credentials {

Resolver::Resolver(settings::Settings settings,
                   const crypto::CredentialStore& store,
                   const Environment& env,
                   config::CredentialsConfig names)
    : settings_(std::move(settings)), store_(store), env_(env), names_(std::move(names)) {}

std::optional<std::string> Resolver::resolveValue(const std::string& overrideName,
                                                  const std::string& envName,
                                                  const std::optional<std::string>& ciphertext) const {
    if (const auto c = env_.constant(overrideName); c && !c->empty()) return c;
    if (const auto v = env_.variable(envName); v && !v->empty()) return v;

    if (!ciphertext || ciphertext->empty()) return std::nullopt;

    auto plaintext = store_.decrypt(*ciphertext);
    if (!plaintext) {
        log::Registry::credentials()->warn("[Resolver] Stored value for {} could not be decrypted; treating as absent",
                                           envName);
        return std::nullopt;
    }
    if (plaintext->empty()) return std::nullopt;
    return plaintext;
}

std::optional<ResolvedCredentials> Resolver::resolveCredentials() const {
    auto access = resolveValue(names_.access_key_name, names_.access_key_name, settings_.access_key_enc);
    auto secret = resolveValue(names_.secret_key_name, names_.secret_key_name, settings_.secret_key_enc);

    if (!access || !secret) {
        if (access || secret)
            log::Registry::credentials()->warn("[Resolver] Only one of access key / secret key resolved; ignoring both");
        return std::nullopt;
    }

    return ResolvedCredentials{std::move(*access), std::move(*secret)};
}

bool Resolver::hasCredentials() const {
    return resolveCredentials().has_value();
}

bool Resolver::isAmbientMode() const {
    return settings_.usesAmbientCredential();
}

std::string Resolver::region() const {
    return settings_.effectiveRegion();
}

std::string Resolver::distributionId() const {
    return settings_.distributionId();
}

}
