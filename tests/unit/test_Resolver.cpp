#include <gtest/gtest.h>
#include "credentials/Environment.hpp"
#include "credentials/Resolver.hpp"
#include "crypto/CredentialStore.hpp"

#include <cstdlib>
#include <map>

using namespace cfi;
using cfi::credentials::Resolver;

namespace {

class FakeEnvironment final : public credentials::Environment {
public:
    std::map<std::string, std::string> constants, variables;

    std::optional<std::string> constant(const std::string& name) const override {
        const auto it = constants.find(name);
        if (it == constants.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::string> variable(const std::string& name) const override {
        const auto it = variables.find(name);
        if (it == variables.end()) return std::nullopt;
        return it->second;
    }
};

}

class ResolverTest : public ::testing::Test {
protected:
    crypto::CredentialStore store{config::SecretsConfig{{"resolver-test-key"}, ""}};
    FakeEnvironment env;
    settings::Settings settings;

    static constexpr const auto* ACCESS = "CLOUDFRONT_AWS_ACCESS_KEY";
    static constexpr const auto* SECRET = "CLOUDFRONT_AWS_SECRET_KEY";

    void storeCiphertexts(const std::string& access, const std::string& secret) {
        settings.access_key_enc = store.encrypt(access);
        settings.secret_key_enc = store.encrypt(secret);
        settings.credentials_stored = true;
    }

    [[nodiscard]] Resolver resolver() const { return Resolver(settings, store, env); }
};

TEST_F(ResolverTest, OverrideBeatsEnvironmentAndStorage) {
    storeCiphertexts("stored-access", "stored-secret");
    env.constants[ACCESS] = "constant-access";
    env.variables[ACCESS] = "env-access";

    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "constant-access");
}

TEST_F(ResolverTest, EnvironmentBeatsStorage) {
    storeCiphertexts("stored-access", "stored-secret");
    env.variables[ACCESS] = "env-access";

    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "env-access");
}

TEST_F(ResolverTest, StorageUsedWhenNoOverride) {
    storeCiphertexts("stored-access", "stored-secret");
    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "stored-access");
}

TEST_F(ResolverTest, EmptyOverrideFallsThrough) {
    storeCiphertexts("stored-access", "stored-secret");
    env.constants[ACCESS] = "";
    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "stored-access");

    env.variables[ACCESS] = "";
    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "stored-access");

    env.variables[ACCESS] = "env-access";
    EXPECT_EQ(resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc), "env-access");
}

TEST_F(ResolverTest, AbsentWhenNothingConfigured) {
    EXPECT_FALSE(resolver().resolveValue(ACCESS, ACCESS, std::nullopt).has_value());
    EXPECT_FALSE(resolver().resolveValue(ACCESS, ACCESS, std::string{}).has_value());
}

TEST_F(ResolverTest, UndecryptableStorageIsAbsent) {
    EXPECT_FALSE(resolver().resolveValue(ACCESS, ACCESS, std::string("garbage")).has_value());

    const crypto::CredentialStore other(config::SecretsConfig{{"some-other-key"}, ""});
    settings.access_key_enc = other.encrypt("foreign");
    const auto dec = resolver().resolveValue(ACCESS, ACCESS, settings.access_key_enc);
    if (dec) EXPECT_NE(*dec, "foreign");
}

TEST_F(ResolverTest, ResolvesBothHalves) {
    storeCiphertexts("stored-access", "stored-secret");
    env.variables[SECRET] = "env-secret";

    const auto creds = resolver().resolveCredentials();
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->access_key, "stored-access");
    EXPECT_EQ(creds->secret_key, "env-secret");
    EXPECT_TRUE(resolver().hasCredentials());
}

TEST_F(ResolverTest, PartialCredentialsAreNeverReturned) {
    env.constants[ACCESS] = "constant-access";
    EXPECT_FALSE(resolver().resolveCredentials().has_value());
    EXPECT_FALSE(resolver().hasCredentials());

    env.constants.clear();
    env.variables[SECRET] = "env-secret";
    EXPECT_FALSE(resolver().resolveCredentials().has_value());
}

TEST_F(ResolverTest, ConfiguredNamesAreHonoured) {
    config::CredentialsConfig names;
    names.access_key_name = "MY_ACCESS";
    names.secret_key_name = "MY_SECRET";
    env.variables["MY_ACCESS"] = "a";
    env.variables["MY_SECRET"] = "s";
    env.variables[ACCESS] = "ignored";

    const Resolver r(settings, store, env, names);
    const auto creds = r.resolveCredentials();
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->access_key, "a");
    EXPECT_EQ(creds->secret_key, "s");
}

TEST_F(ResolverTest, AmbientModeRequiresCanonicalOnValue) {
    EXPECT_FALSE(resolver().isAmbientMode());

    settings.use_iam_role = "1";
    EXPECT_TRUE(resolver().isAmbientMode());

    for (const auto* v : {"0", "true", "yes", "on", " 1", ""}) {
        settings.use_iam_role = v;
        EXPECT_FALSE(resolver().isAmbientMode()) << "value: '" << v << "'";
    }
}

TEST_F(ResolverTest, RegionAndDistributionDefaults) {
    EXPECT_EQ(resolver().region(), "us-east-1");
    EXPECT_EQ(resolver().distributionId(), "");

    settings.region = "";
    EXPECT_EQ(resolver().region(), "us-east-1");

    settings.region = "ap-southeast-2";
    settings.distribution_id = "E1ABCDEFGHIJKL";
    EXPECT_EQ(resolver().region(), "ap-southeast-2");
    EXPECT_EQ(resolver().distributionId(), "E1ABCDEFGHIJKL");
}

TEST(ProcessEnvironmentTest, ReadsConstantsAndProcessVariables) {
    const credentials::ProcessEnvironment env(std::map<std::string, std::string>{{"CFI_TEST_CONSTANT", "from-config"}});
    EXPECT_EQ(env.constant("CFI_TEST_CONSTANT"), "from-config");
    EXPECT_FALSE(env.constant("CFI_TEST_MISSING").has_value());

    ::setenv("CFI_TEST_VARIABLE", "from-env", 1);
    EXPECT_EQ(env.variable("CFI_TEST_VARIABLE"), "from-env");
    ::unsetenv("CFI_TEST_VARIABLE");
    EXPECT_FALSE(env.variable("CFI_TEST_VARIABLE").has_value());
}
