#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cfi::settings {

// Stored field names, kept for compatibility with existing settings documents.
namespace field {
inline constexpr const char* USE_IAM_ROLE        = "use_iam_role";
inline constexpr const char* ACCESS_KEY_ENC      = "aws_access_key_enc";
inline constexpr const char* SECRET_KEY_ENC      = "aws_secret_key_enc";
inline constexpr const char* CREDENTIALS_STORED  = "credentials_stored";
inline constexpr const char* REGION              = "aws_region";
inline constexpr const char* DISTRIBUTION_ID     = "distribution_id";
inline constexpr const char* INVALIDATION_PATHS  = "invalidation_paths";
// legacy plaintext, read for migration only
inline constexpr const char* ACCESS_KEY          = "aws_access_key";
inline constexpr const char* SECRET_KEY          = "aws_secret_key";
}

inline constexpr const char* CHECKBOX_ON  = "1";
inline constexpr const char* CHECKBOX_OFF = "0";
inline constexpr const char* DEFAULT_REGION = "us-east-1";
inline constexpr const char* DEFAULT_PATH = "/*";

struct Settings {
    // Only the exact value "1" turns ambient (IAM role) authentication on.
    std::optional<std::string> use_iam_role;

    // EncryptedSecret payloads
    std::optional<std::string> access_key_enc, secret_key_enc;
    bool credentials_stored{false};

    std::optional<std::string> region;
    std::optional<std::string> distribution_id;
    std::optional<std::vector<std::string>> invalidation_paths;

    // Pre-encryption plaintext fields; never written back out.
    std::optional<std::string> legacy_access_key, legacy_secret_key;

    [[nodiscard]] bool usesAmbientCredential() const;
    [[nodiscard]] bool hasBothCiphertexts() const;

    [[nodiscard]] std::string effectiveRegion() const;
    [[nodiscard]] std::string distributionId() const;
    [[nodiscard]] std::vector<std::string> defaultPaths() const;
};

void to_json(nlohmann::json& j, const Settings& s);
void from_json(const nlohmann::json& j, Settings& s);

}
