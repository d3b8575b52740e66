#include "settings/Validator.hpp"
#include "crypto/CredentialStore.hpp"
#include "util/strings.hpp"
#include "log/Registry.hpp"

#include <regex>

using namespace cfi::types;

namespace cfi::settings {

static const std::regex REGION_PATTERN(R"(^[a-z]{2,3}-[a-z]+-\d+$)");
static const std::regex DISTRIBUTION_ID_PATTERN(R"(^[A-Z0-9]{13,14}$)");

Validator::Validator(const crypto::CredentialStore& store) : store_(store) {}

Settings Validator::validate(const Settings& current, const Input& input,
                             std::vector<ValidationError>& errors) const {
    Settings out = current;
    const auto firstNewError = errors.size();

    // Checkbox: absent from the form means explicitly off.
    out.use_iam_role = input.use_iam_role ? CHECKBOX_ON : CHECKBOX_OFF;

    applyCredentials(out, input, errors);

    if (input.aws_region) {
        if (auto region = validateRegion(*input.aws_region, errors)) out.region = std::move(*region);
        else out.region = current.region.value_or(DEFAULT_REGION);
    }

    if (input.distribution_id) {
        if (auto id = validateDistributionId(*input.distribution_id, errors)) out.distribution_id = std::move(*id);
        else out.distribution_id = current.distribution_id.value_or("");
    }

    if (input.invalidation_paths) {
        if (auto paths = validatePaths(*input.invalidation_paths, errors)) out.invalidation_paths = std::move(*paths);
        else out.invalidation_paths = current.defaultPaths();
    }

    for (auto i = firstNewError; i < errors.size(); ++i)
        log::Registry::settings()->info("[Validator] Rejected {} | code={}",
                                        errors[i].field.value_or("-"), to_string(errors[i].code));

    return out;
}

void Validator::applyCredentials(Settings& out, const Input& input, std::vector<ValidationError>& errors) const {
    const auto access = util::trim(input.aws_access_key.value_or(""));
    const auto secret = util::trim(input.aws_secret_key.value_or(""));

    // Plaintext never survives a submission.
    out.legacy_access_key.reset();
    out.legacy_secret_key.reset();

    // Refused submissions leave the stored ciphertext exactly as it was.
    if (!input.secure_channel && (!access.empty() || !secret.empty())) {
        errors.emplace_back(ValidationError::Code::HttpsRequired,
                            "AWS credentials cannot be saved over an insecure (HTTP) connection. Please use HTTPS.");
        log::Registry::settings()->warn("[Validator] Credential submission over insecure channel refused");
        return;
    }

    if (!access.empty()) {
        if (auto enc = store_.encrypt(access)) {
            out.access_key_enc = std::move(*enc);
            out.credentials_stored = true;
        }
    }
    if (!secret.empty()) {
        if (auto enc = store_.encrypt(secret)) {
            out.secret_key_enc = std::move(*enc);
            out.credentials_stored = true;
        }
    }

    if (!out.hasBothCiphertexts()) {
        out.access_key_enc.reset();
        out.secret_key_enc.reset();
        out.credentials_stored = false;
    }
}

std::optional<std::string> Validator::validateRegion(const std::string& raw, std::vector<ValidationError>& errors) {
    auto region = util::toLower(util::trim(raw));

    // Empty means "use the default" downstream
    if (region.empty()) return region;

    if (!std::regex_match(region, REGION_PATTERN)) {
        errors.emplace_back(ValidationError::Code::InvalidRegion,
                            "Invalid AWS region format. Please use format like: us-east-1, eu-west-2, ap-southeast-1",
                            field::REGION);
        return std::nullopt;
    }

    return region;
}

std::optional<std::string> Validator::validateDistributionId(const std::string& raw,
                                                             std::vector<ValidationError>& errors) {
    auto id = util::toUpper(util::trim(raw));

    // Empty clears the field
    if (id.empty()) return id;

    if (!std::regex_match(id, DISTRIBUTION_ID_PATTERN)) {
        errors.emplace_back(ValidationError::Code::InvalidDistributionId,
                            "Invalid CloudFront Distribution ID. Expected 13-14 uppercase alphanumeric characters "
                            "(e.g., E1ABCDEFGHIJKL)",
                            field::DISTRIBUTION_ID);
        return std::nullopt;
    }

    return id;
}

std::optional<std::vector<std::string>> Validator::validatePaths(const std::string& raw,
                                                                 std::vector<ValidationError>& errors) {
    std::vector<std::string> paths;
    for (const auto& line : util::splitLines(raw))
        if (auto p = util::trim(line); !p.empty()) paths.push_back(std::move(p));

    if (paths.empty()) {
        errors.emplace_back(ValidationError::Code::EmptyPaths,
                            "At least one invalidation path is required.",
                            field::INVALIDATION_PATHS);
        return std::nullopt;
    }

    for (const auto& p : paths) {
        if (p.front() != '/') {
            errors.emplace_back(ValidationError::Code::InvalidPath,
                                "Invalidation path \"" + p + "\" must start with /. Example: /*, /blog/*, /images/",
                                field::INVALIDATION_PATHS);
            return std::nullopt;
        }
    }

    return paths;
}

}
