#include "settings/Settings.hpp"
#include "util/strings.hpp"

#include <nlohmann/json.hpp>

namespace cfi::settings {

bool Settings::usesAmbientCredential() const {
    return use_iam_role && *use_iam_role == CHECKBOX_ON;
}

bool Settings::hasBothCiphertexts() const {
    return access_key_enc && !access_key_enc->empty() && secret_key_enc && !secret_key_enc->empty();
}

std::string Settings::effectiveRegion() const {
    if (!region || region->empty()) return DEFAULT_REGION;
    return *region;
}

std::string Settings::distributionId() const {
    return distribution_id.value_or("");
}

std::vector<std::string> Settings::defaultPaths() const {
    if (!invalidation_paths) return {DEFAULT_PATH};
    return *invalidation_paths;
}

static std::optional<std::string> optString(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

static bool truthy(const nlohmann::json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0;
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        return !s.empty() && s != "0";
    }
    return false;
}

void to_json(nlohmann::json& j, const Settings& s) {
    j = nlohmann::json::object();
    if (s.use_iam_role) j[field::USE_IAM_ROLE] = *s.use_iam_role;
    if (s.access_key_enc) j[field::ACCESS_KEY_ENC] = *s.access_key_enc;
    if (s.secret_key_enc) j[field::SECRET_KEY_ENC] = *s.secret_key_enc;
    if (s.credentials_stored) j[field::CREDENTIALS_STORED] = true;
    if (s.region) j[field::REGION] = *s.region;
    if (s.distribution_id) j[field::DISTRIBUTION_ID] = *s.distribution_id;
    if (s.invalidation_paths) j[field::INVALIDATION_PATHS] = util::joinLines(*s.invalidation_paths);
}

void from_json(const nlohmann::json& j, Settings& s) {
    s = Settings{};
    if (!j.is_object()) return;

    if (const auto it = j.find(field::USE_IAM_ROLE); it != j.end()) {
        // Anything that is not a string can never equal the canonical "1".
        s.use_iam_role = it->is_string() ? it->get<std::string>() : std::string(CHECKBOX_OFF);
    }

    s.access_key_enc = optString(j, field::ACCESS_KEY_ENC);
    s.secret_key_enc = optString(j, field::SECRET_KEY_ENC);
    if (const auto it = j.find(field::CREDENTIALS_STORED); it != j.end()) s.credentials_stored = truthy(*it);

    s.region = optString(j, field::REGION);
    s.distribution_id = optString(j, field::DISTRIBUTION_ID);

    if (const auto it = j.find(field::INVALIDATION_PATHS); it != j.end()) {
        std::vector<std::string> paths;
        if (it->is_string()) {
            for (const auto& line : util::splitLines(it->get_ref<const std::string&>()))
                if (auto p = util::trim(line); !p.empty()) paths.push_back(std::move(p));
        } else if (it->is_array()) {
            for (const auto& el : *it)
                if (el.is_string())
                    if (auto p = util::trim(el.get_ref<const std::string&>()); !p.empty()) paths.push_back(std::move(p));
        }
        if (!paths.empty()) s.invalidation_paths = std::move(paths);
    }

    s.legacy_access_key = optString(j, field::ACCESS_KEY);
    s.legacy_secret_key = optString(j, field::SECRET_KEY);
}

}
