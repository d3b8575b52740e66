#pragma once

#include "settings/Settings.hpp"
#include "types/ValidationError.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfi::crypto { class CredentialStore; }

namespace cfi::settings {

// One administrator submission. Absent optionals mean the field was not part
// of the form; the ambient checkbox is the exception (absent means unchecked).
struct Input {
    bool use_iam_role{false};
    std::optional<std::string> aws_access_key, aws_secret_key;
    std::optional<std::string> aws_region;
    std::optional<std::string> distribution_id;
    std::optional<std::string> invalidation_paths;   // newline separated

    // False when the submission arrived without transport confidentiality.
    bool secure_channel{true};
};

class Validator {
public:
    explicit Validator(const crypto::CredentialStore& store);

    // Never throws on bad input. Each rejected field keeps its previous value
    // and appends one error; fields are evaluated independently.
    [[nodiscard]] Settings validate(const Settings& current, const Input& input,
                                    std::vector<types::ValidationError>& errors) const;

    // Returns the normalized value or nullopt (with an error appended).
    [[nodiscard]] static std::optional<std::string> validateRegion(const std::string& raw,
                                                                   std::vector<types::ValidationError>& errors);
    [[nodiscard]] static std::optional<std::string> validateDistributionId(const std::string& raw,
                                                                           std::vector<types::ValidationError>& errors);
    // All-or-nothing: the first line without a leading '/' rejects the list.
    [[nodiscard]] static std::optional<std::vector<std::string>> validatePaths(const std::string& raw,
                                                                               std::vector<types::ValidationError>& errors);

private:
    const crypto::CredentialStore& store_;

    void applyCredentials(Settings& out, const Input& input, std::vector<types::ValidationError>& errors) const;
};

}
