#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace cfi::types {

struct ValidationError {
    enum class Code {
        // path list sanitizing
        InvalidPaths,
        NoValidPaths,
        TooManyPaths,
        // settings submission
        HttpsRequired,
        InvalidRegion,
        InvalidDistributionId,
        EmptyPaths,
        InvalidPath,
        // request building
        MissingDistribution
    };

    Code code;
    std::string message;
    std::optional<std::string> field;

    ValidationError(Code code, std::string message, std::optional<std::string> field = std::nullopt);
};

// Stable machine-readable identifier, e.g. "too_many_paths"
std::string to_string(ValidationError::Code code);

void to_json(nlohmann::json& j, const ValidationError& e);

}
