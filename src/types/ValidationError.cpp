#include "types/ValidationError.hpp"

#include <nlohmann/json.hpp>

namespace cfi::types {

ValidationError::ValidationError(const Code code, std::string message, std::optional<std::string> field)
    : code(code), message(std::move(message)), field(std::move(field)) {}

std::string to_string(const ValidationError::Code code) {
    switch (code) {
        case ValidationError::Code::InvalidPaths: return "invalid_paths";
        case ValidationError::Code::NoValidPaths: return "no_valid_paths";
        case ValidationError::Code::TooManyPaths: return "too_many_paths";
        case ValidationError::Code::HttpsRequired: return "cloudfront_https_required";
        case ValidationError::Code::InvalidRegion: return "invalid_aws_region";
        case ValidationError::Code::InvalidDistributionId: return "invalid_distribution_id";
        case ValidationError::Code::EmptyPaths: return "empty_invalidation_paths";
        case ValidationError::Code::InvalidPath: return "invalid_invalidation_path";
        case ValidationError::Code::MissingDistribution: return "settings_missing";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const ValidationError& e) {
    j = {
        {"code", to_string(e.code)},
        {"message", e.message}
    };
    if (e.field) j["field"] = *e.field;
}

}
