#include "invalidation/PathValidator.hpp"
#include "util/strings.hpp"

#include <nlohmann/json.hpp>
#include <unordered_set>

using namespace cfi::types;

namespace cfi::invalidation {

SanitizeResult PathValidator::sanitize(const std::vector<PathCandidate>& paths) {
    if (paths.empty())
        return ValidationError(ValidationError::Code::InvalidPaths,
                               "Invalidation paths must be a non-empty array.");

    std::vector<std::string> validated;
    std::unordered_set<std::string> seen;
    validated.reserve(paths.size());

    for (const auto& candidate : paths) {
        const auto* raw = std::get_if<std::string>(&candidate);
        if (!raw) continue;

        auto path = util::trim(*raw);
        if (path.empty()) continue;

        // CloudFront requires a leading slash
        if (path.front() != '/') path.insert(path.begin(), '/');

        if (seen.insert(path).second) validated.push_back(std::move(path));
    }

    if (validated.empty())
        return ValidationError(ValidationError::Code::NoValidPaths, "No valid invalidation paths provided.");

    if (validated.size() > MAX_PATHS_PER_REQUEST)
        return ValidationError(ValidationError::Code::TooManyPaths,
                               "CloudFront allows a maximum of " + std::to_string(MAX_PATHS_PER_REQUEST) +
                               " paths per invalidation request. You provided " +
                               std::to_string(validated.size()) + " paths.");

    return validated;
}

SanitizeResult PathValidator::sanitize(const std::vector<std::string>& paths) {
    return sanitize(candidates(paths));
}

SanitizeResult PathValidator::sanitize(const nlohmann::json& paths) {
    if (!paths.is_array())
        return ValidationError(ValidationError::Code::InvalidPaths,
                               "Invalidation paths must be a non-empty array.");

    std::vector<PathCandidate> list;
    list.reserve(paths.size());
    for (const auto& el : paths) {
        if (el.is_string()) list.emplace_back(el.get<std::string>());
        else list.emplace_back(std::monostate{});
    }
    return sanitize(list);
}

std::vector<PathCandidate> PathValidator::candidates(const std::vector<std::string>& paths) {
    return std::vector<PathCandidate>(paths.begin(), paths.end());
}

}
