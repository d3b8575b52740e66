#pragma once

#include "types/ValidationError.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>

namespace cfi::invalidation {

// A caller-supplied path entry. Anything that is not a string (numbers, nulls,
// nested objects arriving from loosely typed callers) is std::monostate and is
// dropped without error.
using PathCandidate = std::variant<std::monostate, std::string>;

using SanitizeResult = std::variant<std::vector<std::string>, types::ValidationError>;

// CloudFront rejects invalidation batches above this many paths.
inline constexpr size_t MAX_PATHS_PER_REQUEST = 3000;

class PathValidator {
public:
    // Trims, drops empties and non-strings, prefixes a missing leading '/',
    // de-duplicates keeping first occurrences, then enforces the batch limit.
    [[nodiscard]] static SanitizeResult sanitize(const std::vector<PathCandidate>& paths);
    [[nodiscard]] static SanitizeResult sanitize(const std::vector<std::string>& paths);

    // Non-array JSON fails with InvalidPaths; non-string elements are dropped.
    [[nodiscard]] static SanitizeResult sanitize(const nlohmann::json& paths);

    static std::vector<PathCandidate> candidates(const std::vector<std::string>& paths);
};

}
