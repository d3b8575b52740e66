#pragma once

#include "credentials/Resolver.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cfi::invalidation::model {

enum class AuthMode { Ambient, Explicit };

std::string to_string(AuthMode mode);

struct Request {
    std::string distribution_id;
    std::vector<std::string> paths;     // unique, order preserved, <= MAX_PATHS_PER_REQUEST
    std::string request_token;          // CloudFront CallerReference
    std::string region;

    AuthMode auth_mode{AuthMode::Ambient};
    // Set only for AuthMode::Explicit
    std::optional<credentials::ResolvedCredentials> credentials;

    [[nodiscard]] size_t quantity() const { return paths.size(); }
};

// CloudFront CreateInvalidation request body (InvalidationBatch).
std::string to_xml(const Request& request);

// Summary for logs and CLI output. Never includes key material.
void to_json(nlohmann::json& j, const Request& request);

}
