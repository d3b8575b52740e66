#pragma once

#include "invalidation/PathValidator.hpp"
#include "invalidation/model/Request.hpp"
#include "config/Config.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cfi::credentials { class Resolver; }

namespace cfi::invalidation {

using BuildResult = std::variant<model::Request, types::ValidationError>;

struct LifecycleHooks {
    // Fired once a request is fully built, before the caller submits it.
    std::function<void(const model::Request&)> on_built = nullptr;
    // Fired when the caller reports that submission failed.
    std::function<void(const model::Request&, std::string_view error)> on_failed = nullptr;
};

// Assembles ready-to-submit invalidation requests. Performs no network I/O.
class RequestBuilder {
public:
    explicit RequestBuilder(const credentials::Resolver& resolver,
                            config::InvalidationConfig options = {},
                            LifecycleHooks hooks = {});

    [[nodiscard]] BuildResult build(const std::string& distributionId,
                                    const std::vector<PathCandidate>& rawPaths) const;
    [[nodiscard]] BuildResult build(const std::string& distributionId,
                                    const std::vector<std::string>& rawPaths) const;

    // Stored distribution id and default path list ("invalidate everything").
    [[nodiscard]] BuildResult buildAll() const;

    void reportFailure(const model::Request& request, std::string_view error) const;

    // <prefix><unix seconds>-<random suffix>; advisory uniqueness only.
    [[nodiscard]] std::string nextRequestToken() const;

private:
    const credentials::Resolver& resolver_;
    config::InvalidationConfig options_;
    LifecycleHooks hooks_;
};

}
