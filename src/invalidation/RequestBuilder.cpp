#include "invalidation/RequestBuilder.hpp"
#include "credentials/Resolver.hpp"
#include "util/ids.hpp"
#include "log/Registry.hpp"

#include <ctime>
#include <stdexcept>

using namespace cfi::types;
using namespace cfi::invalidation::model;

namespace cfi::invalidation {

RequestBuilder::RequestBuilder(const credentials::Resolver& resolver,
                               config::InvalidationConfig options,
                               LifecycleHooks hooks)
    : resolver_(resolver), options_(std::move(options)), hooks_(std::move(hooks)) {
    if (options_.token_suffix_length == 0)
        throw std::invalid_argument("[RequestBuilder] token_suffix_length must be greater than zero");
}

BuildResult RequestBuilder::build(const std::string& distributionId,
                                  const std::vector<PathCandidate>& rawPaths) const {
    if (distributionId.empty())
        return ValidationError(ValidationError::Code::MissingDistribution,
                               "CloudFront Distribution ID not configured.",
                               settings::field::DISTRIBUTION_ID);

    auto sanitized = PathValidator::sanitize(rawPaths);
    if (const auto* err = std::get_if<ValidationError>(&sanitized)) {
        log::Registry::invalidation()->warn("[RequestBuilder] Rejected path list | code={} | {}",
                                            to_string(err->code), err->message);
        return *err;
    }

    Request request;
    request.distribution_id = distributionId;
    request.paths = std::move(std::get<std::vector<std::string>>(sanitized));
    request.request_token = nextRequestToken();
    request.region = resolver_.region();

    if (resolver_.isAmbientMode()) {
        request.auth_mode = AuthMode::Ambient;
    } else if (auto creds = resolver_.resolveCredentials()) {
        request.auth_mode = AuthMode::Explicit;
        request.credentials = std::move(*creds);
    } else {
        // Let the transport's default credential chain apply.
        log::Registry::credentials()->info("[RequestBuilder] No explicit credentials resolved; "
                                           "falling back to ambient credentials");
        request.auth_mode = AuthMode::Ambient;
    }

    log::Registry::invalidation()->info("[RequestBuilder] Request built | distribution={} | paths={} | auth={} | ref={}",
                                        request.distribution_id, request.quantity(),
                                        to_string(request.auth_mode), request.request_token);
    std::string joined;
    for (const auto& p : request.paths) {
        if (!joined.empty()) joined.push_back(',');
        joined += p;
    }
    log::Registry::audit()->info("invalidation.built distribution={} ref={} paths=[{}]",
                                 request.distribution_id, request.request_token, joined);

    if (hooks_.on_built) hooks_.on_built(request);
    return request;
}

BuildResult RequestBuilder::build(const std::string& distributionId,
                                  const std::vector<std::string>& rawPaths) const {
    return build(distributionId, PathValidator::candidates(rawPaths));
}

BuildResult RequestBuilder::buildAll() const {
    return build(resolver_.distributionId(), resolver_.settings().defaultPaths());
}

void RequestBuilder::reportFailure(const Request& request, const std::string_view error) const {
    log::Registry::invalidation()->error("[RequestBuilder] Request failed | distribution={} | ref={} | error={}",
                                         request.distribution_id, request.request_token, error);
    log::Registry::audit()->info("invalidation.failed distribution={} ref={} error={}",
                                 request.distribution_id, request.request_token, error);

    if (hooks_.on_failed) hooks_.on_failed(request, error);
}

std::string RequestBuilder::nextRequestToken() const {
    return options_.request_token_prefix + std::to_string(std::time(nullptr)) + "-" +
           util::random_b32(options_.token_suffix_length);
}

}
