#include "invalidation/Planner.hpp"

#include <string_view>
#include <unordered_set>

namespace cfi::invalidation {

std::string Planner::urlPath(const std::string& url) {
    std::string_view rest = url;

    if (const auto scheme = rest.find("://"); scheme != std::string_view::npos) {
        rest.remove_prefix(scheme + 3);
        const auto slash = rest.find_first_of("/?#");
        if (slash == std::string_view::npos || rest[slash] != '/') return "/";
        rest.remove_prefix(slash);
    } else if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        const auto slash = rest.find_first_of("/?#");
        if (slash == std::string_view::npos || rest[slash] != '/') return "/";
        rest.remove_prefix(slash);
    }

    rest = rest.substr(0, rest.find_first_of("?#"));
    if (rest.empty()) return "/";
    return std::string(rest);
}

std::vector<std::string> Planner::fromUrl(const std::string& url) {
    const auto path = urlPath(url);
    return {path, path + "*"};
}

std::vector<std::string> Planner::fromUrls(const std::vector<std::string>& urls) {
    std::vector<std::string> paths;
    std::unordered_set<std::string> seen;
    for (const auto& url : urls)
        for (auto& p : fromUrl(url))
            if (seen.insert(p).second) paths.push_back(std::move(p));
    return paths;
}

std::vector<std::string> Planner::fromContentChange(const ContentChange& change) {
    if (change.is_autosave || change.is_revision) return {};
    if (change.status == ContentChange::Status::AutoDraft) return {};
    if (change.permalink.empty()) return {};

    std::vector<std::string> paths;
    std::unordered_set<std::string> seen;
    const auto add = [&](std::vector<std::string> more) {
        for (auto& p : more)
            if (seen.insert(p).second) paths.push_back(std::move(p));
    };

    add(fromUrl(change.permalink));

    if (change.is_page && change.is_front_page) add({"/", "/*"});

    if (!change.is_page) {
        if (change.archive_url) add(fromUrl(*change.archive_url));
        for (const auto& term : change.term_urls) add(fromUrl(term));
    }

    return paths;
}

std::vector<std::string> Planner::fromDefaults(const settings::Settings& settings) {
    return settings.defaultPaths();
}

}
