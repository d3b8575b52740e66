#pragma once

#include "settings/Settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cfi::invalidation {

struct ContentChange {
    enum class Status { Published, Draft, AutoDraft };

    std::string permalink;
    bool is_page{false};
    bool is_front_page{false};          // front page or the posts index page
    bool is_autosave{false};
    bool is_revision{false};
    Status status{Status::Published};

    std::optional<std::string> archive_url;   // post type archive, non-page content only
    std::vector<std::string> term_urls;       // taxonomy term archives, non-page content only
};

// Turns content events into raw path candidates for RequestBuilder.
class Planner {
public:
    // URL path (or "/") and its wildcard: {"/blog/post/", "/blog/post/*"}
    [[nodiscard]] static std::vector<std::string> fromUrl(const std::string& url);

    // fromUrl for each URL, duplicates removed in first-seen order.
    [[nodiscard]] static std::vector<std::string> fromUrls(const std::vector<std::string>& urls);

    // Empty for autosaves, revisions, auto-drafts and changes without a permalink.
    [[nodiscard]] static std::vector<std::string> fromContentChange(const ContentChange& change);

    [[nodiscard]] static std::vector<std::string> fromDefaults(const settings::Settings& settings);

    // Path component of an absolute or relative URL; "/" when there is none.
    [[nodiscard]] static std::string urlPath(const std::string& url);
};

}
