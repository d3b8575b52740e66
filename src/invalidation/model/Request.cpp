#include "invalidation/model/Request.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

namespace cfi::invalidation::model {

static constexpr const auto* CLOUDFRONT_XMLNS = "http://cloudfront.amazonaws.com/doc/2020-05-31/";

std::string to_string(const AuthMode mode) {
    switch (mode) {
        case AuthMode::Ambient: return "ambient";
        case AuthMode::Explicit: return "explicit";
    }
    return "unknown";
}

static std::string xmlEscape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (const char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string to_xml(const Request& request) {
    std::ostringstream xml;

    xml << R"(<?xml version="1.0" encoding="UTF-8"?>)";
    xml << "<InvalidationBatch xmlns=\"" << CLOUDFRONT_XMLNS << "\">";
    xml << "<CallerReference>" << xmlEscape(request.request_token) << "</CallerReference>";
    xml << "<Paths><Quantity>" << request.quantity() << "</Quantity><Items>";

    for (const auto& path : request.paths)
        xml << "<Path>" << xmlEscape(path) << "</Path>";

    xml << "</Items></Paths></InvalidationBatch>";

    return xml.str();
}

void to_json(nlohmann::json& j, const Request& request) {
    j = {
        {"distribution_id", request.distribution_id},
        {"caller_reference", request.request_token},
        {"region", request.region},
        {"auth_mode", to_string(request.auth_mode)},
        {"paths", {
            {"quantity", request.quantity()},
            {"items", request.paths}
        }}
    };
}

}
