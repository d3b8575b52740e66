#include "credentials/Environment.hpp"

#include <cstdlib>

namespace cfi::credentials {

ProcessEnvironment::ProcessEnvironment(std::map<std::string, std::string> constants)
    : constants_(std::move(constants)) {}

std::optional<std::string> ProcessEnvironment::constant(const std::string& name) const {
    const auto it = constants_.find(name);
    if (it == constants_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ProcessEnvironment::variable(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

}
