#pragma once

#include <map>
#include <optional>
#include <string>

namespace cfi::credentials {

// Read-only lookup of deployment constants and process environment variables.
class Environment {
public:
    virtual ~Environment() = default;

    [[nodiscard]] virtual std::optional<std::string> constant(const std::string& name) const = 0;
    [[nodiscard]] virtual std::optional<std::string> variable(const std::string& name) const = 0;
};

// Constants come from configuration, variables from getenv().
class ProcessEnvironment final : public Environment {
public:
    explicit ProcessEnvironment(std::map<std::string, std::string> constants);

    [[nodiscard]] std::optional<std::string> constant(const std::string& name) const override;
    [[nodiscard]] std::optional<std::string> variable(const std::string& name) const override;

private:
    std::map<std::string, std::string> constants_;
};

}
