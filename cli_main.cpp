#include "config/ConfigRegistry.hpp"
#include "credentials/Environment.hpp"
#include "credentials/Resolver.hpp"
#include "crypto/CredentialStore.hpp"
#include "invalidation/Planner.hpp"
#include "invalidation/RequestBuilder.hpp"
#include "log/Registry.hpp"
#include "settings/Store.hpp"
#include "settings/Validator.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace cfi;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void usage() {
    std::cerr <<
        "usage: cfictl [--config <path>] <command> [args...]\n"
        "\n"
        "commands:\n"
        "  encrypt <text>            print the encrypted payload for <text>\n"
        "  decrypt <payload>         print the plaintext of an encrypted payload\n"
        "  migrate                   encrypt legacy plaintext credentials in the settings file\n"
        "  settings show             print stored settings with secrets masked\n"
        "  settings set [--iam] [--access-key K] [--secret-key S] [--region R]\n"
        "               [--distribution-id D] [--paths P] [--insecure]\n"
        "  plan <url>...             print the paths that invalidate the given URLs\n"
        "  request [--json] [--url U]... [path...]\n"
        "                            build an invalidation request (defaults to stored paths)\n";
}

// Invalid UTF-8 (e.g. from argv) is replaced rather than thrown on.
std::string render(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

int usageError() {
    usage();
    return EXIT_USAGE;
}

struct Context {
    const config::Config& cfg;
    crypto::CredentialStore store;
    settings::JsonFileStore settingsStore;
    credentials::ProcessEnvironment env;

    explicit Context(const config::Config& c)
        : cfg(c), store(c.secrets), settingsStore(c.settings.path), env(c.credentials.constants) {}

    settings::Settings loadSettings() {
        return store.migrateLegacy(settingsStore.load(), settingsStore);
    }
};

int cmdEncrypt(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) return usageError();
    const auto payload = ctx.store.encrypt(args[0]);
    if (!payload) {
        std::cerr << "encryption failed\n";
        return EXIT_FAILED;
    }
    std::cout << *payload << std::endl;
    return EXIT_OK;
}

int cmdDecrypt(Context& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) return usageError();
    const auto plaintext = ctx.store.decrypt(args[0]);
    if (!plaintext) {
        std::cerr << "decryption failed\n";
        return EXIT_FAILED;
    }
    std::cout << *plaintext << std::endl;
    return EXIT_OK;
}

int cmdMigrate(Context& ctx) {
    const auto before = ctx.settingsStore.load();
    const bool hadLegacy = before.legacy_access_key || before.legacy_secret_key;
    ctx.store.migrateLegacy(before, ctx.settingsStore);
    std::cout << (hadLegacy ? "migrated legacy credentials" : "nothing to migrate") << std::endl;
    return EXIT_OK;
}

nlohmann::json masked(const settings::Settings& s) {
    nlohmann::json j = s;
    for (const auto* key : {settings::field::ACCESS_KEY_ENC, settings::field::SECRET_KEY_ENC})
        if (j.contains(key)) j[key] = "******** (stored)";
    return j;
}

int cmdSettings(Context& ctx, const std::vector<std::string>& args) {
    if (args.empty()) return usageError();

    const auto current = ctx.loadSettings();

    if (args[0] == "show") {
        std::cout << render(masked(current)) << std::endl;
        return EXIT_OK;
    }

    if (args[0] != "set") return usageError();

    settings::Input input;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) return std::nullopt;
            return args[++i];
        };

        std::optional<std::string>* target = nullptr;
        if (a == "--iam") { input.use_iam_role = true; continue; }
        if (a == "--insecure") { input.secure_channel = false; continue; }
        if (a == "--access-key") target = &input.aws_access_key;
        else if (a == "--secret-key") target = &input.aws_secret_key;
        else if (a == "--region") target = &input.aws_region;
        else if (a == "--distribution-id") target = &input.distribution_id;
        else if (a == "--paths") target = &input.invalidation_paths;
        else return usageError();

        auto value = next();
        if (!value) return usageError();
        *target = std::move(*value);
    }

    std::vector<types::ValidationError> errors;
    const settings::Validator validator(ctx.store);
    const auto updated = validator.validate(current, input, errors);

    if (!ctx.settingsStore.save(updated)) {
        std::cerr << "failed to save settings to " << ctx.settingsStore.path() << "\n";
        return EXIT_FAILED;
    }

    nlohmann::json out = {{"settings", masked(updated)}, {"errors", errors}};
    std::cout << render(out) << std::endl;
    return errors.empty() ? EXIT_OK : EXIT_FAILED;
}

int cmdPlan(const std::vector<std::string>& args) {
    if (args.empty()) return usageError();
    std::cout << render(invalidation::Planner::fromUrls(args)) << std::endl;
    return EXIT_OK;
}

int cmdRequest(Context& ctx, const std::vector<std::string>& args) {
    bool asJson = false;
    std::vector<std::string> paths, urls;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--json") asJson = true;
        else if (a == "--url") {
            if (i + 1 >= args.size()) return usageError();
            urls.push_back(args[++i]);
        }
        else paths.push_back(a);
    }
    for (auto& p : invalidation::Planner::fromUrls(urls)) paths.push_back(std::move(p));

    const credentials::Resolver resolver(ctx.loadSettings(), ctx.store, ctx.env, ctx.cfg.credentials);
    const invalidation::RequestBuilder builder(resolver, ctx.cfg.invalidation);

    const auto result = paths.empty()
        ? builder.buildAll()
        : builder.build(resolver.distributionId(), paths);

    if (const auto* err = std::get_if<types::ValidationError>(&result)) {
        std::cerr << to_string(err->code) << ": " << err->message << "\n";
        return EXIT_FAILED;
    }

    const auto& request = std::get<invalidation::model::Request>(result);
    if (asJson) std::cout << render(request) << std::endl;
    else std::cout << invalidation::model::to_xml(request) << std::endl;
    return EXIT_OK;
}

}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() >= 2 && args[0] == "--config") {
        paths::setConfigPath(args[1]);
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) return usageError();

    try {
        config::ConfigRegistry::init();
        log::Registry::init(config::ConfigRegistry::get().logging.log_dir);

        Context ctx(config::ConfigRegistry::get());
        const auto cmd = args.front();
        const std::vector<std::string> rest(args.begin() + 1, args.end());
        log::Registry::cfinvalidator()->debug("[cfictl] command={} | config={}", cmd, paths::getConfigPath().string());

        if (cmd == "encrypt") return cmdEncrypt(ctx, rest);
        if (cmd == "decrypt") return cmdDecrypt(ctx, rest);
        if (cmd == "migrate") return cmdMigrate(ctx);
        if (cmd == "settings") return cmdSettings(ctx, rest);
        if (cmd == "plan") return cmdPlan(rest);
        if (cmd == "request") return cmdRequest(ctx, rest);

        return usageError();
    } catch (const std::exception& e) {
        std::cerr << "cfictl: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
}
