#include "settings/Store.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cfi::settings {

JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)) {}

Settings JsonFileStore::load() const {
    if (!fs::exists(path_)) return {};

    std::ifstream in(path_);
    if (!in.is_open()) throw std::runtime_error("Failed to open settings file: " + path_.string());

    std::stringstream buffer;
    buffer << in.rdbuf();

    const auto j = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        log::Registry::settings()->warn("[JsonFileStore] Settings file is not a JSON object, treating as empty | path={}",
                                        path_.string());
        return {};
    }

    return j.get<Settings>();
}

bool JsonFileStore::save(const Settings& settings) {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        log::Registry::settings()->error("[JsonFileStore] Failed to create settings directory | path={} | error={}",
                                         path_.parent_path().string(), ec.message());
        return false;
    }

    std::string document;
    try {
        document = nlohmann::json(settings).dump(2);
    } catch (const nlohmann::json::exception& e) {
        log::Registry::settings()->error("[JsonFileStore] Failed to serialize settings | path={} | error={}",
                                         path_.string(), e.what());
        return false;
    }

    const auto tmp = fs::path(path_.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            log::Registry::settings()->error("[JsonFileStore] Failed to open temp file | path={}", tmp.string());
            return false;
        }
        out << document << '\n';
        if (!out.good()) {
            log::Registry::settings()->error("[JsonFileStore] Failed to write settings | path={}", tmp.string());
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) log::Registry::settings()->warn("[JsonFileStore] Could not restrict permissions | path={} | error={}",
                                            tmp.string(), ec.message());

    fs::rename(tmp, path_, ec);
    if (ec) {
        log::Registry::settings()->error("[JsonFileStore] Failed to replace settings file | path={} | error={}",
                                         path_.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    return true;
}

Settings MemoryStore::load() const {
    std::scoped_lock lock(mutex_);
    return settings_;
}

bool MemoryStore::save(const Settings& settings) {
    std::scoped_lock lock(mutex_);
    settings_ = settings;
    ++saves_;
    return true;
}

unsigned int MemoryStore::saveCount() const {
    std::scoped_lock lock(mutex_);
    return saves_;
}

}
