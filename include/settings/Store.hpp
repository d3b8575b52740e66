#pragma once

#include "settings/Settings.hpp"

#include <filesystem>
#include <mutex>

namespace cfi::settings {

// Keyed blob store for the settings document. No transactional guarantees:
// concurrent writers race and the last save wins.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual Settings load() const = 0;
    virtual bool save(const Settings& settings) = 0;
};

class JsonFileStore final : public Store {
public:
    explicit JsonFileStore(std::filesystem::path path);

    // A missing file loads as an empty settings object.
    [[nodiscard]] Settings load() const override;

    // Writes to a sibling temp file, chmod 0600, then renames over the target.
    // Returns false, leaving the target untouched, when the settings cannot be
    // serialized (e.g. a value that is not valid UTF-8) or written.
    bool save(const Settings& settings) override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class MemoryStore final : public Store {
public:
    MemoryStore() = default;
    explicit MemoryStore(Settings initial) : settings_(std::move(initial)) {}

    [[nodiscard]] Settings load() const override;
    bool save(const Settings& settings) override;

    [[nodiscard]] unsigned int saveCount() const;

private:
    mutable std::mutex mutex_;
    Settings settings_;
    unsigned int saves_{0};
};

}
