#include <gtest/gtest.h>
#include "settings/Settings.hpp"
#include "settings/Store.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace cfi::settings;

TEST(SettingsTest, DefaultsForEmptySettings) {
    const Settings s;
    EXPECT_FALSE(s.usesAmbientCredential());
    EXPECT_FALSE(s.hasBothCiphertexts());
    EXPECT_EQ(s.effectiveRegion(), "us-east-1");
    EXPECT_EQ(s.distributionId(), "");
    EXPECT_EQ(s.defaultPaths(), std::vector<std::string>{"/*"});
}

TEST(SettingsTest, SerializesStoredFieldNames) {
    Settings s;
    s.use_iam_role = "1";
    s.access_key_enc = "enc-a";
    s.secret_key_enc = "enc-s";
    s.credentials_stored = true;
    s.region = "eu-west-1";
    s.distribution_id = "E1ABCDEFGHIJKL";
    s.invalidation_paths = std::vector<std::string>{"/*", "/blog/*"};
    s.legacy_access_key = "plaintext";

    const nlohmann::json j = s;
    EXPECT_EQ(j.at("use_iam_role"), "1");
    EXPECT_EQ(j.at("aws_access_key_enc"), "enc-a");
    EXPECT_EQ(j.at("aws_secret_key_enc"), "enc-s");
    EXPECT_EQ(j.at("credentials_stored"), true);
    EXPECT_EQ(j.at("aws_region"), "eu-west-1");
    EXPECT_EQ(j.at("distribution_id"), "E1ABCDEFGHIJKL");
    EXPECT_EQ(j.at("invalidation_paths"), "/*\n/blog/*");
    EXPECT_FALSE(j.contains("aws_access_key"));
    EXPECT_FALSE(j.contains("aws_secret_key"));
}

TEST(SettingsTest, CredentialsStoredWrittenOnlyWhenTrue) {
    const nlohmann::json j = Settings{};
    EXPECT_FALSE(j.contains("credentials_stored"));
    EXPECT_TRUE(j.is_object());
}

TEST(SettingsTest, ParsesExistingDocument) {
    const auto j = nlohmann::json::parse(R"({
        "use_iam_role": "1",
        "aws_access_key": "AKIALEGACY",
        "aws_secret_key": "legacy-secret",
        "credentials_stored": "1",
        "aws_region": "us-west-2",
        "invalidation_paths": "/*\r\n\n /news/* \n"
    })");

    const auto s = j.get<Settings>();
    EXPECT_TRUE(s.usesAmbientCredential());
    EXPECT_EQ(s.legacy_access_key, "AKIALEGACY");
    EXPECT_EQ(s.legacy_secret_key, "legacy-secret");
    EXPECT_TRUE(s.credentials_stored);
    EXPECT_EQ(s.effectiveRegion(), "us-west-2");
    EXPECT_EQ(s.defaultPaths(), (std::vector<std::string>{"/*", "/news/*"}));
}

TEST(SettingsTest, AcceptsPathArrayAndIgnoresWrongTypes) {
    const auto j = nlohmann::json::parse(R"({
        "use_iam_role": true,
        "aws_region": 5,
        "invalidation_paths": ["/a", 3, " /b "]
    })");

    const auto s = j.get<Settings>();
    EXPECT_FALSE(s.usesAmbientCredential());
    EXPECT_FALSE(s.region.has_value());
    EXPECT_EQ(s.defaultPaths(), (std::vector<std::string>{"/a", "/b"}));
}

class JsonFileStoreTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("cfi_store_test_" + std::to_string(::getpid()) + "_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }

    void TearDown() override { fs::remove_all(dir); }
};

TEST_F(JsonFileStoreTest, MissingFileLoadsEmpty) {
    const JsonFileStore store(dir / "settings.json");
    const auto s = store.load();
    EXPECT_FALSE(s.region.has_value());
    EXPECT_EQ(s.defaultPaths(), std::vector<std::string>{"/*"});
}

TEST_F(JsonFileStoreTest, SaveThenLoad) {
    JsonFileStore store(dir / "nested" / "settings.json");

    Settings s;
    s.region = "ca-central-1";
    s.distribution_id = "E1ABCDEFGHIJKL";
    s.invalidation_paths = std::vector<std::string>{"/a", "/b"};
    ASSERT_TRUE(store.save(s));

    const auto loaded = store.load();
    EXPECT_EQ(loaded.region, "ca-central-1");
    EXPECT_EQ(loaded.distribution_id, "E1ABCDEFGHIJKL");
    EXPECT_EQ(loaded.invalidation_paths, s.invalidation_paths);
    EXPECT_FALSE(fs::exists(store.path().string() + ".tmp"));
}

TEST_F(JsonFileStoreTest, SavedFileIsOwnerOnly) {
    JsonFileStore store(dir / "settings.json");
    ASSERT_TRUE(store.save(Settings{}));

    const auto perms = fs::status(store.path()).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
}

TEST_F(JsonFileStoreTest, UnserializableValueFailsWithoutTouchingFile) {
    JsonFileStore store(dir / "settings.json");

    Settings good;
    good.region = "us-west-2";
    ASSERT_TRUE(store.save(good));

    Settings bad;
    bad.invalidation_paths = std::vector<std::string>{"/ok", "/\xff\xfe"};

    bool saved = true;
    EXPECT_NO_THROW(saved = store.save(bad));
    EXPECT_FALSE(saved);
    EXPECT_FALSE(fs::exists(store.path().string() + ".tmp"));
    EXPECT_EQ(store.load().region, "us-west-2");
}

TEST_F(JsonFileStoreTest, CorruptFileLoadsEmpty) {
    fs::create_directories(dir);
    std::ofstream(dir / "settings.json") << "{ not json";

    const JsonFileStore store(dir / "settings.json");
    EXPECT_FALSE(store.load().distribution_id.has_value());
}

TEST(MemoryStoreTest, LastSaveWins) {
    MemoryStore store;
    Settings a, b;
    a.region = "us-west-1";
    b.region = "us-west-2";

    EXPECT_TRUE(store.save(a));
    EXPECT_TRUE(store.save(b));
    EXPECT_EQ(store.load().region, "us-west-2");
    EXPECT_EQ(store.saveCount(), 2u);
}
