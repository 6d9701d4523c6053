#include <gtest/gtest.h>
#include "include/settings.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace netcheck::core;
namespace fs = std::filesystem;

namespace {

class TempDir {
    fs::path path_;

public:
    TempDir()
    {
        path_ = fs::temp_directory_path() /
                ("netcheck_settings_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    fs::path file(const std::string& name) const { return path_ / name; }
};

void write_file(const fs::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

}

TEST(SettingsStoreTests, Smoke_MissingFileCreatedWithDefaults)
{
    TempDir dir;
    auto path = dir.file("config.json");
    SettingsStore store(path);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_TRUE(fs::exists(path));

    std::ifstream in(path);
    auto on_disk = nlohmann::json::parse(in);
    EXPECT_EQ(on_disk, SettingsStore::defaults());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(settings.network.ping_count, 1);
    EXPECT_EQ(settings.network.timeout_sec, 5);
    EXPECT_EQ(settings.network.dns_servers, (std::vector<std::string>{"google.com", "8.8.8.8"}));
    // Outbound HTTP is opt-in.
    EXPECT_FALSE(settings.network.check_connectivity);
    EXPECT_EQ(settings.logging.level, "INFO");
    EXPECT_EQ(settings.logging.file, "netcheck.log");
    EXPECT_EQ(settings.logging.max_bytes, 1048576u);
    EXPECT_EQ(settings.logging.backup_count, 3u);
}

TEST(SettingsStoreTests, PartialSectionMergesOverDefaults)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"network": {"timeout": 10, "dns_servers": ["example.com"]}})");

    SettingsStore store(path);
    ASSERT_TRUE(store.load().has_value());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(settings.network.timeout_sec, 10);
    EXPECT_EQ(settings.network.ping_count, 1);
    EXPECT_EQ(settings.network.dns_servers, (std::vector<std::string>{"example.com"}));
    EXPECT_EQ(settings.logging.level, "INFO");
    // An existing file is never rewritten.
    std::ifstream in(path);
    EXPECT_FALSE(nlohmann::json::parse(in)["network"].contains("ping_count"));
}

TEST(SettingsStoreTests, ConnectivityCheckIsOptIn)
{
    EXPECT_EQ(SettingsStore::defaults()["network"]["check_connectivity"], false);

    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"network": {"check_connectivity": true}})");

    SettingsStore store(path);
    ASSERT_TRUE(store.load().has_value());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_TRUE(settings.network.check_connectivity);
}

TEST(SettingsStoreTests, UnknownSectionsKept)
{
    auto merged = SettingsStore::merge_with_defaults(
        nlohmann::json::parse(R"({"extra": {"a": 1}, "logging": {"level": "DEBUG"}})"));
    EXPECT_EQ(merged["extra"]["a"], 1);
    EXPECT_EQ(merged["logging"]["level"], "DEBUG");
    EXPECT_EQ(merged["logging"]["file"], "netcheck.log");
}

TEST(SettingsStoreTests, MalformedFileKeepsDefaults)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, "{ not json");

    SettingsStore store(path);
    auto loaded = store.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("Could not load config file"), std::string::npos);
    EXPECT_EQ(store.document(), SettingsStore::defaults());
}

TEST(SettingsStoreTests, NonObjectRootRejected)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, "[1, 2, 3]");

    SettingsStore store(path);
    EXPECT_FALSE(store.load().has_value());
    EXPECT_EQ(store.document(), SettingsStore::defaults());
}

TEST(SettingsStoreTests, InvalidValuesFallBackWithWarnings)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({
        "network": {
            "ping_count": 0,
            "timeout": "fast",
            "dns_servers": [],
            "check_connectivity": "yes"
        },
        "logging": {"level": "", "max_bytes": -5}
    })");

    SettingsStore store(path);
    ASSERT_TRUE(store.load().has_value());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    EXPECT_EQ(warnings.size(), 6u);
    EXPECT_EQ(settings.network.ping_count, 1);
    EXPECT_EQ(settings.network.timeout_sec, 5);
    EXPECT_EQ(settings.network.dns_servers.size(), 2u);
    EXPECT_FALSE(settings.network.check_connectivity);
    EXPECT_EQ(settings.logging.level, "INFO");
    EXPECT_EQ(settings.logging.max_bytes, 1048576u);
}

TEST(SettingsStoreTests, DuplicateDnsServersDropped)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"network": {"dns_servers": ["a.example", "b.example", "a.example"]}})");

    SettingsStore store(path);
    ASSERT_TRUE(store.load().has_value());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    EXPECT_EQ(settings.network.dns_servers, (std::vector<std::string>{"a.example", "b.example"}));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("a.example"), std::string::npos);
}

TEST(SettingsStoreTests, SectionOfWrongTypeWarns)
{
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"network": 42})");

    SettingsStore store(path);
    ASSERT_TRUE(store.load().has_value());

    std::vector<std::string> warnings;
    auto settings = store.snapshot(warnings);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("network"), std::string::npos);
    EXPECT_EQ(settings.network.timeout_sec, 5);
}
