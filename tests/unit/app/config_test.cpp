#include <gtest/gtest.h>
#include <agroledger/config/app_config.h>
#include <agroledger/config/config_helpers.h>

#include "common/test_helpers.h"

#include <filesystem>

using namespace agroledger;
using namespace agroledger::config;
using agroledger::tests::ScopedEnv;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = tests::make_temp_dir("agroledger_config_"); }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, ParsesSectionsDottedKeysAndComments) {
    auto path = tests::write_file(dir_ / "config.toml", R"(
# top comment
[store]
data_dir = "/srv/ledger"   
profile = farm-a # trailing comment

[remote]
table = 'lancamento_v2'
remote.schema = ignored
realtime.max_pending = 64
)");

    EXPECT_EQ(parse_config_value(path, "store", "data_dir"), "/srv/ledger");
    EXPECT_EQ(parse_config_value(path, "store", "profile"), "farm-a");
    EXPECT_EQ(parse_config_value(path, "remote", "table"), "lancamento_v2");
    EXPECT_EQ(parse_config_value(path, "realtime", "max_pending"), "64");
    EXPECT_EQ(parse_config_value(path, "store", "missing"), "");
    EXPECT_EQ(parse_config_int(path, "realtime", "max_pending"), 64);
    EXPECT_FALSE(parse_config_int(path, "store", "profile").has_value());
    EXPECT_EQ(parse_config_value(dir_ / "absent.toml", "store", "profile"), "");
}

TEST_F(ConfigTest, LoadAppliesFileThenEnvironment) {
    ScopedEnv dataDir("AGROLEDGER_DATA_DIR", std::nullopt);
    ScopedEnv profile("AGROLEDGER_PROFILE", std::string("env-profile"));
    ScopedEnv schema("SUPABASE_SCHEMA", std::nullopt);

    auto path = tests::write_file(dir_ / "config.toml", R"(
[store]
data_dir = ")" + (dir_ / "data").string() + R"("
profile = file-profile

[remote]
schema = ledger
request_timeout_ms = 5000

[lookup]
max_attempts = 6
base_delay_ms = -5

[realtime]
dispatch_threads = 3

[logging]
level = debug
)");

    auto cfg = AppConfig::load(path);
    EXPECT_EQ(cfg.dataDir, dir_ / "data");
    EXPECT_EQ(cfg.profile, "env-profile");
    EXPECT_EQ(cfg.remoteSchema, "ledger");
    EXPECT_EQ(cfg.remoteTable, "lancamento");
    EXPECT_EQ(cfg.requestTimeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.lookupMaxAttempts, 6);
    EXPECT_EQ(cfg.lookupBaseDelay, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.dispatchThreads, 3u);
    EXPECT_EQ(cfg.maxPending, 256u);
    EXPECT_EQ(cfg.logLevel, "debug");

    EXPECT_EQ(cfg.storePath(), dir_ / "data" / "env-profile" / "data" / "ledger.db");
    EXPECT_EQ(cfg.backupDir(), dir_ / "data" / "env-profile" / "backups");
    EXPECT_EQ(cfg.adminFilePath(), dir_ / "data" / "admin.json");
}

TEST_F(ConfigTest, EnvironmentOverridesWithoutFile) {
    ScopedEnv dataDir("AGROLEDGER_DATA_DIR", (dir_ / "env").string());
    ScopedEnv profile("AGROLEDGER_PROFILE", std::nullopt);
    ScopedEnv schema("SUPABASE_SCHEMA", std::string("audit"));

    auto cfg = AppConfig::load(dir_ / "missing.toml");
    EXPECT_EQ(cfg.dataDir, dir_ / "env");
    EXPECT_EQ(cfg.profile, "default");
    EXPECT_EQ(cfg.remoteSchema, "audit");
    EXPECT_EQ(cfg.lookupCachePath(), dir_ / "env" / "lookup_cache.json");
}

TEST_F(ConfigTest, ConfigPathResolution) {
    ScopedEnv explicitPath("AGROLEDGER_CONFIG", std::nullopt);
    ScopedEnv xdg("XDG_CONFIG_HOME", (dir_ / "xdg").string());
    EXPECT_EQ(get_config_path(), dir_ / "xdg" / "agroledger" / "config.toml");
    EXPECT_EQ(get_config_path("/etc/agroledger.toml"), std::filesystem::path("/etc/agroledger.toml"));

    ScopedEnv fromEnv("AGROLEDGER_CONFIG", (dir_ / "custom.toml").string());
    EXPECT_EQ(get_config_path(), dir_ / "custom.toml");
}

TEST(ConfigHelpersTest, StringHelpers) {
    EXPECT_EQ(unquote("  \"quoted\"  "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");

    ScopedEnv home("HOME", std::string("/home/farmer"));
    EXPECT_EQ(expand_tilde("~/ledger"), std::filesystem::path("/home/farmer/ledger"));
    EXPECT_EQ(expand_tilde("~other/x"), std::filesystem::path("~other/x"));
}
