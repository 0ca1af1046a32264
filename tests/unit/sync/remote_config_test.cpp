#include <gtest/gtest.h>
#include <agroledger/sync/remote_config.h>

#include "common/test_helpers.h"

using namespace agroledger;
using namespace agroledger::sync;
using agroledger::tests::ScopedEnv;

TEST(RemoteConfigTest, ReadsEnvironment) {
    ScopedEnv url("SUPABASE_URL", std::string("https://abcd1234.supabase.co/"));
    ScopedEnv anon("SUPABASE_ANON_KEY", std::string(" anon-key "));
    ScopedEnv key("SUPABASE_KEY", std::nullopt);
    ScopedEnv schema("SUPABASE_SCHEMA", std::nullopt);

    auto config = RemoteConfig::fromEnvironment();
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config.value().url, "https://abcd1234.supabase.co");
    EXPECT_EQ(config.value().apiKey, "anon-key");
    EXPECT_EQ(config.value().schema, "public");
    EXPECT_EQ(config.value().host(), "abcd1234.supabase.co");
}

TEST(RemoteConfigTest, FallsBackToServiceKeyAndSchema) {
    ScopedEnv url("SUPABASE_URL", std::string("https://farm-01.supabase.co"));
    ScopedEnv anon("SUPABASE_ANON_KEY", std::nullopt);
    ScopedEnv key("SUPABASE_KEY", std::string("fallback"));
    ScopedEnv schema("SUPABASE_SCHEMA", std::string("ledger"));

    auto config = RemoteConfig::fromEnvironment();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().apiKey, "fallback");
    EXPECT_EQ(config.value().schema, "ledger");
}

TEST(RemoteConfigTest, MissingCredentialsAreFatal) {
    ScopedEnv url("SUPABASE_URL", std::nullopt);
    ScopedEnv anon("SUPABASE_ANON_KEY", std::nullopt);
    ScopedEnv key("SUPABASE_KEY", std::nullopt);

    auto config = RemoteConfig::fromEnvironment();
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ValidationError);
}

TEST(RemoteConfigTest, RejectsMalformedUrls) {
    for (const char* bad : {"http://abc.supabase.co", "https://abc.example.com",
                            "https://abc.supabase.co/rest/v1", "abc.supabase.co",
                            "https://a_b.supabase.co"}) {
        auto config = RemoteConfig::fromValues(bad, "key");
        EXPECT_FALSE(config.has_value()) << bad;
    }
    EXPECT_TRUE(RemoteConfig::fromValues("https://Abc-9.supabase.co", "key").has_value());
}
