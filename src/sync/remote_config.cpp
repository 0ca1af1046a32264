#include <agroledger/sync/remote_config.h>

#include <cstdlib>
#include <regex>
#include <string_view>

namespace agroledger::sync {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

Result<RemoteConfig> RemoteConfig::fromValues(const std::string& url, const std::string& apiKey,
                                              const std::string& schema) {
    static const std::regex kUrlPattern(R"(^https://[a-zA-Z0-9-]+\.supabase\.co/?$)");

    const std::string u = trimmed(url);
    const std::string k = trimmed(apiKey);
    if (u.empty() || k.empty()) {
        return Error{ErrorCode::ValidationError,
                     "SUPABASE_URL/SUPABASE_ANON_KEY (or SUPABASE_KEY) are not set"};
    }
    if (!std::regex_match(u, kUrlPattern)) {
        return Error{ErrorCode::ValidationError,
                     "Invalid SUPABASE_URL '" + u + "'; expected https://<project>.supabase.co"};
    }

    RemoteConfig config;
    config.url = u.back() == '/' ? u.substr(0, u.size() - 1) : u;
    config.apiKey = k;
    const std::string s = trimmed(schema);
    config.schema = s.empty() ? "public" : s;
    return config;
}

Result<RemoteConfig> RemoteConfig::fromEnvironment() {
    std::string key = envOrEmpty("SUPABASE_ANON_KEY");
    if (trimmed(key).empty())
        key = envOrEmpty("SUPABASE_KEY");
    return fromValues(envOrEmpty("SUPABASE_URL"), key, envOrEmpty("SUPABASE_SCHEMA"));
}

std::string RemoteConfig::host() const {
    constexpr std::string_view kScheme = "https://";
    std::string h = url;
    if (h.rfind(kScheme, 0) == 0)
        h = h.substr(kScheme.size());
    if (auto slash = h.find('/'); slash != std::string::npos)
        h = h.substr(0, slash);
    return h;
}

} // namespace agroledger::sync
