#include <agroledger/config/app_config.h>
#include <agroledger/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace agroledger::config {

namespace {

void readString(const std::filesystem::path& path, const char* section, const char* key,
                std::string& out) {
    if (auto v = parse_config_value(path, section, key); !v.empty())
        out = v;
}

template <typename T>
void readNumber(const std::filesystem::path& path, const char* section, const char* key, T& out) {
    auto v = parse_config_int(path, section, key);
    if (!v)
        return;
    if (*v < 0) {
        spdlog::warn("Ignoring negative {}.{} in {}", section, key, path.string());
        return;
    }
    out = static_cast<T>(*v);
}

void readMillis(const std::filesystem::path& path, const char* section, const char* key,
                std::chrono::milliseconds& out) {
    int64_t ms = out.count();
    readNumber(path, section, key, ms);
    out = std::chrono::milliseconds(ms);
}

} // namespace

AppConfig AppConfig::load(const std::filesystem::path& configPath) {
    AppConfig cfg;
    cfg.dataDir = get_data_dir();

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        spdlog::debug("Reading configuration from {}", configPath.string());
        std::string dataDir;
        readString(configPath, "store", "data_dir", dataDir);
        if (!dataDir.empty())
            cfg.dataDir = expand_tilde(dataDir);
        readString(configPath, "store", "profile", cfg.profile);

        readString(configPath, "remote", "schema", cfg.remoteSchema);
        readString(configPath, "remote", "table", cfg.remoteTable);
        readMillis(configPath, "remote", "request_timeout_ms", cfg.requestTimeout);

        readNumber(configPath, "lookup", "max_attempts", cfg.lookupMaxAttempts);
        readMillis(configPath, "lookup", "base_delay_ms", cfg.lookupBaseDelay);
        readMillis(configPath, "lookup", "min_interval_ms", cfg.lookupMinInterval);

        readNumber(configPath, "realtime", "dispatch_threads", cfg.dispatchThreads);
        readNumber(configPath, "realtime", "max_pending", cfg.maxPending);

        readString(configPath, "logging", "level", cfg.logLevel);
    }

    if (auto env = env_value("AGROLEDGER_DATA_DIR"))
        cfg.dataDir = expand_tilde(*env);
    if (auto env = env_value("AGROLEDGER_PROFILE"))
        cfg.profile = *env;
    if (auto env = env_value("SUPABASE_SCHEMA"))
        cfg.remoteSchema = *env;

    return cfg;
}

std::filesystem::path AppConfig::storePath() const {
    return dataDir / profile / "data" / "ledger.db";
}

std::filesystem::path AppConfig::backupDir() const {
    return dataDir / profile / "backups";
}

std::filesystem::path AppConfig::lookupCachePath() const {
    return dataDir / "lookup_cache.json";
}

std::filesystem::path AppConfig::backupStatePath() const {
    return dataDir / "backup_state.json";
}

std::filesystem::path AppConfig::adminFilePath() const {
    return dataDir / "admin.json";
}

std::filesystem::path AppConfig::usersFilePath() const {
    return dataDir / "users.json";
}

} // namespace agroledger::config
