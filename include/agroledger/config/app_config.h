#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace agroledger::config {

/**
 * @brief Settings read from config.toml
 *
 * Environment overrides: AGROLEDGER_DATA_DIR, AGROLEDGER_PROFILE, SUPABASE_SCHEMA.
 * Remote credentials are never read from the file.
 */
struct AppConfig {
    std::filesystem::path dataDir;
    std::string profile{"default"};

    std::string remoteSchema{"public"};
    std::string remoteTable{"lancamento"};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};

    int lookupMaxAttempts{4};
    std::chrono::milliseconds lookupBaseDelay{2000};
    std::chrono::milliseconds lookupMinInterval{1000};

    size_t dispatchThreads{2};
    size_t maxPending{256};

    std::string logLevel{"info"};

    /// Defaults, then @p configPath (missing file is fine), then the environment
    static AppConfig load(const std::filesystem::path& configPath);

    /// <data>/<profile>/data/ledger.db
    std::filesystem::path storePath() const;
    /// <data>/<profile>/backups
    std::filesystem::path backupDir() const;
    std::filesystem::path lookupCachePath() const;
    std::filesystem::path backupStatePath() const;
    std::filesystem::path adminFilePath() const;
    std::filesystem::path usersFilePath() const;
};

} // namespace agroledger::config
