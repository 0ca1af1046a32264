#pragma once

#include <agroledger/core/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace agroledger::app {

/**
 * @brief At most one compressed copy of the store file per calendar day
 *
 * Artifacts are backup_YYYYmmdd-HHMMSS.db.zst in the backup directory. The last
 * archive date (local time, YYYY-MM-DD) is kept in a small JSON state file.
 */
class DailyArchiver {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Options {
        std::filesystem::path source;
        std::filesystem::path backupDir;
        std::filesystem::path statePath;
        int compressionLevel{3};
    };

    explicit DailyArchiver(Options options, Clock clock = {});

    /**
     * @brief Archive the store unless that already happened today
     *
     * Returns the artifact path, or nullopt when skipped (archived today, or the
     * source file does not exist).
     */
    Result<std::optional<std::filesystem::path>> runIfDue();

    static Result<void> compressFile(const std::filesystem::path& source,
                                     const std::filesystem::path& target, int level);
    static Result<void> decompressFile(const std::filesystem::path& source,
                                       const std::filesystem::path& target);

private:
    Options options_;
    Clock clock_;
};

/// Local-time strftime of @p tp
std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* pattern);

} // namespace agroledger::app
