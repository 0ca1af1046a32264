#include <agroledger/app/daily_archiver.h>
#include <agroledger/core/json_file.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <zstd.h>

#include <ctime>
#include <fstream>
#include <memory>
#include <vector>

namespace agroledger::app {

namespace {

Error makeZstdError(const char* operation, size_t code) {
    return Error{ErrorCode::CompressionError,
                 fmt::format("{} failed: {}", operation, ZSTD_getErrorName(code))};
}

} // namespace

std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* pattern) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), pattern, &local) == 0) {
        return {};
    }
    return std::string(buf);
}

DailyArchiver::DailyArchiver(Options options, Clock clock)
    : options_(std::move(options)), clock_(std::move(clock)) {
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };
}

Result<std::optional<std::filesystem::path>> DailyArchiver::runIfDue() {
    using Skipped = std::optional<std::filesystem::path>;

    const auto now = clock_();
    const std::string today = formatLocalTime(now, "%Y-%m-%d");

    auto state = readJsonFile(options_.statePath);
    if (!state) {
        // Unreadable state is treated as never archived
        spdlog::warn("[Archiver] {}; starting from empty state", state.error().message);
        state = nlohmann::json::object();
    }
    auto& stateValue = state.value();
    if (!stateValue.is_object())
        stateValue = nlohmann::json::object();

    if (stateValue.value("last_backup_date", std::string()) == today) {
        spdlog::debug("[Archiver] Already archived on {}", today);
        return Skipped{};
    }

    std::error_code ec;
    if (!std::filesystem::exists(options_.source, ec)) {
        spdlog::debug("[Archiver] No store at {}, nothing to archive", options_.source.string());
        return Skipped{};
    }

    std::filesystem::create_directories(options_.backupDir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create " + options_.backupDir.string() + ": " + ec.message()};
    }

    const auto target =
        options_.backupDir / ("backup_" + formatLocalTime(now, "%Y%m%d-%H%M%S") + ".db.zst");
    if (auto r = compressFile(options_.source, target, options_.compressionLevel); !r) {
        std::filesystem::remove(target, ec);
        return r.error();
    }

    stateValue["last_backup_date"] = today;
    if (auto r = writeJsonFile(options_.statePath, stateValue); !r)
        return r.error();

    spdlog::info("[Archiver] Archived {} to {}", options_.source.string(), target.string());
    return Skipped{target};
}

Result<void> DailyArchiver::compressFile(const std::filesystem::path& source,
                                         const std::filesystem::path& target, int level) {
    std::ifstream in(source, std::ios::binary);
    if (!in)
        return Error{ErrorCode::FileNotFound, "Cannot open " + source.string()};
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::WriteError, "Cannot create " + target.string()};

    std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> cctx{ZSTD_createCCtx(), &ZSTD_freeCCtx};
    if (!cctx)
        return Error{ErrorCode::CompressionError, "Failed to create compression context"};
    if (auto rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level);
        ZSTD_isError(rc))
        return makeZstdError("ZSTD_CCtx_setParameter", rc);
    if (auto rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1); ZSTD_isError(rc))
        return makeZstdError("ZSTD_CCtx_setParameter", rc);

    std::vector<char> inBuf(ZSTD_CStreamInSize());
    std::vector<char> outBuf(ZSTD_CStreamOutSize());

    bool last = false;
    while (!last) {
        in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (in.bad())
            return Error{ErrorCode::CorruptedData, "Read failed on " + source.string()};
        last = in.eof();

        const ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_continue;
        ZSTD_inBuffer input{inBuf.data(), got, 0};
        size_t remaining = 0;
        do {
            ZSTD_outBuffer output{outBuf.data(), outBuf.size(), 0};
            remaining = ZSTD_compressStream2(cctx.get(), &output, &input, mode);
            if (ZSTD_isError(remaining))
                return makeZstdError("ZSTD_compressStream2", remaining);
            out.write(outBuf.data(), static_cast<std::streamsize>(output.pos));
        } while (last ? remaining > 0 : input.pos < input.size);
    }

    out.close();
    if (!out)
        return Error{ErrorCode::WriteError, "Write failed on " + target.string()};
    return {};
}

Result<void> DailyArchiver::decompressFile(const std::filesystem::path& source,
                                           const std::filesystem::path& target) {
    std::ifstream in(source, std::ios::binary);
    if (!in)
        return Error{ErrorCode::FileNotFound, "Cannot open " + source.string()};
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::WriteError, "Cannot create " + target.string()};

    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx{ZSTD_createDCtx(), &ZSTD_freeDCtx};
    if (!dctx)
        return Error{ErrorCode::CompressionError, "Failed to create decompression context"};

    std::vector<char> inBuf(ZSTD_DStreamInSize());
    std::vector<char> outBuf(ZSTD_DStreamOutSize());
    size_t lastResult = 0;
    bool sawInput = false;

    while (in) {
        in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (got == 0)
            break;
        sawInput = true;

        ZSTD_inBuffer input{inBuf.data(), got, 0};
        while (input.pos < input.size) {
            ZSTD_outBuffer output{outBuf.data(), outBuf.size(), 0};
            lastResult = ZSTD_decompressStream(dctx.get(), &output, &input);
            if (ZSTD_isError(lastResult))
                return makeZstdError("ZSTD_decompressStream", lastResult);
            out.write(outBuf.data(), static_cast<std::streamsize>(output.pos));
        }
    }

    if (!sawInput || lastResult != 0)
        return Error{ErrorCode::CorruptedData, "Truncated archive " + source.string()};
    out.close();
    if (!out)
        return Error{ErrorCode::WriteError, "Write failed on " + target.string()};
    return {};
}

} // namespace agroledger::app
