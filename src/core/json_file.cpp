#include <agroledger/core/json_file.h>

#include <fstream>

namespace agroledger {

Result<nlohmann::json> readJsonFile(const std::filesystem::path& path, nlohmann::json fallback) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return fallback;

    std::ifstream ifs(path);
    if (!ifs)
        return Error{ErrorCode::PermissionDenied, "Cannot read " + path.string()};

    auto value = nlohmann::json::parse(ifs, nullptr, false);
    if (value.is_discarded())
        return Error{ErrorCode::CorruptedData, "Malformed JSON in " + path.string()};
    return value;
}

Result<void> writeJsonFile(const std::filesystem::path& path, const nlohmann::json& value) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return Error{ErrorCode::WriteError,
                         "Cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs)
            return Error{ErrorCode::WriteError, "Cannot write " + tempPath.string()};
        ofs << value.dump(2);
        ofs.close();
        if (!ofs)
            return Error{ErrorCode::WriteError, "Short write to " + tempPath.string()};
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::filesystem::remove(tempPath, ec);
        return Error{ErrorCode::WriteError, "Cannot replace " + path.string()};
    }
    return {};
}

} // namespace agroledger
