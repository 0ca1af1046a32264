#pragma once

#include <agroledger/core/types.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace agroledger {

/// Parse a JSON file; a missing file yields @p fallback, a malformed one CorruptedData
Result<nlohmann::json> readJsonFile(const std::filesystem::path& path,
                                    nlohmann::json fallback = nlohmann::json::object());

/// Write through <path>.tmp and rename over @p path; parent directories are created
Result<void> writeJsonFile(const std::filesystem::path& path, const nlohmann::json& value);

} // namespace agroledger
