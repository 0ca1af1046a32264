#include <agroledger/config/config_helpers.h>

#include <fstream>

namespace agroledger::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless inside a quoted value
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if ((currentSection == section && k == key) || k == section + "." + key) {
            return unquote(v);
        }
    }

    return "";
}

std::optional<int64_t> parse_config_int(const std::filesystem::path& config_path,
                                        const std::string& section, const std::string& key) {
    auto raw = parse_config_value(config_path, section, key);
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        auto value = std::stoll(raw, &used);
        if (used != raw.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("AGROLEDGER_CONFIG")) {
        return expand_tilde(*env);
    }

    std::filesystem::path configHome;
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        configHome = *xdg;
    } else if (auto home = env_value("HOME")) {
        configHome = std::filesystem::path(*home) / ".config";
    } else {
        return std::filesystem::path("agroledger") / "config.toml";
    }
    return configHome / "agroledger" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "agroledger";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "agroledger";
    }
    return std::filesystem::current_path() / "agroledger_data";
}

} // namespace agroledger::config
