#pragma once

#include <agroledger/core/types.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace agroledger::app {

/**
 * @brief Local administrator and user passwords, stored as SHA-256 hex digests
 *
 * admin.json holds {"admin_password": <hex>} and is created with the default
 * password "admin" on first use. users.json maps usernames to digests.
 */
class CredentialStore {
public:
    static constexpr const char* kDefaultAdminPassword = "admin";

    CredentialStore(std::filesystem::path adminFile, std::filesystem::path usersFile);

    /// Create admin.json with the default password if it does not exist
    Result<void> ensureAdmin();

    Result<bool> verifyAdmin(const std::string& password);
    Result<void> changeAdminPassword(const std::string& current, const std::string& next);

    /// InvalidOperation if @p username is taken
    Result<void> addUser(const std::string& username, const std::string& password);
    Result<bool> verifyUser(const std::string& username, const std::string& password);
    Result<void> removeUser(const std::string& username);
    Result<std::vector<std::string>> listUsers();

    /// Lowercase hex SHA-256 of @p text
    static Result<std::string> sha256Hex(std::string_view text);

private:
    std::filesystem::path adminFile_;
    std::filesystem::path usersFile_;
    std::mutex mutex_;

    Result<void> ensureAdminLocked();
};

} // namespace agroledger::app
