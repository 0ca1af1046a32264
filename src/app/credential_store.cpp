#include <agroledger/app/credential_store.h>
#include <agroledger/core/json_file.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>

namespace agroledger::app {

namespace {

constexpr const char* kAdminKey = "admin_password";

bool sameDigest(const std::string& a, const std::string& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

CredentialStore::CredentialStore(std::filesystem::path adminFile, std::filesystem::path usersFile)
    : adminFile_(std::move(adminFile)), usersFile_(std::move(usersFile)) {}

Result<std::string> CredentialStore::sha256Hex(std::string_view text) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(),
                                                               &EVP_MD_CTX_free};
    if (!ctx)
        return Error{ErrorCode::InternalError, "Failed to create EVP_MD_CTX"};

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &hashLen) != 1) {
        return Error{ErrorCode::InternalError, "SHA-256 digest failed"};
    }

    std::string hex;
    hex.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; ++i)
        hex += fmt::format("{:02x}", hash[i]);
    return hex;
}

Result<void> CredentialStore::ensureAdmin() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureAdminLocked();
}

Result<void> CredentialStore::ensureAdminLocked() {
    std::error_code ec;
    if (std::filesystem::exists(adminFile_, ec))
        return {};

    auto digest = sha256Hex(kDefaultAdminPassword);
    if (!digest)
        return digest.error();
    if (auto r = writeJsonFile(adminFile_, nlohmann::json{{kAdminKey, digest.value()}}); !r)
        return r;
    spdlog::warn("[Credentials] Created {} with the default administrator password",
                 adminFile_.string());
    return {};
}

Result<bool> CredentialStore::verifyAdmin(const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = ensureAdminLocked(); !r)
        return r.error();

    auto admin = readJsonFile(adminFile_);
    if (!admin)
        return admin.error();
    const auto stored = admin.value().value(kAdminKey, std::string());
    if (stored.empty())
        return Error{ErrorCode::CorruptedData, "No administrator password in " + adminFile_.string()};

    auto digest = sha256Hex(password);
    if (!digest)
        return digest.error();
    return sameDigest(stored, digest.value());
}

Result<void> CredentialStore::changeAdminPassword(const std::string& current,
                                                  const std::string& next) {
    if (next.empty())
        return Error{ErrorCode::ValidationError, "New password must not be empty"};

    auto ok = verifyAdmin(current);
    if (!ok)
        return ok.error();
    if (!ok.value())
        return Error{ErrorCode::PermissionDenied, "Administrator password does not match"};

    auto digest = sha256Hex(next);
    if (!digest)
        return digest.error();

    std::lock_guard<std::mutex> lock(mutex_);
    return writeJsonFile(adminFile_, nlohmann::json{{kAdminKey, digest.value()}});
}

Result<void> CredentialStore::addUser(const std::string& username, const std::string& password) {
    if (username.empty() || password.empty())
        return Error{ErrorCode::ValidationError, "Username and password are required"};

    std::lock_guard<std::mutex> lock(mutex_);
    auto users = readJsonFile(usersFile_);
    if (!users)
        return users.error();
    if (users.value().contains(username))
        return Error{ErrorCode::InvalidOperation, "User already exists: " + username};

    auto digest = sha256Hex(password);
    if (!digest)
        return digest.error();
    users.value()[username] = digest.value();
    if (auto r = writeJsonFile(usersFile_, users.value()); !r)
        return r;
    spdlog::info("[Credentials] Added user {}", username);
    return {};
}

Result<bool> CredentialStore::verifyUser(const std::string& username, const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = readJsonFile(usersFile_);
    if (!users)
        return users.error();

    auto it = users.value().find(username);
    if (it == users.value().end() || !it->is_string())
        return false;

    auto digest = sha256Hex(password);
    if (!digest)
        return digest.error();
    return sameDigest(it->get<std::string>(), digest.value());
}

Result<void> CredentialStore::removeUser(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = readJsonFile(usersFile_);
    if (!users)
        return users.error();
    if (users.value().erase(username) == 0)
        return Error{ErrorCode::NotFound, "No such user: " + username};
    return writeJsonFile(usersFile_, users.value());
}

Result<std::vector<std::string>> CredentialStore::listUsers() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = readJsonFile(usersFile_);
    if (!users)
        return users.error();

    std::vector<std::string> names;
    for (auto it = users.value().begin(); it != users.value().end(); ++it)
        names.push_back(it.key());
    return names;
}

} // namespace agroledger::app
