#pragma once

#include <agroledger/core/types.h>
#include <agroledger/lookup/tax_id.h>
#include <agroledger/net/http_client.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agroledger::lookup {

struct LookupOptions {
    std::string cnpjUrl{"https://www.receitaws.com.br/v1/cnpj/"};
    std::string cpfUrl{"https://www.receitaws.com.br/v1/cpf/"};
    int maxAttempts{4};
    std::chrono::milliseconds baseDelay{2000};
    std::chrono::milliseconds minInterval{1000};
    std::chrono::milliseconds requestTimeout{8000};
};

/**
 * @brief Taxpayer registry lookup with a persistent response cache
 *
 * Calls are spaced at least minInterval apart regardless of outcome. HTTP 429,
 * other non-2xx statuses and transport failures are retried with exponential
 * backoff (baseDelay * 2^attempt). When every attempt fails the rate-limit
 * sentinel is returned as the value; it is not cached.
 */
class IdentityLookup {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    IdentityLookup(std::shared_ptr<net::IHttpClient> http, std::filesystem::path cachePath,
                   LookupOptions options = {}, Clock clock = {}, Sleeper sleeper = {});

    /**
     * @brief Registry record for @p taxId
     *
     * ValidationError if the check digits do not match @p kind. Cached answers are
     * returned without a request.
     */
    Result<nlohmann::json> lookup(const std::string& taxId, TaxIdKind kind);

    /// lookup() with the kind taken from the digit count
    Result<nlohmann::json> lookup(const std::string& taxId);

    /// Display name from a registry record, or empty
    static std::string extractName(const nlohmann::json& record);

    static nlohmann::json rateLimitSentinel();
    static bool isSentinel(const nlohmann::json& record);

    [[nodiscard]] size_t cacheSize() const;

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::filesystem::path cachePath_;
    LookupOptions options_;
    Clock clock_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    nlohmann::json cache_;
    bool cacheLoaded_{false};
    std::optional<std::chrono::steady_clock::time_point> lastHit_;

    void loadCache();
    void waitForSpacing();
    std::optional<nlohmann::json> attempt(const std::string& url, int attemptNo);
};

} // namespace agroledger::lookup
