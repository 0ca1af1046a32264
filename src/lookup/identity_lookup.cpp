#include <agroledger/core/json_file.h>
#include <agroledger/lookup/identity_lookup.h>
#include <agroledger/store/ledger_store.h>

#include <spdlog/spdlog.h>

#include <array>
#include <thread>

namespace agroledger::lookup {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

IdentityLookup::IdentityLookup(std::shared_ptr<net::IHttpClient> http,
                               std::filesystem::path cachePath, LookupOptions options, Clock clock,
                               Sleeper sleeper)
    : http_(std::move(http)), cachePath_(std::move(cachePath)), options_(std::move(options)),
      clock_(std::move(clock)), sleeper_(std::move(sleeper)), cache_(nlohmann::json::object()) {
    if (!clock_)
        clock_ = [] { return std::chrono::steady_clock::now(); };
    if (!sleeper_)
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    if (options_.maxAttempts < 1)
        options_.maxAttempts = 1;
}

nlohmann::json IdentityLookup::rateLimitSentinel() {
    return nlohmann::json{{"status", "ERROR"}, {"message", "RATE_LIMIT_OR_NETWORK"}};
}

bool IdentityLookup::isSentinel(const nlohmann::json& record) {
    return record == rateLimitSentinel();
}

std::string IdentityLookup::extractName(const nlohmann::json& record) {
    if (!record.is_object())
        return {};
    static const std::array<const char*, 6> keys{"nome",        "razao_social", "razaosocial",
                                                 "razaoSocial", "fantasia",     "nome_fantasia"};
    for (const char* key : keys) {
        auto it = record.find(key);
        if (it == record.end() || !it->is_string())
            continue;
        auto name = trim(it->get<std::string>());
        if (!name.empty())
            return name;
    }
    return {};
}

void IdentityLookup::loadCache() {
    if (cacheLoaded_)
        return;
    cacheLoaded_ = true;
    auto loaded = readJsonFile(cachePath_);
    if (!loaded) {
        spdlog::warn("[Lookup] Ignoring unreadable cache {}: {}", cachePath_.string(),
                     loaded.error().message);
        return;
    }
    if (loaded.value().is_object())
        cache_ = std::move(loaded).value();
}

size_t IdentityLookup::cacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void IdentityLookup::waitForSpacing() {
    if (!lastHit_)
        return;
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - *lastHit_);
    if (elapsed < options_.minInterval)
        sleeper_(options_.minInterval - elapsed);
}

std::optional<nlohmann::json> IdentityLookup::attempt(const std::string& url, int attemptNo) {
    waitForSpacing();

    net::HttpRequest request;
    request.method = net::HttpMethod::Get;
    request.url = url;
    request.headers.push_back({"Accept", "application/json"});
    request.timeout = options_.requestTimeout;

    auto response = http_->send(request);
    lastHit_ = clock_();

    if (!response) {
        spdlog::warn("[Lookup] Attempt {}/{} failed: {}", attemptNo + 1, options_.maxAttempts,
                     response.error().message);
        return std::nullopt;
    }
    if (response.value().status == 429) {
        spdlog::warn("[Lookup] Attempt {}/{} rate limited", attemptNo + 1, options_.maxAttempts);
        return std::nullopt;
    }
    if (!response.value().ok()) {
        spdlog::warn("[Lookup] Attempt {}/{} returned HTTP {}", attemptNo + 1, options_.maxAttempts,
                     response.value().status);
        return std::nullopt;
    }

    auto body = nlohmann::json::parse(response.value().body, nullptr, false);
    if (body.is_discarded()) {
        spdlog::warn("[Lookup] Attempt {}/{} returned a non-JSON body", attemptNo + 1,
                     options_.maxAttempts);
        return std::nullopt;
    }
    return body;
}

Result<nlohmann::json> IdentityLookup::lookup(const std::string& taxId) {
    auto kind = detectTaxIdKind(taxId);
    if (!kind)
        return Error{ErrorCode::ValidationError, "Not a CPF or CNPJ: " + taxId};
    return lookup(taxId, *kind);
}

Result<nlohmann::json> IdentityLookup::lookup(const std::string& taxId, TaxIdKind kind) {
    const auto digits = store::digitsOnly(taxId);
    if (!isValidTaxId(digits, kind)) {
        return Error{ErrorCode::ValidationError,
                     std::string("Invalid ") + taxIdKindName(kind) + ": " + taxId};
    }
    if (!http_)
        return Error{ErrorCode::NotInitialized, "No HTTP client for lookups"};

    std::lock_guard<std::mutex> lock(mutex_);
    loadCache();

    const std::string key = std::string(taxIdKindName(kind)) + ":" + digits;
    if (auto it = cache_.find(key); it != cache_.end()) {
        spdlog::debug("[Lookup] Cache hit for {}", key);
        return *it;
    }

    const std::string url = (kind == TaxIdKind::Cpf ? options_.cpfUrl : options_.cnpjUrl) + digits;
    for (int i = 0; i < options_.maxAttempts; ++i) {
        if (auto record = attempt(url, i)) {
            cache_[key] = *record;
            if (auto saved = writeJsonFile(cachePath_, cache_); !saved) {
                spdlog::warn("[Lookup] Could not persist cache: {}", saved.error().message);
            }
            return std::move(*record);
        }
        if (i + 1 < options_.maxAttempts)
            sleeper_(options_.baseDelay * (1 << i));
    }

    spdlog::error("[Lookup] Giving up on {} after {} attempts", key, options_.maxAttempts);
    return rateLimitSentinel();
}

} // namespace agroledger::lookup
