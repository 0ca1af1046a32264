#pragma once

#include <agroledger/core/types.h>
#include <chrono>
#include <string>

namespace agroledger::sync {

/**
 * @brief Connection settings for the remote backend
 *
 * Credentials come from SUPABASE_URL and SUPABASE_ANON_KEY (falling back to
 * SUPABASE_KEY); SUPABASE_SCHEMA is optional and defaults to "public".
 */
struct RemoteConfig {
    std::string url; ///< https://<project>.supabase.co, no trailing slash
    std::string apiKey;
    std::string schema{"public"};
    std::string ledgerTable{"lancamento"};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};

    static Result<RemoteConfig> fromEnvironment();

    /// Validate and normalize explicit values (ValidationError on malformed input)
    static Result<RemoteConfig> fromValues(const std::string& url, const std::string& apiKey,
                                           const std::string& schema = "public");

    /// Host part of url, e.g. "abc.supabase.co"
    std::string host() const;
};

} // namespace agroledger::sync
