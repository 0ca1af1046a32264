#pragma once

#include <agroledger/net/http_client.h>
#include <agroledger/sync/remote_client.h>
#include <agroledger/sync/remote_config.h>
#include <memory>
#include <string>

namespace agroledger::sync {

/**
 * @brief RemoteClient speaking PostgREST (/rest/v1) and GoTrue (/auth/v1) over HTTP
 */
class PostgrestClient final : public RemoteClient {
public:
    PostgrestClient(RemoteConfig config, std::shared_ptr<net::IHttpClient> http);
    ~PostgrestClient() override = default;

    Result<nlohmann::json> select(const SelectQuery& query) override;
    Result<nlohmann::json> upsert(const std::string& table, const nlohmann::json& rows,
                                  const std::string& onConflict) override;
    Result<nlohmann::json> update(const std::string& table, const nlohmann::json& patch,
                                  const std::vector<QueryFilter>& filters) override;
    Result<void> remove(const std::string& table, const std::vector<QueryFilter>& filters) override;
    Result<nlohmann::json> rpc(const std::string& function, const nlohmann::json& args) override;
    Result<nlohmann::json> signInWithPassword(const std::string& email,
                                              const std::string& password) override;
    Result<void> signOut() override;

    /// Query string for @p filters, without the leading '?'
    static std::string encodeFilters(const std::vector<QueryFilter>& filters);

private:
    RemoteConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    std::string accessToken_;

    std::vector<net::Header> baseHeaders(bool writes) const;
    Result<nlohmann::json> perform(net::HttpRequest request, const char* what);
};

std::unique_ptr<RemoteClient> makePostgrestClient(RemoteConfig config,
                                                  std::shared_ptr<net::IHttpClient> http);

} // namespace agroledger::sync
