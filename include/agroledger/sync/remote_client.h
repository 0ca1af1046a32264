#pragma once

#include <agroledger/core/types.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agroledger::sync {

/**
 * @brief Row filter in PostgREST operator form, e.g. {"id", "eq", "7"}
 */
struct QueryFilter {
    std::string column;
    std::string op;
    std::string value;
};

QueryFilter eq(const std::string& column, const std::string& value);
QueryFilter gte(const std::string& column, const std::string& value);
QueryFilter lte(const std::string& column, const std::string& value);
QueryFilter in(const std::string& column, const std::vector<std::string>& values);

struct SelectQuery {
    std::string table;
    std::string columns{"*"};
    std::vector<QueryFilter> filters;
    std::vector<std::pair<std::string, bool>> order; ///< column, descending
    std::optional<int> limit;
};

/**
 * @brief Authenticated session against the remote backend
 *
 * Instances are not thread-safe; SyncBridge owns the single session and only ever
 * touches it from its worker thread.
 */
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    /// Rows as a JSON array
    virtual Result<nlohmann::json> select(const SelectQuery& query) = 0;

    /// Insert-or-merge keyed by @p onConflict; returns the stored representation
    virtual Result<nlohmann::json> upsert(const std::string& table, const nlohmann::json& rows,
                                          const std::string& onConflict) = 0;

    virtual Result<nlohmann::json> update(const std::string& table, const nlohmann::json& patch,
                                          const std::vector<QueryFilter>& filters) = 0;

    virtual Result<void> remove(const std::string& table,
                                const std::vector<QueryFilter>& filters) = 0;

    virtual Result<nlohmann::json> rpc(const std::string& function, const nlohmann::json& args) = 0;

    /// Password sign-in; later requests carry the returned access token
    virtual Result<nlohmann::json> signInWithPassword(const std::string& email,
                                                      const std::string& password) = 0;

    virtual Result<void> signOut() = 0;
};

} // namespace agroledger::sync
