#include <agroledger/sync/postgrest_client.h>

#include <spdlog/spdlog.h>

namespace agroledger::sync {

namespace {

std::string quoteInValue(const std::string& v) {
    if (v.find_first_of(",()\" ") == std::string::npos)
        return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string describeFailure(const net::HttpResponse& response) {
    std::string detail = response.body;
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (const char* key : {"message", "msg", "error_description", "error"}) {
            if (parsed.contains(key) && parsed[key].is_string()) {
                detail = parsed[key].get<std::string>();
                break;
            }
        }
    }
    return "HTTP " + std::to_string(response.status) + ": " + detail;
}

} // namespace

QueryFilter eq(const std::string& column, const std::string& value) {
    return QueryFilter{column, "eq", value};
}

QueryFilter gte(const std::string& column, const std::string& value) {
    return QueryFilter{column, "gte", value};
}

QueryFilter lte(const std::string& column, const std::string& value) {
    return QueryFilter{column, "lte", value};
}

QueryFilter in(const std::string& column, const std::vector<std::string>& values) {
    std::string list = "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            list += ",";
        list += quoteInValue(values[i]);
    }
    list += ")";
    return QueryFilter{column, "in", list};
}

PostgrestClient::PostgrestClient(RemoteConfig config, std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

std::string PostgrestClient::encodeFilters(const std::vector<QueryFilter>& filters) {
    std::string qs;
    for (const auto& f : filters) {
        if (!qs.empty())
            qs += "&";
        qs += net::urlEncode(f.column) + "=" + f.op + "." + net::urlEncode(f.value);
    }
    return qs;
}

std::vector<net::Header> PostgrestClient::baseHeaders(bool writes) const {
    const std::string& bearer = accessToken_.empty() ? config_.apiKey : accessToken_;
    std::vector<net::Header> headers = {
        {"apikey", config_.apiKey},
        {"Authorization", "Bearer " + bearer},
        {"Accept", "application/json"},
        {"Accept-Profile", config_.schema},
    };
    if (writes) {
        headers.push_back({"Content-Type", "application/json"});
        headers.push_back({"Content-Profile", config_.schema});
    }
    return headers;
}

Result<nlohmann::json> PostgrestClient::perform(net::HttpRequest request, const char* what) {
    request.timeout = config_.requestTimeout;
    auto response = http_->send(request);
    if (!response) {
        return Error{response.error().code,
                     std::string(what) + " failed: " + response.error().message};
    }

    const auto& r = response.value();
    if (r.status >= 400) {
        spdlog::debug("[Remote] {} rejected: {}", what, describeFailure(r));
        return Error{ErrorCode::RemoteOperationFailed,
                     std::string(what) + " failed: " + describeFailure(r)};
    }
    if (r.body.empty())
        return nlohmann::json();

    auto parsed = nlohmann::json::parse(r.body, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, std::string(what) + " returned malformed JSON"};
    }
    return parsed;
}

Result<nlohmann::json> PostgrestClient::select(const SelectQuery& query) {
    std::string qs = "select=" + net::urlEncode(query.columns);
    if (auto filters = encodeFilters(query.filters); !filters.empty())
        qs += "&" + filters;
    if (!query.order.empty()) {
        qs += "&order=";
        for (size_t i = 0; i < query.order.size(); ++i) {
            if (i > 0)
                qs += ",";
            qs += query.order[i].first + (query.order[i].second ? ".desc" : ".asc");
        }
    }
    if (query.limit)
        qs += "&limit=" + std::to_string(*query.limit);

    net::HttpRequest request;
    request.method = net::HttpMethod::Get;
    request.url = config_.url + "/rest/v1/" + query.table + "?" + qs;
    request.headers = baseHeaders(false);
    auto rows = perform(std::move(request), "select");
    if (rows && rows.value().is_null())
        return nlohmann::json::array();
    return rows;
}

Result<nlohmann::json> PostgrestClient::upsert(const std::string& table, const nlohmann::json& rows,
                                               const std::string& onConflict) {
    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = config_.url + "/rest/v1/" + table;
    if (!onConflict.empty())
        request.url += "?on_conflict=" + net::urlEncode(onConflict);
    request.headers = baseHeaders(true);
    request.headers.push_back({"Prefer", "resolution=merge-duplicates,return=representation"});
    request.body = rows.dump();
    return perform(std::move(request), "upsert");
}

Result<nlohmann::json> PostgrestClient::update(const std::string& table, const nlohmann::json& patch,
                                               const std::vector<QueryFilter>& filters) {
    if (filters.empty()) {
        return Error{ErrorCode::InvalidArgument, "Refusing unfiltered update of " + table};
    }
    net::HttpRequest request;
    request.method = net::HttpMethod::Patch;
    request.url = config_.url + "/rest/v1/" + table + "?" + encodeFilters(filters);
    request.headers = baseHeaders(true);
    request.headers.push_back({"Prefer", "return=representation"});
    request.body = patch.dump();
    return perform(std::move(request), "update");
}

Result<void> PostgrestClient::remove(const std::string& table,
                                     const std::vector<QueryFilter>& filters) {
    if (filters.empty()) {
        return Error{ErrorCode::InvalidArgument, "Refusing unfiltered delete from " + table};
    }
    net::HttpRequest request;
    request.method = net::HttpMethod::Delete;
    request.url = config_.url + "/rest/v1/" + table + "?" + encodeFilters(filters);
    request.headers = baseHeaders(true);
    auto r = perform(std::move(request), "delete");
    if (!r)
        return r.error();
    return {};
}

Result<nlohmann::json> PostgrestClient::rpc(const std::string& function,
                                            const nlohmann::json& args) {
    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = config_.url + "/rest/v1/rpc/" + function;
    request.headers = baseHeaders(true);
    request.body = args.is_null() ? "{}" : args.dump();
    return perform(std::move(request), "rpc");
}

Result<nlohmann::json> PostgrestClient::signInWithPassword(const std::string& email,
                                                           const std::string& password) {
    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = config_.url + "/auth/v1/token?grant_type=password";
    request.headers = {{"apikey", config_.apiKey}, {"Content-Type", "application/json"}};
    request.body = nlohmann::json{{"email", email}, {"password", password}}.dump();

    auto session = perform(std::move(request), "sign-in");
    if (!session)
        return session;
    const auto& body = session.value();
    if (!body.is_object() || !body.contains("access_token") || !body["access_token"].is_string()) {
        return Error{ErrorCode::RemoteOperationFailed, "sign-in returned no access token"};
    }
    accessToken_ = body["access_token"].get<std::string>();
    spdlog::info("[Remote] Signed in as {}", email);
    return session;
}

Result<void> PostgrestClient::signOut() {
    if (accessToken_.empty())
        return {};
    net::HttpRequest request;
    request.method = net::HttpMethod::Post;
    request.url = config_.url + "/auth/v1/logout";
    request.headers = baseHeaders(true);
    auto r = perform(std::move(request), "sign-out");
    accessToken_.clear();
    if (!r)
        return r.error();
    return {};
}

std::unique_ptr<RemoteClient> makePostgrestClient(RemoteConfig config,
                                                  std::shared_ptr<net::IHttpClient> http) {
    return std::make_unique<PostgrestClient>(std::move(config), std::move(http));
}

} // namespace agroledger::sync
