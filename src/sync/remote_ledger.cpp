#include <agroledger/sync/remote_ledger.h>

#include <spdlog/spdlog.h>

namespace agroledger::sync {

namespace {

constexpr const char* kPropertyTable = "imovel_rural";
constexpr const char* kCounterpartyTable = "participante";

constexpr const char* kListColumns =
    "id,data,cod_imovel,num_doc,id_participante,historico,tipo_lanc,valor_entrada,"
    "valor_saida,saldo_final,natureza_saldo,usuario,data_ord,cod_conta";

std::vector<std::string> toStrings(const std::vector<int64_t>& ids) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (auto id : ids)
        out.push_back(std::to_string(id));
    return out;
}

void applyRange(SelectQuery& query, const store::OrdinalRange& range) {
    if (range.from)
        query.filters.push_back(gte(columns::kOrdinalDate, std::to_string(*range.from)));
    if (range.to)
        query.filters.push_back(lte(columns::kOrdinalDate, std::to_string(*range.to)));
}

Result<NameMap> fetchNames(RemoteClient& client, const char* table, const char* nameColumn,
                           const std::vector<int64_t>& ids) {
    NameMap names;
    if (ids.empty())
        return names;

    SelectQuery query;
    query.table = table;
    query.columns = std::string("id,") + nameColumn;
    query.filters.push_back(in("id", toStrings(ids)));
    auto rows = client.select(query);
    if (!rows)
        return rows.error();

    for (const auto& row : rows.value()) {
        if (!row.contains("id") || !row["id"].is_number_integer())
            continue;
        const auto& name = row.contains(nameColumn) ? row[nameColumn] : nlohmann::json();
        names[row["id"].get<int64_t>()] = name.is_string() ? name.get<std::string>() : "";
    }
    return names;
}

nlohmann::json credentials(const std::string& username, const std::string& password) {
    return nlohmann::json{{"p_username", username}, {"p_password", password}};
}

} // namespace

RemoteLedger::RemoteLedger(SyncBridge& bridge, std::string table)
    : bridge_(bridge), table_(std::move(table)) {}

Result<std::vector<LedgerRow>> RemoteLedger::listEntries(const store::OrdinalRange& range,
                                                         const std::vector<int64_t>& propertyIds) {
    return bridge_.submit<std::vector<LedgerRow>>(
        [this, range, propertyIds](RemoteClient& client) -> Result<std::vector<LedgerRow>> {
            SelectQuery query;
            query.table = table_;
            query.columns = kListColumns;
            applyRange(query, range);
            if (!propertyIds.empty())
                query.filters.push_back(in(columns::kProperty, toStrings(propertyIds)));
            query.order = {{columns::kOrdinalDate, true}, {columns::kId, true}};

            auto rows = client.select(query);
            if (!rows)
                return rows.error();

            auto properties = fetchNames(client, kPropertyTable, "nome_imovel",
                                         distinctIds(rows.value(), columns::kProperty));
            if (!properties)
                return properties.error();
            auto counterparties = fetchNames(client, kCounterpartyTable, "nome",
                                             distinctIds(rows.value(), columns::kCounterparty));
            if (!counterparties)
                return counterparties.error();

            std::vector<LedgerRow> out;
            out.reserve(rows.value().size());
            for (const auto& row : rows.value())
                out.push_back(toLocalTuple(row, properties.value(), counterparties.value()));
            return out;
        });
}

Result<std::vector<store::LedgerEntry>> RemoteLedger::fetchEntries(const store::OrdinalRange& range) {
    return bridge_.submit<std::vector<store::LedgerEntry>>(
        [this, range](RemoteClient& client) -> Result<std::vector<store::LedgerEntry>> {
            SelectQuery query;
            query.table = table_;
            applyRange(query, range);
            query.order = {{columns::kId, false}};

            auto rows = client.select(query);
            if (!rows)
                return rows.error();

            std::vector<store::LedgerEntry> entries;
            for (const auto& row : rows.value()) {
                auto entry = toEntry(row);
                if (!entry) {
                    spdlog::warn("[RemoteLedger] Skipping row: {}", entry.error().message);
                    continue;
                }
                entries.push_back(std::move(entry).value());
            }
            return entries;
        });
}

Result<void> RemoteLedger::upsertEntry(const store::LedgerEntry& entry) {
    if (entry.id <= 0)
        return Error{ErrorCode::InvalidArgument, "Entry must have an id before it is pushed"};
    auto row = toRemoteRow(entry);
    return bridge_.submit<void>([this, row](RemoteClient& client) -> Result<void> {
        auto r = client.upsert(table_, nlohmann::json::array({row}), columns::kId);
        if (!r)
            return r.error();
        return {};
    });
}

Result<size_t> RemoteLedger::pushEntries(const std::vector<store::LedgerEntry>& entries) {
    if (entries.empty())
        return size_t{0};

    auto rows = nlohmann::json::array();
    for (const auto& entry : entries) {
        if (entry.id <= 0)
            return Error{ErrorCode::InvalidArgument, "Entry must have an id before it is pushed"};
        rows.push_back(toRemoteRow(entry));
    }
    return bridge_.submit<size_t>([this, rows](RemoteClient& client) -> Result<size_t> {
        auto r = client.upsert(table_, rows, columns::kId);
        if (!r)
            return r.error();
        spdlog::info("[RemoteLedger] Pushed {} entries to {}", rows.size(), table_);
        return rows.size();
    });
}

Result<void> RemoteLedger::deleteEntry(EntryId id) {
    return bridge_.submit<void>([this, id](RemoteClient& client) {
        return client.remove(table_, {eq(columns::kId, std::to_string(id))});
    });
}

Result<std::optional<AppUser>> RemoteLedger::loginUser(const std::string& username,
                                                       const std::string& password) {
    auto args = credentials(username, password);
    return bridge_.submit<std::optional<AppUser>>(
        [args](RemoteClient& client) -> Result<std::optional<AppUser>> {
            auto r = client.rpc("login_user", args);
            if (!r)
                return r.error();

            // A set-returning function comes back as an array
            const nlohmann::json& body =
                r.value().is_array() ? (r.value().empty() ? nlohmann::json() : r.value()[0])
                                     : r.value();
            if (!body.is_object() || !body.contains("id") || body["id"].is_null())
                return std::optional<AppUser>{};

            AppUser user;
            user.id = body["id"].get<int64_t>();
            user.username = body.value("username", std::string());
            return std::optional<AppUser>{user};
        });
}

Result<int64_t> RemoteLedger::createAppUser(const std::string& username,
                                            const std::string& password) {
    auto args = credentials(username, password);
    return bridge_.submit<int64_t>([args](RemoteClient& client) -> Result<int64_t> {
        auto r = client.rpc("create_app_user", args);
        if (!r)
            return r.error();
        const auto& body = r.value();
        if (body.is_number_integer())
            return body.get<int64_t>();
        if (body.is_object() && body.contains("id") && body["id"].is_number_integer())
            return body["id"].get<int64_t>();
        return Error{ErrorCode::InvalidData, "Unexpected create_app_user response: " + body.dump()};
    });
}

Result<bool> RemoteLedger::verifyAppUser(const std::string& username,
                                         const std::string& password) {
    auto args = credentials(username, password);
    return bridge_.submit<bool>([args](RemoteClient& client) -> Result<bool> {
        auto r = client.rpc("verify_app_user", args);
        if (!r)
            return r.error();
        return r.value().is_boolean() && r.value().get<bool>();
    });
}

Result<void> RemoteLedger::signInAdmin(const std::string& email, const std::string& password) {
    return bridge_.submit<void>([email, password](RemoteClient& client) -> Result<void> {
        auto r = client.signInWithPassword(email, password);
        if (!r)
            return r.error();
        return {};
    });
}

} // namespace agroledger::sync
