#include <agroledger/app/remote_change_applier.h>
#include <agroledger/sync/remote_mapper.h>

#include <spdlog/spdlog.h>

#include <initializer_list>

namespace agroledger::app {

namespace {

// Changes arrive either wrapped in "data" or flat, with old/new naming varying by
// protocol version
const nlohmann::json* findRecord(const nlohmann::json& payload,
                                 std::initializer_list<const char*> keys) {
    const nlohmann::json* scopes[] = {
        payload.is_object() && payload.contains("data") ? &payload["data"] : nullptr, &payload};
    for (const auto* scope : scopes) {
        if (!scope || !scope->is_object())
            continue;
        for (const char* key : keys) {
            auto it = scope->find(key);
            if (it != scope->end() && it->is_object() && !it->empty())
                return &*it;
        }
    }
    return nullptr;
}

} // namespace

Result<void> RemoteChangeApplier::apply(const std::string& kind, const nlohmann::json& payload) {
    if (kind == "INSERT" || kind == "UPDATE") {
        const auto* record = findRecord(payload, {"record", "new"});
        if (!record)
            return Error{ErrorCode::InvalidData, kind + " change without a record"};
        auto entry = sync::toEntry(*record);
        if (!entry)
            return entry.error();
        if (auto r = store_.applyRemoteEntry(entry.value()); !r)
            return r;
        spdlog::debug("[ChangeApplier] {} entry {}", kind, entry.value().id);
        return {};
    }

    if (kind == "DELETE") {
        const auto* old = findRecord(payload, {"old_record", "old"});
        if (!old || !old->contains("id") || !(*old)["id"].is_number_integer())
            return Error{ErrorCode::InvalidData, "DELETE change without an old id"};
        const EntryId id = (*old)["id"].get<EntryId>();
        auto r = store_.deleteEntry(id);
        if (!r && r.error().code != ErrorCode::NotFound)
            return r;
        spdlog::debug("[ChangeApplier] DELETE entry {}", id);
        return {};
    }

    spdlog::debug("[ChangeApplier] Ignoring change kind '{}'", kind);
    return {};
}

void RemoteChangeApplier::operator()(const std::string& kind, const nlohmann::json& payload) {
    auto r = apply(kind, payload);
    if (r) {
        applied_.fetch_add(1);
        return;
    }
    failed_.fetch_add(1);
    spdlog::warn("[ChangeApplier] Could not apply {} change: {}", kind, r.error().message);
}

} // namespace agroledger::app
