#pragma once

#include <agroledger/core/types.h>
#include <agroledger/store/ledger_store.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace agroledger::app {

/**
 * @brief Mirrors remote ledger changes into the local store
 *
 * INSERT and UPDATE replace the local row with the remote one (last write wins by
 * id). DELETE removes it; a row that is already gone is not an error.
 * Intended as a RealtimeChannel callback, so apply() may run on any thread.
 */
class RemoteChangeApplier {
public:
    explicit RemoteChangeApplier(store::LedgerStore& store) : store_(store) {}

    Result<void> apply(const std::string& kind, const nlohmann::json& payload);

    /// Callback adapter that logs failures instead of returning them
    void operator()(const std::string& kind, const nlohmann::json& payload);

    uint64_t applied() const { return applied_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    store::LedgerStore& store_;
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace agroledger::app
