#include <agroledger/store/ledger_types.h>

namespace agroledger::store {

const char* entryKindLabel(int code) {
    switch (code) {
        case 1:
            return "Revenue";
        case 2:
            return "Expense";
        default:
            return "Advance";
    }
}

std::optional<EntryKind> entryKindFromCode(int code) {
    switch (code) {
        case 1:
            return EntryKind::Revenue;
        case 2:
            return EntryKind::Expense;
        case 3:
            return EntryKind::Advance;
        default:
            return std::nullopt;
    }
}

std::optional<BalanceSign> balanceSignFromChar(char c) {
    switch (c) {
        case 'P':
            return BalanceSign::Positive;
        case 'N':
            return BalanceSign::Negative;
        default:
            return std::nullopt;
    }
}

} // namespace agroledger::store
