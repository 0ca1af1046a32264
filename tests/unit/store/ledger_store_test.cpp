#include <gtest/gtest.h>
#include <agroledger/store/ledger_store.h>

#include "common/test_helpers.h"

#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace agroledger;
using namespace agroledger::store;

class LedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("agroledger_store_");
        auto store = LedgerStore::open((dir_ / "ledger.db").string());
        ASSERT_TRUE(store.has_value()) << store.error().message;
        store_ = std::move(store).value();
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(dir_);
    }

    static LedgerEntry entry(const std::string& date, int64_t account, double credit, double debit) {
        LedgerEntry e;
        e.date = date;
        e.propertyId = 1;
        e.accountId = account;
        e.credit = credit;
        e.debit = debit;
        e.kind = credit > 0 ? EntryKind::Revenue : EntryKind::Expense;
        e.author = "tester";
        return e;
    }

    int64_t rowCount() {
        auto rows = store_->listEntries({});
        EXPECT_TRUE(rows.has_value());
        return rows ? static_cast<int64_t>(rows.value().size()) : -1;
    }

    std::filesystem::path dir_;
    std::unique_ptr<LedgerStore> store_;
};

TEST_F(LedgerStoreTest, CreateNormalizesDateAndReadsBack) {
    auto e = entry("15/04/2024", 1, 250.0, 0.0);
    e.category = "Sales";
    e.quantity = 12.5;
    e.unit = "sc";

    auto id = store_->createEntry(e);
    ASSERT_TRUE(id.has_value()) << id.error().message;

    auto loaded = store_->getEntry(id.value());
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->date, "2024-04-15");
    EXPECT_EQ(loaded.value()->ordinalDate, 20240415);
    EXPECT_DOUBLE_EQ(loaded.value()->credit, 250.0);
    EXPECT_EQ(loaded.value()->category, "Sales");
    EXPECT_EQ(loaded.value()->unit, "sc");
    EXPECT_FALSE(loaded.value()->affectedArea.has_value());
    EXPECT_FALSE(loaded.value()->counterpartyId.has_value());
}

TEST_F(LedgerStoreTest, RejectsUnparseableDate) {
    auto result = store_->createEntry(entry("31/02/2024", 1, 1.0, 0.0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(LedgerStoreTest, UpdateAndDeleteReportMissingRows) {
    auto missing = entry("2024-01-01", 1, 1.0, 0.0);
    missing.id = 999;
    auto update = store_->updateEntry(missing);
    ASSERT_FALSE(update.has_value());
    EXPECT_EQ(update.error().code, ErrorCode::NotFound);

    auto del = store_->deleteEntry(999);
    ASSERT_FALSE(del.has_value());
    EXPECT_EQ(del.error().code, ErrorCode::NotFound);

    auto id = store_->createEntry(entry("2024-01-01", 1, 1.0, 0.0));
    ASSERT_TRUE(id.has_value());
    auto e = store_->getEntry(id.value()).value().value();
    e.description = "edited";
    ASSERT_TRUE(store_->updateEntry(e).has_value());
    EXPECT_EQ(store_->getEntry(id.value()).value()->description, "edited");
    ASSERT_TRUE(store_->deleteEntry(id.value()).has_value());
    EXPECT_FALSE(store_->getEntry(id.value()).value().has_value());
}

TEST_F(LedgerStoreTest, ListIsNewestFirstWithinRange) {
    ASSERT_TRUE(store_->createEntry(entry("2024-01-10", 1, 1, 0)).has_value());
    auto b = store_->createEntry(entry("2024-03-01", 1, 2, 0));
    auto c = store_->createEntry(entry("2024-03-01", 1, 3, 0));
    ASSERT_TRUE(store_->createEntry(entry("2024-06-30", 2, 4, 0)).has_value());
    ASSERT_TRUE(b && c);

    auto rows = store_->listEntries(OrdinalRange{20240201, 20240531});
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0].id, c.value());
    EXPECT_EQ(rows.value()[1].id, b.value());

    EntryFilter filter;
    filter.accountId = 2;
    auto byAccount = store_->listEntries({}, filter);
    ASSERT_TRUE(byAccount.has_value());
    ASSERT_EQ(byAccount.value().size(), 1u);
    EXPECT_EQ(byAccount.value()[0].date, "2024-06-30");

    filter = {};
    filter.limit = 3;
    EXPECT_EQ(store_->listEntries({}, filter).value().size(), 3u);
}

TEST_F(LedgerStoreTest, AccountBalanceFollowsLastEntrySign) {
    auto first = entry("2024-01-01", 7, 100.0, 0.0);
    first.closingBalance = 100.0;
    first.balanceSign = BalanceSign::Positive;
    auto second = entry("2024-01-02", 7, 0.0, 150.0);
    second.closingBalance = 50.0;
    second.balanceSign = BalanceSign::Negative;
    ASSERT_TRUE(store_->createEntry(first).has_value());
    auto last = store_->createEntry(second);
    ASSERT_TRUE(last.has_value());

    auto balance = store_->accountBalance(7);
    ASSERT_TRUE(balance.has_value());
    ASSERT_TRUE(balance.value().has_value());
    EXPECT_DOUBLE_EQ(balance.value()->balance, -50.0);
    EXPECT_EQ(balance.value()->lastEntryId, last.value());

    auto none = store_->accountBalance(8);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none.value().has_value());
}

TEST_F(LedgerStoreTest, BulkScopeRollsBackOnError) {
    auto result = store_->withBulkTransaction([](LedgerStore& s) -> Result<void> {
        for (int i = 0; i < 5; ++i) {
            if (i == 2)
                return Error{ErrorCode::InvalidData, "third row rejected"};
            if (auto r = s.createEntry(entry("2024-02-0" + std::to_string(i + 1), 1, 1, 0)); !r)
                return r.error();
        }
        return {};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(rowCount(), 0);
}

TEST_F(LedgerStoreTest, BulkScopeRollsBackOnThrow) {
    auto result = store_->withBulkTransaction([](LedgerStore& s) -> Result<void> {
        for (int i = 0; i < 5; ++i) {
            if (i == 2)
                throw std::runtime_error("boom");
            if (auto r = s.createEntry(entry("2024-02-0" + std::to_string(i + 1), 1, 1, 0)); !r)
                return r.error();
        }
        return {};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TransactionAborted);
    EXPECT_EQ(rowCount(), 0);

    // The store stays usable afterwards
    EXPECT_TRUE(store_->createEntry(entry("2024-02-10", 1, 1, 0)).has_value());
    EXPECT_EQ(rowCount(), 1);
}

TEST_F(LedgerStoreTest, BulkScopeCommitsAndJoinsNestedScopes) {
    auto result = store_->withBulkTransaction([](LedgerStore& s) -> Result<void> {
        if (auto r = s.createEntry(entry("2024-05-01", 1, 5, 0)); !r)
            return r.error();
        return s.withBulkTransaction([](LedgerStore& inner) -> Result<void> {
            auto r = inner.postEntry(entry("2024-05-02", 1, 0, 2));
            if (!r)
                return r.error();
            return {};
        });
    });
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(rowCount(), 2);
}

TEST_F(LedgerStoreTest, PostEntryChainsRunningBalance) {
    auto a = store_->postEntry(entry("2024-01-01", 3, 100.0, 0.0));
    auto b = store_->postEntry(entry("2024-01-02", 3, 0.0, 130.0));
    auto c = store_->postEntry(entry("2024-01-03", 3, 10.0, 0.0));
    ASSERT_TRUE(a && b && c);

    auto eb = store_->getEntry(b.value()).value().value();
    EXPECT_DOUBLE_EQ(eb.closingBalance, 30.0);
    EXPECT_EQ(eb.balanceSign, BalanceSign::Negative);
    EXPECT_DOUBLE_EQ(store_->previousBalance(3).value(), -20.0);
    EXPECT_DOUBLE_EQ(store_->previousBalance(3, c.value()).value(), -30.0);
    EXPECT_DOUBLE_EQ(store_->previousBalance(99).value(), 0.0);

    // Editing the first entry re-chains everything after it
    auto ea = store_->getEntry(a.value()).value().value();
    ea.credit = 200.0;
    ASSERT_TRUE(store_->postEntry(ea).has_value());

    eb = store_->getEntry(b.value()).value().value();
    EXPECT_DOUBLE_EQ(eb.closingBalance, 70.0);
    EXPECT_EQ(eb.balanceSign, BalanceSign::Positive);
    auto ec = store_->getEntry(c.value()).value().value();
    EXPECT_DOUBLE_EQ(ec.signedClosingBalance(), 80.0);
}

TEST_F(LedgerStoreTest, RecomputeRejectsForeignAnchor) {
    auto id = store_->postEntry(entry("2024-01-01", 3, 1.0, 0.0));
    ASSERT_TRUE(id.has_value());
    auto r = store_->recomputeBalanceChain(4, id.value());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);

    auto none = store_->recomputeBalanceChain(3, id.value());
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(none.value(), 0);
}

TEST_F(LedgerStoreTest, FailedCommitRollsBackAndLaterWritesPersist) {
    const auto path = (dir_ / "ledger.db").string();
    store_.reset();
    auto reopened = LedgerStore::open(path, std::chrono::milliseconds(50));
    ASSERT_TRUE(reopened.has_value()) << reopened.error().message;
    store_ = std::move(reopened).value();
    ASSERT_TRUE(store_->postEntry(entry("2024-01-01", 3, 100.0, 0.0)).has_value());

    // A second connection holding a read lock keeps COMMIT from taking the database
    Database reader;
    ASSERT_TRUE(reader.open(path).has_value());
    ASSERT_TRUE(reader.execute("BEGIN").has_value());
    ASSERT_TRUE(reader.queryInt64("SELECT COUNT(*) FROM ledger_entry").has_value());

    auto blocked = store_->postEntry(entry("2024-01-02", 3, 5.0, 0.0));
    EXPECT_FALSE(blocked.has_value());

    ASSERT_TRUE(reader.execute("COMMIT").has_value());
    reader.close();

    auto later = store_->createEntry(entry("2024-01-03", 3, 7.0, 0.0));
    ASSERT_TRUE(later.has_value()) << later.error().message;

    store_.reset();
    auto check = LedgerStore::open(path);
    ASSERT_TRUE(check.has_value());
    store_ = std::move(check).value();
    EXPECT_EQ(rowCount(), 2);
    auto loaded = store_->getEntry(later.value());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded.value().has_value());
}

TEST_F(LedgerStoreTest, IdentifiersStayMonotonicAfterDeletingNewest) {
    auto first = store_->createEntry(entry("2024-01-01", 1, 1.0, 0.0));
    auto second = store_->createEntry(entry("2024-01-02", 1, 2.0, 0.0));
    ASSERT_TRUE(first && second);
    ASSERT_TRUE(store_->deleteEntry(second.value()).has_value());

    auto third = store_->createEntry(entry("2024-01-03", 1, 3.0, 0.0));
    ASSERT_TRUE(third.has_value());
    EXPECT_GT(third.value(), second.value());

    ASSERT_TRUE(store_->deleteEntry(third.value()).has_value());
    store_.reset();
    auto reopened = LedgerStore::open((dir_ / "ledger.db").string());
    ASSERT_TRUE(reopened.has_value());
    store_ = std::move(reopened).value();
    auto fourth = store_->createEntry(entry("2024-01-04", 1, 4.0, 0.0));
    ASSERT_TRUE(fourth.has_value());
    EXPECT_GT(fourth.value(), third.value());
}

TEST_F(LedgerStoreTest, DuplicateDocumentComparesDigits) {
    auto cp = store_->upsertCounterparty("123.456.789-09", "Maria", 1);
    ASSERT_TRUE(cp.has_value());

    auto e = entry("2024-01-01", 1, 10.0, 0.0);
    e.documentNumber = "NF 000.123";
    e.counterpartyId = cp.value();
    auto id = store_->createEntry(e);
    ASSERT_TRUE(id.has_value());

    auto dup = store_->findDuplicateDocument("000123", cp.value());
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup.value(), id.value());

    EXPECT_FALSE(store_->findDuplicateDocument("000123", cp.value(), id.value()).value());
    EXPECT_FALSE(store_->findDuplicateDocument("000123", cp.value() + 1).value());
    EXPECT_FALSE(store_->findDuplicateDocument("s/n", cp.value()).value());
}

TEST_F(LedgerStoreTest, UpsertCounterpartyKeysOnDigits) {
    auto first = store_->upsertCounterparty("12.345.678/0001-95", "Old Name", 2);
    auto second = store_->upsertCounterparty("12345678000195", "New Name", 2);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first.value(), second.value());

    auto found = store_->findCounterpartyByTaxId("12345678000195");
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->name, "New Name");

    auto empty = store_->upsertCounterparty("--", "Nobody", 1);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);
}

TEST_F(LedgerStoreTest, TotalsAndSummaries) {
    auto sale = entry("2024-03-05", 1, 300.0, 0.0);
    sale.category = "Grain";
    auto feed = entry("2024-03-20", 1, 0.0, 120.0);
    feed.category = "Feed";
    auto later = entry("2024-04-02", 1, 0.0, 30.0);
    later.category = "Feed";
    for (const auto& e : {sale, feed, later})
        ASSERT_TRUE(store_->postEntry(e).has_value());

    auto totals = store_->periodTotals(OrdinalRange{20240301, 20240331});
    ASSERT_TRUE(totals.has_value());
    EXPECT_DOUBLE_EQ(totals.value().revenue, 300.0);
    EXPECT_DOUBLE_EQ(totals.value().expense, 120.0);

    auto monthly = store_->monthlyTotals({});
    ASSERT_TRUE(monthly.has_value());
    ASSERT_EQ(monthly.value().size(), 2u);
    EXPECT_EQ(monthly.value()[0].yearMonth, 202403);
    EXPECT_DOUBLE_EQ(monthly.value()[1].debit, 30.0);

    auto summary = store_->categorySummary(OrdinalRange{20240301, 20240331});
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary.value().size(), 2u);
    EXPECT_EQ(summary.value()[0].category, "Feed");
    EXPECT_EQ(summary.value()[0].month, 3);
    EXPECT_DOUBLE_EQ(summary.value()[1].totalCredit, 300.0);

    auto bounds = store_->dateBounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds.value().earliest, 20240305);
    EXPECT_EQ(bounds.value().latest, 20240402);
}

TEST_F(LedgerStoreTest, TotalBalanceFallsBackToOpeningBalance) {
    Account idle;
    idle.code = "002";
    idle.openingBalance = 40.0;
    Account busy;
    busy.code = "001";
    auto idleId = store_->createAccount(idle);
    auto busyId = store_->createAccount(busy);
    ASSERT_TRUE(idleId && busyId);

    ASSERT_TRUE(store_->postEntry(entry("2024-01-01", busyId.value(), 0.0, 15.0)).has_value());

    auto total = store_->totalBalance();
    ASSERT_TRUE(total.has_value());
    EXPECT_DOUBLE_EQ(total.value(), 25.0);
}

TEST_F(LedgerStoreTest, RemoteEntriesKeepTheirIdentifier) {
    auto remote = entry("2024-07-01", 1, 9.0, 0.0);
    remote.id = 42;
    ASSERT_TRUE(store_->applyRemoteEntry(remote).has_value());
    remote.description = "replaced";
    ASSERT_TRUE(store_->applyRemoteEntry(remote).has_value());

    auto loaded = store_->getEntry(42);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->description, "replaced");
    EXPECT_EQ(rowCount(), 1);

    // Local inserts continue after the remote identifier
    auto next = store_->createEntry(entry("2024-07-02", 1, 1.0, 0.0));
    ASSERT_TRUE(next.has_value());
    EXPECT_GT(next.value(), 42);

    remote.id = 0;
    EXPECT_FALSE(store_->applyRemoteEntry(remote).has_value());
}

TEST_F(LedgerStoreTest, ProfileParamsUpsert) {
    ProfileParams params;
    params.profile = "default";
    params.name = "Fazenda Boa Vista";
    ASSERT_TRUE(store_->upsertProfileParams(params).has_value());
    params.name = "Fazenda Nova";
    ASSERT_TRUE(store_->upsertProfileParams(params).has_value());

    auto loaded = store_->getProfileParams("default");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->name, "Fazenda Nova");
    EXPECT_FALSE(loaded.value()->updatedAt.empty());

    ProfileParams unnamed;
    EXPECT_FALSE(store_->upsertProfileParams(unnamed).has_value());
}
