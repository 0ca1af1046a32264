#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <agroledger/sync/remote_mapper.h>

using namespace agroledger;
using namespace agroledger::sync;
using nlohmann::json;

namespace {

json sampleRow() {
    return json{{"id", 17},
                {"data", "2024-03-09"},
                {"cod_imovel", 2},
                {"cod_conta", 1},
                {"num_doc", "NF-778"},
                {"tipo_doc", 4},
                {"historico", "Venda de soja"},
                {"id_participante", 31},
                {"tipo_lanc", 1},
                {"valor_entrada", 1200.5},
                {"valor_saida", 0},
                {"saldo_final", 800.25},
                {"natureza_saldo", "N"},
                {"usuario", "ana"},
                {"categoria", nullptr},
                {"data_ord", 20240309}};
}

} // namespace

TEST(RemoteMapperTest, BuildsDisplayRowWithResolvedNames) {
    NameMap properties{{2, "Fazenda Sol"}};
    NameMap counterparties{{31, "Cooperativa Norte"}};

    auto row = toLocalTuple(sampleRow(), properties, counterparties);
    EXPECT_EQ(row.id, 17);
    EXPECT_EQ(row.date, "09/03/2024");
    EXPECT_EQ(row.propertyName, "Fazenda Sol");
    EXPECT_EQ(row.documentNumber, "NF-778");
    EXPECT_EQ(row.counterpartyName, "Cooperativa Norte");
    EXPECT_EQ(row.kindLabel, "Revenue");
    EXPECT_DOUBLE_EQ(row.credit, 1200.5);
    EXPECT_DOUBLE_EQ(row.signedBalance, -800.25);
    EXPECT_EQ(row.author, "ana");
}

TEST(RemoteMapperTest, MissingNamesAndUnknownKindsDegrade) {
    auto raw = sampleRow();
    raw["tipo_lanc"] = 9;
    raw["natureza_saldo"] = "P";
    raw["id_participante"] = nullptr;
    raw["valor_entrada"] = "15.75";

    auto row = toLocalTuple(raw, {}, {});
    EXPECT_EQ(row.propertyName, "");
    EXPECT_EQ(row.counterpartyName, "");
    EXPECT_EQ(row.kindLabel, "Advance");
    EXPECT_DOUBLE_EQ(row.signedBalance, 800.25);
    EXPECT_DOUBLE_EQ(row.credit, 15.75);
}

TEST(RemoteMapperTest, UnparseableDateIsShownVerbatim) {
    auto raw = sampleRow();
    raw["data"] = "soon";
    EXPECT_EQ(toLocalTuple(raw, {}, {}).date, "soon");
}

TEST(RemoteMapperTest, EntryToRemoteRowIsComplete) {
    store::LedgerEntry e;
    e.id = 5;
    e.date = "01/12/2023";
    e.propertyId = 3;
    e.accountId = 4;
    e.documentType = "2";
    e.kind = store::EntryKind::Expense;
    e.debit = 90.0;
    e.closingBalance = 10.0;
    e.balanceSign = store::BalanceSign::Negative;
    e.quantity = 3.0;

    auto row = toRemoteRow(e);
    EXPECT_EQ(row["id"], 5);
    EXPECT_EQ(row["data"], "2023-12-01");
    EXPECT_EQ(row["data_ord"], 20231201);
    EXPECT_EQ(row["tipo_doc"], 2);
    EXPECT_EQ(row["tipo_lanc"], 2);
    EXPECT_EQ(row["natureza_saldo"], "N");
    EXPECT_TRUE(row["num_doc"].is_null());
    EXPECT_TRUE(row["id_participante"].is_null());
    EXPECT_TRUE(row["categoria"].is_null());
    EXPECT_EQ(row["quantidade"], 3.0);

    e.id = 0;
    EXPECT_FALSE(toRemoteRow(e).contains("id"));
}

TEST(RemoteMapperTest, RemoteRowToEntry) {
    auto entry = toEntry(sampleRow());
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry.value().id, 17);
    EXPECT_EQ(entry.value().documentType, "4");
    EXPECT_EQ(entry.value().counterpartyId, 31);
    EXPECT_EQ(entry.value().balanceSign, store::BalanceSign::Negative);
    EXPECT_FALSE(entry.value().category.has_value());
    EXPECT_EQ(entry.value().ordinalDate, 20240309);

    auto noId = sampleRow();
    noId.erase("id");
    auto bad = toEntry(noId);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidData);
}

TEST(RemoteMapperTest, DistinctIdsKeepFirstSeenOrder) {
    auto rows = json::parse(R"([{"cod_imovel":3},{"cod_imovel":"1"},{"cod_imovel":3},
                                {"cod_imovel":null},{"other":8}])");
    EXPECT_EQ(distinctIds(rows, "cod_imovel"), (std::vector<int64_t>{3, 1}));
    EXPECT_TRUE(distinctIds(json::object(), "cod_imovel").empty());
}
