#include <gtest/gtest.h>
#include <agroledger/lookup/tax_id.h>

using namespace agroledger::lookup;

TEST(TaxIdTest, DetectsKindByDigitCount) {
    EXPECT_EQ(detectTaxIdKind("529.982.247-25"), TaxIdKind::Cpf);
    EXPECT_EQ(detectTaxIdKind("11.222.333/0001-81"), TaxIdKind::Cnpj);
    EXPECT_FALSE(detectTaxIdKind("1234").has_value());
    EXPECT_FALSE(detectTaxIdKind("").has_value());
    EXPECT_STREQ(taxIdKindName(TaxIdKind::Cnpj), "cnpj");
}

TEST(TaxIdTest, CpfCheckDigits) {
    EXPECT_TRUE(isValidCpf("529.982.247-25"));
    EXPECT_TRUE(isValidCpf("12345678909"));
    EXPECT_FALSE(isValidCpf("529.982.247-24"));
    EXPECT_FALSE(isValidCpf("111.111.111-11"));
    EXPECT_FALSE(isValidCpf("5299822472"));
}

TEST(TaxIdTest, CnpjCheckDigits) {
    EXPECT_TRUE(isValidCnpj("11.222.333/0001-81"));
    EXPECT_TRUE(isValidCnpj("12345678000195"));
    EXPECT_FALSE(isValidCnpj("11.222.333/0001-80"));
    EXPECT_FALSE(isValidCnpj("00000000000000"));
    EXPECT_FALSE(isValidTaxId("11222333000181", TaxIdKind::Cpf));
    EXPECT_TRUE(isValidTaxId("11222333000181", TaxIdKind::Cnpj));
}

TEST(TaxIdTest, Formatting) {
    EXPECT_EQ(formatTaxId("52998224725"), "529.982.247-25");
    EXPECT_EQ(formatTaxId("11222333000181"), "11.222.333/0001-81");
    EXPECT_EQ(formatTaxId("12-34"), "12-34");
}
