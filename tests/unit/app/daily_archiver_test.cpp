#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <agroledger/app/daily_archiver.h>

#include "common/test_helpers.h"

#include <ctime>
#include <filesystem>
#include <string>

using namespace agroledger;
using namespace agroledger::app;

namespace {

// Local noon keeps small offsets on the same calendar day
std::chrono::system_clock::time_point localNoon(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

size_t countArtifacts(const std::filesystem::path& dir) {
    size_t n = 0;
    if (!std::filesystem::exists(dir))
        return 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".zst")
            ++n;
    }
    return n;
}

} // namespace

class DailyArchiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("agroledger_archive_");
        options_.source = dir_ / "default" / "data" / "ledger.db";
        options_.backupDir = dir_ / "default" / "backups";
        options_.statePath = dir_ / "backup_state.json";
        now_ = localNoon(2024, 5, 14);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    DailyArchiver makeArchiver() {
        return DailyArchiver(options_, [this] { return now_; });
    }

    std::filesystem::path dir_;
    DailyArchiver::Options options_;
    std::chrono::system_clock::time_point now_;
};

TEST_F(DailyArchiverTest, ArchivesOncePerDay) {
    tests::write_file(options_.source, std::string(100000, 'x') + "ledger pages");
    auto archiver = makeArchiver();

    auto first = archiver.runIfDue();
    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->filename().string(), "backup_20240514-120000.db.zst");
    EXPECT_TRUE(std::filesystem::exists(*first.value()));

    now_ += std::chrono::hours(3);
    auto second = archiver.runIfDue();
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second.value().has_value());
    EXPECT_EQ(countArtifacts(options_.backupDir), 1u);

    auto state = nlohmann::json::parse(tests::read_file(options_.statePath));
    EXPECT_EQ(state["last_backup_date"], "2024-05-14");

    now_ += std::chrono::hours(24);
    auto nextDay = archiver.runIfDue();
    ASSERT_TRUE(nextDay.has_value());
    EXPECT_TRUE(nextDay.value().has_value());
    EXPECT_EQ(countArtifacts(options_.backupDir), 2u);
}

TEST_F(DailyArchiverTest, MissingSourceProducesNothing) {
    auto archiver = makeArchiver();
    auto r = archiver.runIfDue();
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
    EXPECT_EQ(countArtifacts(options_.backupDir), 0u);
    EXPECT_FALSE(std::filesystem::exists(options_.statePath));
}

TEST_F(DailyArchiverTest, CorruptStateOnlyCostsAnExtraArchive) {
    tests::write_file(options_.source, "pages");
    tests::write_file(options_.statePath, "[[[");
    auto archiver = makeArchiver();
    auto r = archiver.runIfDue();
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().has_value());
}

TEST_F(DailyArchiverTest, ArtifactDecompressesToTheOriginal) {
    std::string content;
    for (int i = 0; i < 5000; ++i)
        content += "row " + std::to_string(i) + ";";
    tests::write_file(options_.source, content);

    auto archived = makeArchiver().runIfDue();
    ASSERT_TRUE(archived.has_value());
    ASSERT_TRUE(archived.value().has_value());
    EXPECT_LT(std::filesystem::file_size(*archived.value()), content.size());

    auto restored = dir_ / "restored.db";
    ASSERT_TRUE(DailyArchiver::decompressFile(*archived.value(), restored).has_value());
    EXPECT_EQ(tests::read_file(restored), content);
}

TEST_F(DailyArchiverTest, TruncatedArchiveIsCorrupt) {
    tests::write_file(options_.source, std::string(50000, 'a'));
    auto archived = makeArchiver().runIfDue();
    ASSERT_TRUE(archived.has_value() && archived.value().has_value());

    auto bytes = tests::read_file(*archived.value());
    auto truncated = tests::write_file(dir_ / "truncated.zst", bytes.substr(0, bytes.size() / 2));
    auto r = DailyArchiver::decompressFile(truncated, dir_ / "out.db");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::CorruptedData);

    auto empty = tests::write_file(dir_ / "empty.zst", "");
    EXPECT_FALSE(DailyArchiver::decompressFile(empty, dir_ / "out2.db").has_value());
}

TEST(FormatLocalTimeTest, UsesLocalCalendar) {
    EXPECT_EQ(formatLocalTime(localNoon(2023, 12, 31), "%Y-%m-%d %H"), "2023-12-31 12");
}
