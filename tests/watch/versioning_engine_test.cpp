#include "av/events/event_bus.hpp"
#include "av/events/events.hpp"
#include "av/watch/versioning_engine.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using av::ErrorCode;
using av::events::EventBus;
using av::events::FilePromotedEvent;
using av::events::FileVersionedEvent;
using av::watch::VersioningEngine;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = fs::temp_directory_path() / fs::path("av_engine_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::string fixed_date() {
    return "2024-05-01";
}

} // namespace

class VersioningEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        bus_.subscribe<FileVersionedEvent>([this](const FileVersionedEvent& e) {
            versioned_.push_back(e.versioned_filename);
        });
        bus_.subscribe<FilePromotedEvent>([this](const FilePromotedEvent& e) {
            promoted_.push_back(e.incoming_filename + " -> " + e.base_filename);
        });
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
    EventBus bus_;
    std::vector<std::string> versioned_;
    std::vector<std::string> promoted_;
};

TEST_F(VersioningEngineTest, ArchivesExistingBaseThenPromotes) {
    VersioningEngine engine(bus_, fixed_date);
    write_file(root_ / "invoice.pdf", "old");
    write_file(root_ / "invoice (1).pdf", "new");

    auto result = engine.promote(root_, root_ / "invoice (1).pdf", "invoice (1).pdf", "invoice.pdf");
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(read_file(root_ / "invoice_v2024-05-01.pdf"), "old");
    EXPECT_EQ(read_file(root_ / "invoice.pdf"), "new");
    EXPECT_FALSE(fs::exists(root_ / "invoice (1).pdf"));

    ASSERT_TRUE(result.value().versioned_path.has_value());
    EXPECT_EQ(*result.value().versioned_path, root_ / "invoice_v2024-05-01.pdf");
    EXPECT_EQ(result.value().base_path, root_ / "invoice.pdf");

    EXPECT_EQ(versioned_, std::vector<std::string>{"invoice_v2024-05-01.pdf"});
    EXPECT_EQ(promoted_, std::vector<std::string>{"invoice (1).pdf -> invoice.pdf"});
}

TEST_F(VersioningEngineTest, SecondPromotionSameDayUsesCounter) {
    VersioningEngine engine(bus_, fixed_date);
    write_file(root_ / "invoice.pdf", "v1");

    write_file(root_ / "invoice (1).pdf", "v2");
    ASSERT_TRUE(engine.promote(root_, root_ / "invoice (1).pdf", "invoice (1).pdf", "invoice.pdf").is_ok());

    write_file(root_ / "invoice (1).pdf", "v3");
    ASSERT_TRUE(engine.promote(root_, root_ / "invoice (1).pdf", "invoice (1).pdf", "invoice.pdf").is_ok());

    write_file(root_ / "(2)invoice.pdf", "v4");
    ASSERT_TRUE(engine.promote(root_, root_ / "(2)invoice.pdf", "(2)invoice.pdf", "invoice.pdf").is_ok());

    EXPECT_EQ(read_file(root_ / "invoice_v2024-05-01.pdf"), "v1");
    EXPECT_EQ(read_file(root_ / "invoice_v2024-05-01_1.pdf"), "v2");
    EXPECT_EQ(read_file(root_ / "invoice_v2024-05-01_2.pdf"), "v3");
    EXPECT_EQ(read_file(root_ / "invoice.pdf"), "v4");
}

TEST_F(VersioningEngineTest, PromotesWithoutArchiveWhenBaseMissing) {
    VersioningEngine engine(bus_, fixed_date);
    write_file(root_ / "report_copy.pdf", "fresh");

    auto result = engine.promote(root_, root_ / "report_copy.pdf", "report_copy.pdf", "report.pdf");
    ASSERT_TRUE(result.is_ok());

    EXPECT_FALSE(result.value().versioned_path.has_value());
    EXPECT_EQ(read_file(root_ / "report.pdf"), "fresh");
    EXPECT_TRUE(versioned_.empty());
    EXPECT_EQ(promoted_.size(), 1u);
}

TEST_F(VersioningEngineTest, NextVersionedNameProbesForFreeSlot) {
    VersioningEngine engine(bus_, fixed_date);
    write_file(root_ / "data_v2024-05-01.csv", "");
    write_file(root_ / "data_v2024-05-01_1.csv", "");

    auto name = engine.next_versioned_name(root_, "data.csv", "2024-05-01");
    ASSERT_TRUE(name.is_ok());
    EXPECT_EQ(name.value(), "data_v2024-05-01_2.csv");

    auto other_day = engine.next_versioned_name(root_, "data.csv", "2024-05-02");
    ASSERT_TRUE(other_day.is_ok());
    EXPECT_EQ(other_day.value(), "data_v2024-05-02.csv");
}

TEST_F(VersioningEngineTest, CollisionCapReportsErrorAndMovesNothing) {
    VersioningEngine engine(bus_, fixed_date, 2);
    write_file(root_ / "invoice.pdf", "base");
    write_file(root_ / "invoice_v2024-05-01.pdf", "");
    write_file(root_ / "invoice_v2024-05-01_1.pdf", "");
    write_file(root_ / "invoice_v2024-05-01_2.pdf", "");
    write_file(root_ / "invoice (1).pdf", "incoming");

    auto result = engine.promote(root_, root_ / "invoice (1).pdf", "invoice (1).pdf", "invoice.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::CollisionExhausted);

    EXPECT_EQ(read_file(root_ / "invoice.pdf"), "base");
    EXPECT_EQ(read_file(root_ / "invoice (1).pdf"), "incoming");
    EXPECT_TRUE(promoted_.empty());
}

TEST_F(VersioningEngineTest, MissingIncomingFileLeavesBaseUntouched) {
    VersioningEngine engine(bus_, fixed_date);
    write_file(root_ / "invoice.pdf", "base");

    auto result = engine.promote(root_, root_ / "invoice (1).pdf", "invoice (1).pdf", "invoice.pdf");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
    EXPECT_EQ(result.error().path, root_ / "invoice (1).pdf");

    EXPECT_EQ(read_file(root_ / "invoice.pdf"), "base");
    EXPECT_FALSE(fs::exists(root_ / "invoice_v2024-05-01.pdf"));
}

TEST(VersioningEngineDateTest, LocalDateIsIsoFormatted) {
    const auto date = VersioningEngine::local_date();
    EXPECT_TRUE(std::regex_match(date, std::regex(R"(\d{4}-\d{2}-\d{2})"))) << date;
}
