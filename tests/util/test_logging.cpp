// VELEDGER - Logging Tests
// Copyright (c) 2024 VELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "veledger/util/logging.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace veledger {
namespace util {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, LevelFiltering) {
    LOG_DEBUG(LogCategory::ESCROW) << "hidden";
    LOG_INFO(LogCategory::ESCROW) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_EQ(entries_[0].category, "escrow");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggingTest, StreamFormatsAmountsAndAddresses) {
    Address addr = Address::FromLabel(1);
    LOG_INFO(LogCategory::REWARDS) << "amount=" << (COIN * COIN) << " to " << addr;
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message,
              "amount=1000000000000000000000000000000000000 to 0x" + addr.ToHex());
}

TEST_F(LoggingTest, DebugCategoriesRestrictOutput) {
    Logger::Instance().ApplyDebugCategories("escrow,rewards");
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Debug);

    LOG_DEBUG(LogCategory::ESCROW) << "escrow";
    LOG_DEBUG(LogCategory::DB) << "db";
    LOG_INFO(LogCategory::DEFAULT) << "default";

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "escrow");
    EXPECT_EQ(entries_[1].message, "default");

    Logger::Instance().ApplyDebugCategories("all");
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));
}

TEST_F(LoggingTest, DisabledStreamSkipsFormatting) {
    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    LOG_TRACE(LogCategory::ESCROW) << touch();
    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::NODE) << "warn";
    LOG_ERROR(LogCategory::NODE) << "error";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "error");
}

TEST_F(LoggingTest, RemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DEFAULT) << "dropped";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    const std::string path = "/tmp/veledger_logging_test.log";
    std::remove(path.c_str());
    {
        FileSink::Config cfg;
        cfg.path = path;
        cfg.append = false;
        cfg.autoFlush = true;
        auto fileSink = std::make_shared<FileSink>(cfg);
        ASSERT_TRUE(fileSink->IsOpen());
        Logger::Instance().AddSink(fileSink);
        LOG_INFO(LogCategory::DB) << "persisted";
        Logger::Instance().RemoveSink(fileSink);
    }
    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("persisted"), std::string::npos);
    EXPECT_NE(contents.str().find("[db]"), std::string::npos);
    std::remove(path.c_str());
}

} // namespace
} // namespace util
} // namespace veledger
