#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <string>

#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"

namespace gamevision {
namespace {

TEST(LoggerTest, FormatsAndFansOutToSinks) {
    Logger log;
    auto first = std::make_shared<CapturingSink>();
    auto second = std::make_shared<CapturingSink>();
    log.addSink(first);
    log.addSink(second);

    log.info("captured %dx%d via %s", 640, 480, "xcomposite");
    log.warn("falling back");

    auto entries = first->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].message, "captured 640x480 via xcomposite");
    EXPECT_EQ(entries[1].level, LogLevel::Warn);
    EXPECT_EQ(second->entries().size(), 2u);
}

TEST(LoggerTest, DebugIsSuppressedUntilEnabled) {
    Logger log;
    auto sink = std::make_shared<CapturingSink>();
    log.addSink(sink);

    log.debug("hidden %d", 1);
    EXPECT_EQ(sink->count(LogLevel::Debug), 0u);

    log.setDebugEnabled(true);
    log.debug("shown %d", 2);
    ASSERT_EQ(sink->count(LogLevel::Debug), 1u);
    EXPECT_EQ(sink->entries()[0].message, "shown 2");
}

TEST(LoggerTest, WithoutSinksNothingHappens) {
    Logger log;
    log.setDebugEnabled(true);
    log.error("nobody listens: %s", "ok");
    log.debug("still nobody");
}

TEST(LoggerTest, LongMessagesAreNotTruncated) {
    Logger log;
    auto sink = std::make_shared<CapturingSink>();
    log.addSink(sink);
    std::string longText(5000, 'x');
    log.info("%s", longText.c_str());
    ASSERT_EQ(sink->entries().size(), 1u);
    EXPECT_EQ(sink->entries()[0].message.size(), 5000u);
}

TEST(FileSinkTest, AppendsBannerAndTaggedLines) {
    const std::string path = ::testing::TempDir() + "gamevision_log_test.log";
    std::remove(path.c_str());
    {
        Logger log;
        auto file = std::make_shared<FileSink>(path);
        ASSERT_TRUE(file->isOpen());
        log.addSink(file);
        log.error("capture failed: %s", "BadMatch");
    }
    std::string text;
    ASSERT_TRUE(readTextFile(path, text));
    EXPECT_NE(text.find("=== gamevision started ==="), std::string::npos);
    EXPECT_NE(text.find("[ERROR] capture failed: BadMatch"), std::string::npos);
    std::remove(path.c_str());
}

TEST(FileSinkTest, UnwritablePathIsNotOpen) {
    FileSink sink("/nonexistent-dir/for/gamevision.log");
    EXPECT_FALSE(sink.isOpen());
    sink.write(LogLevel::Info, "dropped");
}

}  // namespace
}  // namespace gamevision
