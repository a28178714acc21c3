#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>

#include "capture/CaptureFallback.hpp"

namespace gamevision {
namespace {

CaptureOutcome frame(int w, int h) {
    CaptureResult result;
    result.image = PixelBuffer::filled(w, h, 10, 20, 30);
    result.windowRect = {50, 60, 50 + w, 60 + h};
    return CaptureOutcome::success(result);
}

struct CountingStrategy {
    int runs = 0;
    CaptureStrategy make(const std::string& name, CaptureOutcome outcome) {
        return {name, [this, outcome]() {
                    ++runs;
                    return outcome;
                }};
    }
};

class CaptureFallbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<CapturingSink>();
        log_.addSink(sink_);
    }

    Logger log_;
    std::shared_ptr<CapturingSink> sink_;
    CountingStrategy primary_;
    CountingStrategy fallback_;
};

TEST_F(CaptureFallbackTest, PrimarySuccessIsOcclusionTolerant) {
    auto outcome = captureWithFallback(
        primary_.make("composite", frame(40, 30)),
        fallback_.make("visible", frame(40, 30)), CaptureOptions(), log_);

    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.result.occlusionTolerant);
    EXPECT_EQ(outcome.result.strategy, "composite");
    EXPECT_EQ(primary_.runs, 1);
    EXPECT_EQ(fallback_.runs, 0);
    EXPECT_EQ(sink_->count(LogLevel::Warn), 0u);
}

TEST_F(CaptureFallbackTest, FallsBackWithWarning) {
    auto outcome = captureWithFallback(
        primary_.make("composite",
                      CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                              "extension missing")),
        fallback_.make("visible", frame(40, 30)), CaptureOptions(), log_);

    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.result.occlusionTolerant);
    EXPECT_EQ(outcome.result.strategy, "visible");
    EXPECT_EQ(fallback_.runs, 1);
    ASSERT_EQ(sink_->count(LogLevel::Warn), 1u);
    auto entries = sink_->entries();
    bool named = false;
    for (const auto& e : entries) {
        if (e.level == LogLevel::Warn &&
            e.message.find("composite") != std::string::npos &&
            e.message.find("extension missing") != std::string::npos) {
            named = true;
        }
    }
    EXPECT_TRUE(named);
}

TEST_F(CaptureFallbackTest, BothFailingReportsBothReasons) {
    auto outcome = captureWithFallback(
        primary_.make("composite",
                      CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                              "first reason")),
        fallback_.make("visible",
                       CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                               "second reason")),
        CaptureOptions(), log_);

    EXPECT_EQ(outcome.status, CaptureStatus::CaptureFailed);
    EXPECT_NE(outcome.message.find("first reason"), std::string::npos);
    EXPECT_NE(outcome.message.find("second reason"), std::string::npos);
    EXPECT_EQ(primary_.runs, 1);
    EXPECT_EQ(fallback_.runs, 1);
}

TEST_F(CaptureFallbackTest, WindowNotFoundSkipsFallback) {
    auto outcome = captureWithFallback(
        primary_.make("composite",
                      CaptureOutcome::failure(CaptureStatus::WindowNotFound,
                                              "gone")),
        fallback_.make("visible", frame(40, 30)), CaptureOptions(), log_);

    EXPECT_EQ(outcome.status, CaptureStatus::WindowNotFound);
    EXPECT_EQ(fallback_.runs, 0);
    EXPECT_EQ(sink_->count(LogLevel::Warn), 0u);
}

TEST_F(CaptureFallbackTest, EmptyImageCountsAsFailure) {
    CaptureResult blank;
    blank.windowRect = {0, 0, 10, 10};
    auto outcome = captureWithFallback(
        primary_.make("composite", CaptureOutcome::success(blank)),
        fallback_.make("visible", frame(10, 10)), CaptureOptions(), log_);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result.strategy, "visible");
    EXPECT_EQ(sink_->count(LogLevel::Warn), 1u);
}

TEST_F(CaptureFallbackTest, VisibleOnlyRunsFallbackDirectly) {
    CaptureOptions options;
    options.includeHidden = false;
    auto outcome = captureWithFallback(
        primary_.make("composite", frame(40, 30)),
        fallback_.make("visible", frame(40, 30)), options, log_);

    ASSERT_TRUE(outcome.ok());
    EXPECT_FALSE(outcome.result.occlusionTolerant);
    EXPECT_EQ(primary_.runs, 0);
    EXPECT_EQ(fallback_.runs, 1);
    EXPECT_EQ(sink_->count(LogLevel::Warn), 0u);
}

TEST_F(CaptureFallbackTest, MissingStrategyIsCaptureFailed) {
    CaptureStrategy unsupported{"composite", nullptr};
    auto outcome = captureWithFallback(
        unsupported, fallback_.make("visible", frame(8, 8)), CaptureOptions(),
        log_);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result.strategy, "visible");
}

// Returns `rect` as the re-read window geometry and counts the reads.
struct RectReader {
    WindowRect rect;
    bool readable = true;
    int reads = 0;

    std::function<bool(WindowRect&)> make() {
        return [this](WindowRect& out) {
            ++reads;
            out = rect;
            return readable;
        };
    }
};

TEST(ConfirmWindowRectTest, UnchangedRectKeepsTheCapture) {
    RectReader reader;
    reader.rect = {50, 60, 90, 90};
    auto outcome = confirmWindowRect(frame(40, 30), reader.make());
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.result.windowRect, reader.rect);
    EXPECT_EQ(reader.reads, 1);
}

TEST(ConfirmWindowRectTest, MovedWindowFailsTheCapture) {
    RectReader reader;
    reader.rect = {70, 60, 110, 90};
    auto outcome = confirmWindowRect(frame(40, 30), reader.make());
    EXPECT_EQ(outcome.status, CaptureStatus::CaptureFailed);
    EXPECT_NE(outcome.message.find("moved"), std::string::npos);
    EXPECT_TRUE(outcome.result.image.empty());
}

TEST(ConfirmWindowRectTest, ResizedWindowFailsTheCapture) {
    RectReader reader;
    reader.rect = {50, 60, 120, 90};
    auto outcome = confirmWindowRect(frame(40, 30), reader.make());
    EXPECT_EQ(outcome.status, CaptureStatus::CaptureFailed);
}

TEST(ConfirmWindowRectTest, UnreadableRectFailsTheCapture) {
    RectReader reader;
    reader.readable = false;
    auto outcome = confirmWindowRect(frame(40, 30), reader.make());
    EXPECT_EQ(outcome.status, CaptureStatus::CaptureFailed);
    EXPECT_NE(outcome.message.find("vanished"), std::string::npos);
}

TEST(ConfirmWindowRectTest, FailedCaptureIsNotRechecked) {
    RectReader reader;
    auto outcome = confirmWindowRect(
        CaptureOutcome::failure(CaptureStatus::WindowNotFound, "gone"),
        reader.make());
    EXPECT_EQ(outcome.status, CaptureStatus::WindowNotFound);
    EXPECT_EQ(reader.reads, 0);
}

TEST_F(CaptureFallbackTest, MoveDuringPrimaryCopyFallsBackOnce) {
    RectReader movedAway;
    movedAway.rect = {200, 60, 240, 90};
    RectReader stayed;
    stayed.rect = {50, 60, 90, 90};
    int primaryRuns = 0;
    CaptureStrategy primary{"printwindow", [&]() {
                                ++primaryRuns;
                                return confirmWindowRect(frame(40, 30),
                                                         movedAway.make());
                            }};
    CaptureStrategy fallback{"bitblt-screen", [&]() {
                                 return confirmWindowRect(frame(40, 30),
                                                          stayed.make());
                             }};

    auto outcome = captureWithFallback(primary, fallback, CaptureOptions(), log_);

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(primaryRuns, 1);
    EXPECT_EQ(outcome.result.strategy, "bitblt-screen");
    EXPECT_FALSE(outcome.result.occlusionTolerant);
    EXPECT_EQ(outcome.result.windowRect, stayed.rect);
    ASSERT_EQ(sink_->count(LogLevel::Warn), 1u);
    bool named = false;
    for (const auto& e : sink_->entries()) {
        named = named || (e.level == LogLevel::Warn &&
                          e.message.find("moved during capture") !=
                              std::string::npos);
    }
    EXPECT_TRUE(named);
}

WindowInfo window(const std::string& title, bool visible, std::uint64_t id) {
    WindowInfo w;
    w.handle = WindowHandle::fromNative(id);
    w.title = title;
    w.visible = visible;
    w.rect = {0, 0, 100, 100};
    return w;
}

TEST(SelectTargetWindowTest, PrefersFirstVisibleWindow) {
    std::vector<WindowInfo> windows = {window("splash", false, 1),
                                       window("Main", true, 2),
                                       window("Tools", true, 3)};
    auto chosen = selectTargetWindow(windows, CaptureOptions());
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->handle.native(), 2u);
}

TEST(SelectTargetWindowTest, FallsBackToHiddenMatch) {
    std::vector<WindowInfo> windows = {window("splash", false, 1)};
    auto chosen = selectTargetWindow(windows, CaptureOptions());
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->handle.native(), 1u);
}

TEST(SelectTargetWindowTest, TitleFilterIsCaseInsensitive) {
    std::vector<WindowInfo> windows = {window("Main Menu", true, 1),
                                       window("Battle Screen", true, 2)};
    CaptureOptions options;
    options.windowTitle = "battle";
    auto chosen = selectTargetWindow(windows, options);
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->handle.native(), 2u);

    options.windowTitle = "inventory";
    EXPECT_FALSE(selectTargetWindow(windows, options).has_value());
    EXPECT_FALSE(selectTargetWindow({}, CaptureOptions()).has_value());
}

TEST(WindowHandleTest, ZeroIsAValidHandle) {
    WindowHandle none;
    WindowHandle zero = WindowHandle::fromNative(0);
    EXPECT_FALSE(none.isValid());
    EXPECT_TRUE(zero.isValid());
    EXPECT_NE(none, zero);
}

}  // namespace
}  // namespace gamevision
