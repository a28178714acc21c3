#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <stdexcept>

#include "match/MultiScaleMatcher.hpp"
#include "TestSupport.hpp"

namespace gamevision {
namespace {

using test::ScriptedCorrelator;

MultiScaleConfig scaleRange(double minScale, double maxScale, double step,
                            double threshold = 0.75) {
    MultiScaleConfig config;
    config.minScale = minScale;
    config.maxScale = maxScale;
    config.scaleStep = step;
    config.threshold = threshold;
    return config;
}

// 200x200 noise with a 50x50 noise template pasted at (70, 80) after a
// bilinear 1.2x resize.
struct PastedScene {
    PixelBuffer source;
    PixelBuffer templ;

    PastedScene() {
        cv::Mat background = test::noiseMat(200, 200, 7);
        cv::Mat patch = test::noiseMat(50, 50, 99);
        cv::Mat scaled;
        cv::resize(patch, scaled, cv::Size(60, 60), 0.0, 0.0, cv::INTER_LINEAR);
        scaled.copyTo(background(cv::Rect(70, 80, 60, 60)));
        source = fromBgrMat(background);
        templ = fromBgrMat(patch);
    }
};

// Search used by the pasted-template and solid-colour scenarios.
MultiScaleConfig scenarioConfig() {
    MultiScaleConfig config = scaleRange(0.8, 1.3, 0.05, 0.9);
    config.maxResults = 3;
    return config;
}

class MultiScaleMatcherTest : public ::testing::Test {
protected:
    Logger log_;
};

TEST(ScaleSequenceTest, SingleScaleRangeYieldsOneScale) {
    auto scales = scaleSequence(scaleRange(1.0, 1.0, 0.1));
    ASSERT_EQ(scales.size(), 1u);
    EXPECT_DOUBLE_EQ(scales[0], 1.0);
}

TEST(ScaleSequenceTest, UpperBoundIsInclusive) {
    auto scales = scaleSequence(scaleRange(0.9, 1.1, 0.1));
    ASSERT_EQ(scales.size(), 3u);
    EXPECT_NEAR(scales[0], 0.9, 1e-9);
    EXPECT_NEAR(scales[1], 1.0, 1e-9);
    EXPECT_NEAR(scales[2], 1.1, 1e-9);
}

TEST(ScaleSequenceTest, DefaultConfigCoversThirteenScales) {
    auto scales = scaleSequence(MultiScaleConfig());
    ASSERT_EQ(scales.size(), 13u);
    EXPECT_NEAR(scales.front(), 0.7, 1e-9);
    EXPECT_NEAR(scales.back(), 1.3, 1e-9);
}

TEST(ScaleSequenceTest, RejectsInvalidConfigs) {
    EXPECT_THROW(scaleSequence(scaleRange(1.2, 0.8, 0.1)),
                 std::invalid_argument);
    EXPECT_THROW(scaleSequence(scaleRange(0.0, 1.0, 0.1)),
                 std::invalid_argument);
    EXPECT_THROW(scaleSequence(scaleRange(0.5, 1.0, 0.0)),
                 std::invalid_argument);
    EXPECT_THROW(scaleSequence(scaleRange(0.5, 1.0, 0.1, 1.5)),
                 std::invalid_argument);
    EXPECT_THROW(scaleSequence(scaleRange(0.01, 100.0, 0.001)),
                 std::invalid_argument);
}

TEST_F(MultiScaleMatcherTest, FindsPastedTemplateAtItsScale) {
    PastedScene scene;
    NccCorrelator ncc;
    MultiScaleMatcher matcher(ncc, log_);

    MatchResult best =
        matcher.matchBestScale(scene.source, scene.templ, scenarioConfig());

    ASSERT_TRUE(best.found());
    EXPECT_NEAR(best.scale, 1.2, 1e-6);
    EXPECT_GT(best.similarity, 0.99);
    EXPECT_EQ(best.location, (Point{70, 80}));
    EXPECT_EQ(best.boundingBox.minX, 70);
    EXPECT_EQ(best.boundingBox.minY, 80);
    EXPECT_EQ(best.boundingBox.maxX, 130);
    EXPECT_EQ(best.boundingBox.maxY, 140);
}

TEST_F(MultiScaleMatcherTest, IdenticalInputsGiveIdenticalResults) {
    PastedScene scene;
    NccCorrelator ncc;
    MultiScaleMatcher matcher(ncc, log_);

    MatchResult first =
        matcher.matchBestScale(scene.source, scene.templ, MultiScaleConfig());
    MatchResult second =
        matcher.matchBestScale(scene.source, scene.templ, MultiScaleConfig());

    EXPECT_EQ(first.similarity, second.similarity);
    EXPECT_EQ(first.scale, second.scale);
    EXPECT_EQ(first.location, second.location);
    EXPECT_EQ(first.boundingBox, second.boundingBox);
}

TEST_F(MultiScaleMatcherTest, SolidColoursDoNotMatch) {
    PixelBuffer source = PixelBuffer::filled(100, 100, 255, 0, 0);
    PixelBuffer templ = PixelBuffer::filled(20, 20, 0, 0, 255);
    NccCorrelator ncc;
    MultiScaleMatcher matcher(ncc, log_);

    MatchResult best = matcher.matchBestScale(source, templ, scenarioConfig());
    EXPECT_FALSE(best.found());
    EXPECT_EQ(best.similarity, 0.0);
    EXPECT_TRUE(best.boundingBox.empty());
    EXPECT_TRUE(
        matcher.matchAllScales(source, templ, scenarioConfig()).empty());
}

TEST_F(MultiScaleMatcherTest, SmallestScaleWinsTies) {
    ScriptedCorrelator scripted({{5, 0.9}, {10, 0.9}, {15, 0.9}}, {3, 4});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);

    MatchResult best =
        matcher.matchBestScale(source, templ, scaleRange(0.5, 1.5, 0.5));

    EXPECT_DOUBLE_EQ(best.scale, 0.5);
    EXPECT_DOUBLE_EQ(best.similarity, 0.9);
    EXPECT_EQ(scripted.calls(), 3);
}

TEST_F(MultiScaleMatcherTest, ThresholdIsEnforced) {
    ScriptedCorrelator scripted({{5, 0.6}, {10, 0.74}, {15, 0.7}}, {3, 4});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);
    auto config = scaleRange(0.5, 1.5, 0.5, 0.75);

    MatchResult best = matcher.matchBestScale(source, templ, config);
    EXPECT_FALSE(best.found());
    EXPECT_EQ(best.similarity, 0.0);
    EXPECT_TRUE(matcher.matchAllScales(source, templ, config).empty());

    config.threshold = 0.74;
    best = matcher.matchBestScale(source, templ, config);
    EXPECT_DOUBLE_EQ(best.similarity, 0.74);
    EXPECT_DOUBLE_EQ(best.scale, 1.0);
}

TEST_F(MultiScaleMatcherTest, BoundingBoxUsesRoundedScaledSize) {
    ScriptedCorrelator scripted({{32, 0.9}}, {7, 9});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(21, 13, 1, 2, 3);

    MatchResult best =
        matcher.matchBestScale(source, templ, scaleRange(1.5, 1.5, 0.1));

    ASSERT_TRUE(best.found());
    EXPECT_EQ(best.location, (Point{7, 9}));
    EXPECT_EQ(best.boundingBox.width(), 32);   // lround(31.5)
    EXPECT_EQ(best.boundingBox.height(), 20);  // lround(19.5)
    EXPECT_EQ(best.boundingBox.minX, 7);
    EXPECT_EQ(best.boundingBox.minY, 9);
}

TEST_F(MultiScaleMatcherTest, SkipsScalesNotSmallerThanSource) {
    ScriptedCorrelator scripted({{20, 0.9}, {30, 0.95}, {40, 0.99}}, {0, 0});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(30, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(20, 10, 1, 2, 3);

    MatchResult best =
        matcher.matchBestScale(source, templ, scaleRange(1.0, 2.0, 0.5));

    EXPECT_DOUBLE_EQ(best.scale, 1.0);
    ASSERT_EQ(scripted.widths().size(), 1u);
    EXPECT_EQ(scripted.widths()[0], 20);
}

TEST_F(MultiScaleMatcherTest, AllScalesSortsBeforeTruncating) {
    ScriptedCorrelator scripted({{5, 0.8}, {10, 0.85}, {15, 0.95}}, {1, 1});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);
    auto config = scaleRange(0.5, 1.5, 0.5, 0.75);
    config.maxResults = 2;

    auto results = matcher.matchAllScales(source, templ, config);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[0].similarity, 0.95);
    EXPECT_DOUBLE_EQ(results[0].scale, 1.5);
    EXPECT_DOUBLE_EQ(results[1].similarity, 0.85);
    EXPECT_DOUBLE_EQ(results[1].scale, 1.0);
}

TEST_F(MultiScaleMatcherTest, AllScalesKeepsAscendingScaleForEqualScores) {
    ScriptedCorrelator scripted({{5, 0.9}, {10, 0.9}, {15, 0.9}}, {1, 1});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);

    auto results =
        matcher.matchAllScales(source, templ, scaleRange(0.5, 1.5, 0.5));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_DOUBLE_EQ(results[0].scale, 0.5);
    EXPECT_DOUBLE_EQ(results[1].scale, 1.0);
    EXPECT_DOUBLE_EQ(results[2].scale, 1.5);
}

TEST_F(MultiScaleMatcherTest, CorrelatorFailureAbortsTheSearch) {
    ScriptedCorrelator scripted({{5, 0.9}, {10, 0.9}, {15, 0.9}}, {1, 1});
    scripted.failOnCall(2);
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);

    EXPECT_THROW(
        matcher.matchBestScale(source, templ, scaleRange(0.5, 1.5, 0.5)),
        CorrelationError);
    EXPECT_EQ(scripted.calls(), 2);
}

TEST_F(MultiScaleMatcherTest, RealCorrelatorRejectsMismatchedTypes) {
    NccCorrelator ncc;
    cv::Mat source(50, 50, CV_8UC3, cv::Scalar::all(10));
    cv::Mat templ(10, 10, CV_8UC1, cv::Scalar::all(10));
    EXPECT_THROW(ncc.correlate(source, templ), CorrelationError);
}

TEST_F(MultiScaleMatcherTest, EmptyInputsThrow) {
    NccCorrelator ncc;
    MultiScaleMatcher matcher(ncc, log_);
    PixelBuffer empty;
    PixelBuffer image = PixelBuffer::filled(10, 10, 0, 0, 0);

    EXPECT_THROW(matcher.matchBestScale(empty, image, MultiScaleConfig()),
                 std::invalid_argument);
    EXPECT_THROW(matcher.matchAllScales(image, empty, MultiScaleConfig()),
                 std::invalid_argument);
}

TEST_F(MultiScaleMatcherTest, InvalidConfigThrowsBeforeCorrelating) {
    ScriptedCorrelator scripted({}, {0, 0});
    MultiScaleMatcher matcher(scripted, log_);
    PixelBuffer source = PixelBuffer::filled(100, 100, 1, 2, 3);
    PixelBuffer templ = PixelBuffer::filled(10, 10, 1, 2, 3);

    EXPECT_THROW(
        matcher.matchBestScale(source, templ, scaleRange(1.3, 0.7, 0.05)),
        std::invalid_argument);
    EXPECT_EQ(scripted.calls(), 0);
}

TEST_F(MultiScaleMatcherTest, SingleScaleMatchesAtScaleOne) {
    cv::Mat background = test::noiseMat(120, 90, 3);
    cv::Mat patch = background(cv::Rect(40, 25, 30, 20)).clone();
    NccCorrelator ncc;
    MultiScaleMatcher matcher(ncc, log_);

    MatchResult r = matcher.matchSingleScale(fromBgrMat(background),
                                             fromBgrMat(patch), 0.9);

    ASSERT_TRUE(r.found());
    EXPECT_DOUBLE_EQ(r.scale, 1.0);
    EXPECT_EQ(r.location, (Point{40, 25}));
    EXPECT_EQ(r.boundingBox, (Rect{40, 25, 70, 45}));
}

TEST(ReduceBestMatchTest, StrictlyGreaterKeepsEarliest) {
    MatchResult a;
    a.similarity = 0.8;
    a.scale = 0.9;
    MatchResult b;
    b.similarity = 0.8;
    b.scale = 1.0;
    MatchResult c;
    c.similarity = 0.7;
    c.scale = 1.1;

    MatchResult best = reduceBestMatch({a, b, c}, 0.5);
    EXPECT_DOUBLE_EQ(best.scale, 0.9);
    EXPECT_FALSE(reduceBestMatch({}, 0.5).found());
    EXPECT_FALSE(reduceBestMatch({a, b, c}, 0.85).found());
}

}  // namespace
}  // namespace gamevision
