#include "match/MultiScaleMatcher.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "image/MatConvert.hpp"
#include "platform/Time.hpp"

namespace gamevision {

namespace {

constexpr double kScaleEpsilon = 1e-9;

void requireNonEmpty(const cv::Mat& source, const cv::Mat& templ) {
    if (source.empty() || source.cols <= 0 || source.rows <= 0) {
        throw std::invalid_argument("matcher: source image is empty");
    }
    if (templ.empty() || templ.cols <= 0 || templ.rows <= 0) {
        throw std::invalid_argument("matcher: template image is empty");
    }
}

void requireNonEmpty(const PixelBuffer& source, const PixelBuffer& templ) {
    if (source.empty()) {
        throw std::invalid_argument("matcher: source image is empty");
    }
    if (templ.empty()) {
        throw std::invalid_argument("matcher: template image is empty");
    }
}

}  // namespace

std::vector<double> scaleSequence(const MultiScaleConfig& config) {
    config.validate();

    double span = (config.maxScale - config.minScale) / config.scaleStep;
    if (span + 1.0 > static_cast<double>(kMaxScaleCount)) {
        throw std::invalid_argument("scale range yields too many scales");
    }

    std::vector<double> scales;
    for (std::size_t i = 0;; ++i) {
        double s = config.minScale + static_cast<double>(i) * config.scaleStep;
        if (s > config.maxScale + kScaleEpsilon) {
            break;
        }
        scales.push_back(s);
    }
    return scales;
}

MatchResult reduceBestMatch(const std::vector<MatchResult>& candidates,
                            double threshold) {
    MatchResult best = MatchResult::notFound();
    for (const auto& c : candidates) {
        if (c.similarity > best.similarity && c.similarity >= threshold) {
            best = c;
        }
    }
    return best;
}

MultiScaleMatcher::MultiScaleMatcher(const ICorrelator& correlator,
                                     Logger& logger)
    : correlator_(correlator), log_(logger) {}

MatchResult MultiScaleMatcher::matchBestScale(
    const PixelBuffer& source, const PixelBuffer& templ,
    const MultiScaleConfig& config) const {
    requireNonEmpty(source, templ);
    return matchBestScale(toBgrMat(source), toBgrMat(templ), config);
}

std::vector<MatchResult> MultiScaleMatcher::matchAllScales(
    const PixelBuffer& source, const PixelBuffer& templ,
    const MultiScaleConfig& config) const {
    requireNonEmpty(source, templ);
    return matchAllScales(toBgrMat(source), toBgrMat(templ), config);
}

MatchResult MultiScaleMatcher::matchSingleScale(const PixelBuffer& source,
                                                const PixelBuffer& templ,
                                                double threshold) const {
    MultiScaleConfig config;
    config.minScale = 1.0;
    config.maxScale = 1.0;
    config.scaleStep = 0.1;
    config.threshold = threshold;
    config.maxResults = 1;
    return matchBestScale(source, templ, config);
}

MatchResult MultiScaleMatcher::matchBestScale(
    const cv::Mat& source, const cv::Mat& templ,
    const MultiScaleConfig& config) const {
    requireNonEmpty(source, templ);
    config.validate();

    const double start = nowSeconds();
    MatchResult best =
        reduceBestMatch(evaluateScales(source, templ, config), config.threshold);

    if (best.found()) {
        log_.debug("best match: similarity=%.4f scale=%.3f at (%d, %d) in %.1f ms",
                   best.similarity, best.scale, best.location.x,
                   best.location.y, (nowSeconds() - start) * 1000.0);
    } else {
        log_.debug("no scale reached threshold %.3f (%.1f ms)",
                   config.threshold, (nowSeconds() - start) * 1000.0);
    }
    return best;
}

std::vector<MatchResult> MultiScaleMatcher::matchAllScales(
    const cv::Mat& source, const cv::Mat& templ,
    const MultiScaleConfig& config) const {
    requireNonEmpty(source, templ);
    config.validate();

    std::vector<MatchResult> results;
    for (auto& c : evaluateScales(source, templ, config)) {
        if (c.similarity >= config.threshold && c.found()) {
            results.push_back(c);
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const MatchResult& a, const MatchResult& b) {
                         return a.similarity > b.similarity;
                     });
    if (results.size() > config.maxResults) {
        results.resize(config.maxResults);
    }

    log_.debug("multi-scale search kept %zu match(es)", results.size());
    return results;
}

std::vector<MatchResult> MultiScaleMatcher::evaluateScales(
    const cv::Mat& source, const cv::Mat& templ,
    const MultiScaleConfig& config) const {
    std::vector<MatchResult> candidates;
    for (double scale : scaleSequence(config)) {
        if (auto candidate = evaluateScale(source, templ, scale)) {
            candidates.push_back(*candidate);
        }
    }
    return candidates;
}

std::optional<MatchResult> MultiScaleMatcher::evaluateScale(
    const cv::Mat& source, const cv::Mat& templ, double scale) const {
    const int sw = static_cast<int>(std::lround(templ.cols * scale));
    const int sh = static_cast<int>(std::lround(templ.rows * scale));
    if (sw <= 0 || sh <= 0 || sw >= source.cols || sh >= source.rows) {
        log_.debug("scale %.3f skipped: template %dx%d vs source %dx%d", scale,
                   sw, sh, source.cols, source.rows);
        return std::nullopt;
    }

    cv::Mat scaled;
    if (sw == templ.cols && sh == templ.rows) {
        scaled = templ;
    } else {
        cv::resize(templ, scaled, cv::Size(sw, sh), 0.0, 0.0, cv::INTER_LINEAR);
    }

    const Correlation corr = correlator_.correlate(source, scaled);

    MatchResult r;
    r.similarity = corr.score;
    r.confidence = corr.score;
    r.location = corr.offset;
    r.boundingBox = {corr.offset.x, corr.offset.y, corr.offset.x + sw,
                     corr.offset.y + sh};
    r.scale = scale;
    r.method = CompareMethod::Template;

    log_.debug("scale %.3f: %dx%d score=%.4f at (%d, %d)", scale, sw, sh,
               corr.score, corr.offset.x, corr.offset.y);
    return r;
}

}  // namespace gamevision
