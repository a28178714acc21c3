#include "match/ImageComparer.hpp"

#include <opencv2/features2d.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "image/MatConvert.hpp"

namespace gamevision {

namespace {

MatchResult scoreOnly(double similarity, CompareMethod method) {
    MatchResult r;
    r.similarity = std::clamp(similarity, 0.0, 1.0);
    if (!std::isfinite(r.similarity)) {
        r.similarity = 0.0;
    }
    r.confidence = r.similarity;
    r.method = method;
    return r;
}

}  // namespace

ImageComparer::ImageComparer(CompareMethod method,
                             const ICorrelator& correlator, Logger& logger)
    : method_(method), correlator_(correlator), log_(logger) {}

MatchResult ImageComparer::compare(const PixelBuffer& a,
                                   const PixelBuffer& b) const {
    if (a.empty() || b.empty()) {
        throw std::invalid_argument("compare: empty image");
    }
    cv::Mat matA = toBgrMat(a);
    cv::Mat matB = toBgrMat(b);

    log_.debug("compare: method=%s, %dx%d vs %dx%d",
               compareMethodName(method_).c_str(), a.w, a.h, b.w, b.h);

    switch (method_) {
        case CompareMethod::Template:
            return compareTemplate(matA, matB);
        case CompareMethod::Feature:
            return compareFeatures(matA, matB);
        case CompareMethod::Histogram:
            return compareHistograms(matA, matB);
        case CompareMethod::Similarity:
            return compareStructure(matA, matB);
    }
    return compareTemplate(matA, matB);
}

MatchResult ImageComparer::compareTemplate(const cv::Mat& a,
                                           const cv::Mat& b) const {
    const cv::Mat* source = &a;
    const cv::Mat* templ = &b;
    if (b.cols > a.cols || b.rows > a.rows) {
        source = &b;
        templ = &a;
    }
    if (templ->cols > source->cols || templ->rows > source->rows) {
        // Neither image contains the other; compare the shared region.
        cv::Rect common(0, 0, std::min(a.cols, b.cols),
                        std::min(a.rows, b.rows));
        cv::Mat ca = a(common);
        cv::Mat cb = b(common);
        return scoreOnly(correlator_.correlate(ca, cb).score,
                         CompareMethod::Template);
    }

    Correlation corr = correlator_.correlate(*source, *templ);
    MatchResult r = scoreOnly(corr.score, CompareMethod::Template);
    r.location = corr.offset;
    r.boundingBox = {corr.offset.x, corr.offset.y, corr.offset.x + templ->cols,
                     corr.offset.y + templ->rows};
    return r;
}

MatchResult ImageComparer::compareFeatures(const cv::Mat& a,
                                           const cv::Mat& b) const {
    cv::Ptr<cv::SIFT> sift = cv::SIFT::create();

    std::vector<cv::KeyPoint> kpA;
    std::vector<cv::KeyPoint> kpB;
    cv::Mat descA;
    cv::Mat descB;
    sift->detectAndCompute(a, cv::noArray(), kpA, descA);
    sift->detectAndCompute(b, cv::noArray(), kpB, descB);

    if (descA.empty() || descB.empty()) {
        log_.debug("feature compare: no descriptors (%zu / %zu keypoints)",
                   kpA.size(), kpB.size());
        return MatchResult::notFound(CompareMethod::Feature);
    }

    cv::BFMatcher matcher(cv::NORM_L2);
    std::vector<cv::DMatch> matches;
    matcher.match(descA, descB, matches);
    if (matches.empty()) {
        return MatchResult::notFound(CompareMethod::Feature);
    }

    double totalDistance = 0.0;
    double cx = 0.0;
    double cy = 0.0;
    for (const auto& m : matches) {
        totalDistance += m.distance;
        const cv::KeyPoint& kp = kpB[static_cast<size_t>(m.trainIdx)];
        cx += kp.pt.x;
        cy += kp.pt.y;
    }
    const double n = static_cast<double>(matches.size());
    const double avgDistance = totalDistance / n;

    MatchResult r =
        scoreOnly(std::max(0.0, 1.0 - avgDistance / 100.0), CompareMethod::Feature);
    r.location = {static_cast<int>(cx / n), static_cast<int>(cy / n)};
    log_.debug("feature compare: %zu matches, mean distance %.2f",
               matches.size(), avgDistance);
    return r;
}

MatchResult ImageComparer::compareHistograms(const cv::Mat& a,
                                             const cv::Mat& b) const {
    cv::Mat hsvA;
    cv::Mat hsvB;
    cv::cvtColor(a, hsvA, cv::COLOR_BGR2HSV);
    cv::cvtColor(b, hsvB, cv::COLOR_BGR2HSV);

    const int channels[] = {0, 1};
    const int histSize[] = {50, 60};
    const float hRange[] = {0.0f, 180.0f};
    const float sRange[] = {0.0f, 256.0f};
    const float* ranges[] = {hRange, sRange};

    cv::Mat histA;
    cv::Mat histB;
    cv::calcHist(&hsvA, 1, channels, cv::Mat(), histA, 2, histSize, ranges);
    cv::calcHist(&hsvB, 1, channels, cv::Mat(), histB, 2, histSize, ranges);
    cv::normalize(histA, histA, 1.0, 0.0, cv::NORM_L2);
    cv::normalize(histB, histB, 1.0, 0.0, cv::NORM_L2);

    double corr = cv::compareHist(histA, histB, cv::HISTCMP_CORREL);
    return scoreOnly(corr, CompareMethod::Histogram);
}

MatchResult ImageComparer::compareStructure(const cv::Mat& a,
                                            const cv::Mat& b) const {
    cv::Mat grayA;
    cv::Mat grayB;
    cv::cvtColor(a, grayA, cv::COLOR_BGR2GRAY);
    cv::cvtColor(b, grayB, cv::COLOR_BGR2GRAY);
    if (grayA.size() != grayB.size()) {
        cv::resize(grayB, grayB, grayA.size(), 0.0, 0.0, cv::INTER_LINEAR);
    }

    cv::Mat diff;
    cv::absdiff(grayA, grayB, diff);
    double meanDiff = cv::mean(diff)[0];
    return scoreOnly(1.0 - meanDiff / 255.0, CompareMethod::Similarity);
}

}  // namespace gamevision
