#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

#include "image/PixelBuffer.hpp"
#include "match/Correlator.hpp"
#include "match/MatchTypes.hpp"
#include "platform/Log.hpp"

namespace gamevision {

// Scales evaluated for a config, ascending: minScale + i*scaleStep while
// <= maxScale (with a small epsilon so the last step survives rounding).
// Throws std::invalid_argument for invalid configs or more than
// kMaxScaleCount scales.
std::vector<double> scaleSequence(const MultiScaleConfig& config);

constexpr std::size_t kMaxScaleCount = 10000;

// Ties go to the smallest scale. matchAllScales sorts by similarity before
// truncating to maxResults.
class MultiScaleMatcher {
public:
    MultiScaleMatcher(const ICorrelator& correlator, Logger& logger);

    MatchResult matchBestScale(const PixelBuffer& source,
                               const PixelBuffer& templ,
                               const MultiScaleConfig& config) const;

    std::vector<MatchResult> matchAllScales(
        const PixelBuffer& source, const PixelBuffer& templ,
        const MultiScaleConfig& config) const;

    // Plain template match at scale 1.0.
    MatchResult matchSingleScale(const PixelBuffer& source,
                                 const PixelBuffer& templ,
                                 double threshold) const;

    MatchResult matchBestScale(const cv::Mat& source, const cv::Mat& templ,
                               const MultiScaleConfig& config) const;
    std::vector<MatchResult> matchAllScales(
        const cv::Mat& source, const cv::Mat& templ,
        const MultiScaleConfig& config) const;

private:
    // One candidate per evaluated scale, in ascending scale order.
    std::vector<MatchResult> evaluateScales(const cv::Mat& source,
                                            const cv::Mat& templ,
                                            const MultiScaleConfig& config) const;

    std::optional<MatchResult> evaluateScale(const cv::Mat& source,
                                             const cv::Mat& templ,
                                             double scale) const;

    const ICorrelator& correlator_;
    Logger& log_;
};

// Strictly-greater fold over candidates already in ascending scale order.
MatchResult reduceBestMatch(const std::vector<MatchResult>& candidates,
                            double threshold);

}  // namespace gamevision
