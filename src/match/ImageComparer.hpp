#pragma once

#include "image/PixelBuffer.hpp"
#include "match/Correlator.hpp"
#include "match/MatchTypes.hpp"
#include "platform/Log.hpp"

namespace gamevision {

// Whole-image comparison for the `compare` command. Empty inputs throw
// std::invalid_argument.
class ImageComparer {
public:
    ImageComparer(CompareMethod method, const ICorrelator& correlator,
                  Logger& logger);

    CompareMethod method() const {
        return method_;
    }

    MatchResult compare(const PixelBuffer& a, const PixelBuffer& b) const;

private:
    MatchResult compareTemplate(const cv::Mat& a, const cv::Mat& b) const;
    MatchResult compareFeatures(const cv::Mat& a, const cv::Mat& b) const;
    MatchResult compareHistograms(const cv::Mat& a, const cv::Mat& b) const;
    MatchResult compareStructure(const cv::Mat& a, const cv::Mat& b) const;

    CompareMethod method_;
    const ICorrelator& correlator_;
    Logger& log_;
};

}  // namespace gamevision
