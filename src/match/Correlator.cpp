#include "match/Correlator.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

#include "match/MatchTypes.hpp"

namespace gamevision {

Correlation NccCorrelator::correlate(const cv::Mat& source,
                                     const cv::Mat& templ) const {
    if (source.empty() || templ.empty()) {
        throw CorrelationError("ncc: empty input");
    }
    if (source.type() != templ.type()) {
        throw CorrelationError("ncc: source and template pixel types differ");
    }
    if (templ.cols > source.cols || templ.rows > source.rows) {
        throw CorrelationError("ncc: template larger than source");
    }

    cv::Mat response;
    try {
        cv::matchTemplate(source, templ, response, cv::TM_CCOEFF_NORMED);
    } catch (const cv::Exception& e) {
        throw CorrelationError(std::string("ncc: matchTemplate failed: ") +
                               e.what());
    }

    // Flat windows divide by zero inside matchTemplate.
    cv::patchNaNs(response, 0.0);

    double maxVal = 0.0;
    cv::Point maxLoc;
    cv::minMaxLoc(response, nullptr, &maxVal, nullptr, &maxLoc);

    Correlation out;
    out.score = std::isfinite(maxVal) ? std::clamp(maxVal, 0.0, 1.0) : 0.0;
    out.offset = {maxLoc.x, maxLoc.y};
    return out;
}

}  // namespace gamevision
