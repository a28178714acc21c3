#pragma once

#include <opencv2/core.hpp>

#include <string>

#include "geometry/Geometry.hpp"

namespace gamevision {

struct Correlation {
    double score = 0.0;  // best score, clamped to [0, 1]
    Point offset;        // top-left of the best placement inside the source
};

// Stateless. Mismatched pixel types or a template larger than the source
// throw CorrelationError.
class ICorrelator {
public:
    virtual ~ICorrelator() = default;
    virtual std::string name() const = 0;
    virtual Correlation correlate(const cv::Mat& source,
                                  const cv::Mat& templ) const = 0;
};

// Normalized cross-correlation (cv::matchTemplate, TM_CCOEFF_NORMED).
class NccCorrelator final : public ICorrelator {
public:
    std::string name() const override {
        return "ncc";
    }
    Correlation correlate(const cv::Mat& source,
                          const cv::Mat& templ) const override;
};

}  // namespace gamevision
