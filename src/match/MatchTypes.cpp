#include "match/MatchTypes.hpp"

#include <cmath>

#include "platform/FileUtil.hpp"

namespace gamevision {

std::string compareMethodName(CompareMethod method) {
    switch (method) {
        case CompareMethod::Template:
            return "template";
        case CompareMethod::Feature:
            return "feature";
        case CompareMethod::Histogram:
            return "histogram";
        case CompareMethod::Similarity:
            return "similarity";
    }
    return "template";
}

bool parseCompareMethod(const std::string& name, CompareMethod& out) {
    std::string lower = toLowerAscii(name);
    if (lower == "template") {
        out = CompareMethod::Template;
    } else if (lower == "feature") {
        out = CompareMethod::Feature;
    } else if (lower == "histogram") {
        out = CompareMethod::Histogram;
    } else if (lower == "similarity" || lower == "ssim") {
        out = CompareMethod::Similarity;
    } else {
        return false;
    }
    return true;
}

void MultiScaleConfig::validate() const {
    if (!std::isfinite(minScale) || minScale <= 0.0) {
        throw std::invalid_argument("minScale must be > 0");
    }
    if (!std::isfinite(maxScale) || maxScale < minScale) {
        throw std::invalid_argument("maxScale must be >= minScale");
    }
    if (!std::isfinite(scaleStep) || scaleStep <= 0.0) {
        throw std::invalid_argument("scaleStep must be > 0");
    }
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("threshold must be within [0, 1]");
    }
    if (maxResults < 1) {
        throw std::invalid_argument("maxResults must be >= 1");
    }
}

}  // namespace gamevision
