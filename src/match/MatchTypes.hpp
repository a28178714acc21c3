#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "geometry/Geometry.hpp"

namespace gamevision {

enum class CompareMethod { Template, Feature, Histogram, Similarity };

std::string compareMethodName(CompareMethod method);
bool parseCompareMethod(const std::string& name, CompareMethod& out);

// Scale-space search parameters. Scales run from minScale to maxScale
// inclusive in steps of scaleStep; only scores >= threshold count as matches.
struct MultiScaleConfig {
    double minScale = 0.7;
    double maxScale = 1.3;
    double scaleStep = 0.05;
    double threshold = 0.75;
    std::size_t maxResults = 5;

    // Throws std::invalid_argument naming the first violated bound.
    void validate() const;
};

// All geometry is relative to the source buffer's origin.
// similarity == 0 means "not found", not "weak match".
struct MatchResult {
    double similarity = 0.0;
    Point location;
    Rect boundingBox;
    double scale = 1.0;
    double confidence = 0.0;
    CompareMethod method = CompareMethod::Template;

    bool found() const {
        return similarity > 0.0;
    }

    static MatchResult notFound(CompareMethod method = CompareMethod::Template) {
        MatchResult r;
        r.method = method;
        return r;
    }
};

// Raised when the correlation primitive cannot process its inputs. Aborts the
// whole search.
class CorrelationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace gamevision
