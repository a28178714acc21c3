#pragma once

#include <opencv2/core.hpp>

#include "image/PixelBuffer.hpp"

namespace gamevision {

// RGBA8 buffer -> 3-channel BGR Mat (deep copy, alpha dropped).
cv::Mat toBgrMat(const PixelBuffer& image);

// Accepts CV_8UC1, CV_8UC3 (BGR) or CV_8UC4 (BGRA).
PixelBuffer fromBgrMat(const cv::Mat& mat);

}  // namespace gamevision
