#include "image/MatConvert.hpp"

#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace gamevision {

cv::Mat toBgrMat(const PixelBuffer& image) {
    if (image.empty()) {
        throw std::invalid_argument("toBgrMat: empty pixel buffer");
    }
    // No copy here: the wrapper only lives until cvtColor has read it.
    cv::Mat rgba(image.h, image.w, CV_8UC4,
                 const_cast<std::uint8_t*>(image.rgba.data()));
    cv::Mat bgr;
    cv::cvtColor(rgba, bgr, cv::COLOR_RGBA2BGR);
    return bgr;
}

PixelBuffer fromBgrMat(const cv::Mat& mat) {
    if (mat.empty()) {
        throw std::invalid_argument("fromBgrMat: empty matrix");
    }
    cv::Mat rgba;
    switch (mat.type()) {
        case CV_8UC1:
            cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA);
            break;
        case CV_8UC3:
            cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA);
            break;
        case CV_8UC4:
            cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA);
            break;
        default:
            throw std::invalid_argument("fromBgrMat: unsupported matrix type");
    }
    if (!rgba.isContinuous()) {
        rgba = rgba.clone();
    }

    PixelBuffer out;
    out.w = rgba.cols;
    out.h = rgba.rows;
    out.rgba.assign(rgba.data, rgba.data + out.expectedBytes());
    return out;
}

}  // namespace gamevision
