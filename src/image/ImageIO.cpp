#include "image/ImageIO.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "image/MatConvert.hpp"
#include "platform/FileUtil.hpp"

namespace gamevision {

std::string imageFormatToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:
            return "png";
        case ImageFormat::Jpeg:
            return "jpeg";
    }
    return "png";
}

bool parseImageFormat(const std::string& name, ImageFormat& out) {
    std::string lower = toLowerAscii(name);
    if (lower == "png") {
        out = ImageFormat::Png;
        return true;
    }
    if (lower == "jpeg" || lower == "jpg") {
        out = ImageFormat::Jpeg;
        return true;
    }
    return false;
}

bool loadImage(const std::string& path, PixelBuffer& out, std::string* err) {
    std::vector<unsigned char> bytes;
    if (!readFileBytes(path, bytes, err)) {
        return false;
    }
    if (bytes.empty()) {
        if (err) {
            *err = "image file is empty: " + path;
        }
        return false;
    }

    int w = 0;
    int h = 0;
    int n = 0;
    stbi_uc* data = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()), &w, &h, &n, 4);
    if (!data) {
        if (err) {
            const char* reason = stbi_failure_reason();
            *err = "failed to decode image " + path + ": " +
                   (reason ? reason : "unknown");
        }
        return false;
    }
    (void)n;

    out.w = w;
    out.h = h;
    out.rgba.assign(
        data, data + static_cast<size_t>(w) * static_cast<size_t>(h) * 4u);
    stbi_image_free(data);
    return true;
}

bool saveImage(const PixelBuffer& image, const std::string& path,
               ImageFormat format, int quality, std::string* err) {
    if (image.empty()) {
        if (err) {
            *err = "refusing to save an empty image";
        }
        return false;
    }

    std::vector<int> params;
    if (format == ImageFormat::Jpeg) {
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)};
    }

    try {
        cv::Mat bgr = toBgrMat(image);
        // Encode by requested format, not by the extension of path.
        std::string ext = format == ImageFormat::Jpeg ? ".jpg" : ".png";
        std::vector<unsigned char> encoded;
        if (!cv::imencode(ext, bgr, encoded, params)) {
            if (err) {
                *err = "failed to encode image as " +
                       imageFormatToString(format);
            }
            return false;
        }
        return writeFileBytes(path, encoded, err);
    } catch (const cv::Exception& e) {
        if (err) {
            *err = std::string("failed to encode image: ") + e.what();
        }
        return false;
    }
}

}  // namespace gamevision
