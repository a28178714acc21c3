#pragma once

#include <string>

#include "image/PixelBuffer.hpp"

namespace gamevision {

enum class ImageFormat { Png, Jpeg };

std::string imageFormatToString(ImageFormat format);
bool parseImageFormat(const std::string& name, ImageFormat& out);

// Decodes PNG/JPEG/BMP/GIF into RGBA. Returns false and fills *err on failure.
bool loadImage(const std::string& path, PixelBuffer& out, std::string* err);

// quality is used for JPEG only (1-100).
bool saveImage(const PixelBuffer& image, const std::string& path,
               ImageFormat format, int quality, std::string* err);

}  // namespace gamevision
