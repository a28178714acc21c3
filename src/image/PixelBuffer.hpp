#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gamevision {

// Tightly packed RGBA8 image. Owned by whoever produced it; pass by const
// reference or move, never share the storage between calls.
struct PixelBuffer {
    int w = 0;
    int h = 0;
    std::vector<std::uint8_t> rgba;

    std::size_t expectedBytes() const {
        if (w <= 0 || h <= 0) {
            return 0;
        }
        return static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 4u;
    }

    bool empty() const {
        return w <= 0 || h <= 0 || rgba.size() != expectedBytes();
    }

    static PixelBuffer filled(int width, int height, std::uint8_t r,
                              std::uint8_t g, std::uint8_t b) {
        PixelBuffer out;
        out.w = width;
        out.h = height;
        out.rgba.resize(out.expectedBytes());
        for (size_t i = 0; i + 3 < out.rgba.size(); i += 4) {
            out.rgba[i + 0] = r;
            out.rgba[i + 1] = g;
            out.rgba[i + 2] = b;
            out.rgba[i + 3] = 255;
        }
        return out;
    }
};

}  // namespace gamevision
