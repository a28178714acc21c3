#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "geometry/Geometry.hpp"
#include "image/PixelBuffer.hpp"

namespace gamevision {

using ProcessId = std::uint32_t;

// Opaque platform window identifier (X11 Window, Win32 HWND). Validity is
// tracked separately from the value so a legitimate zero is never mistaken
// for "no window".
class WindowHandle {
public:
    WindowHandle() = default;

    static WindowHandle fromNative(std::uint64_t value) {
        WindowHandle h;
        h.value_ = value;
        h.valid_ = true;
        return h;
    }

    bool isValid() const {
        return valid_;
    }

    std::uint64_t native() const {
        return value_;
    }

    bool operator==(const WindowHandle& other) const {
        return valid_ == other.valid_ && (!valid_ || value_ == other.value_);
    }
    bool operator!=(const WindowHandle& other) const {
        return !(*this == other);
    }

private:
    std::uint64_t value_ = 0;
    bool valid_ = false;
};

struct WindowInfo {
    WindowHandle handle;
    std::string title;
    ProcessId pid = 0;
    WindowRect rect;
    bool visible = false;
};

struct MonitorInfo {
    std::string name;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    float scale = 1.0f;
    bool primary = false;
};

struct CaptureOptions {
    // Render the window even when covered by others. When false only the
    // visible-only strategy runs.
    bool includeHidden = true;
    // Case-insensitive substring filter on the window title.
    std::optional<std::string> windowTitle;
};

enum class CaptureStatus { Ok, WindowNotFound, CaptureFailed };

std::string captureStatusToString(CaptureStatus status);

struct CaptureResult {
    PixelBuffer image;
    WindowRect windowRect;  // read atomically with the pixels
    WindowInfo window;
    bool occlusionTolerant = false;
    std::string strategy;
};

struct CaptureOutcome {
    CaptureStatus status = CaptureStatus::CaptureFailed;
    std::string message;
    CaptureResult result;

    bool ok() const {
        return status == CaptureStatus::Ok;
    }

    static CaptureOutcome success(CaptureResult result) {
        CaptureOutcome o;
        o.status = CaptureStatus::Ok;
        o.result = std::move(result);
        return o;
    }

    static CaptureOutcome failure(CaptureStatus status, std::string message) {
        CaptureOutcome o;
        o.status = status;
        o.message = std::move(message);
        return o;
    }
};

}  // namespace gamevision
