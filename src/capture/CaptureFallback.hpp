#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"
#include "platform/Log.hpp"

namespace gamevision {

struct CaptureStrategy {
    std::string name;
    std::function<CaptureOutcome()> run;
};

// Runs the occlusion-tolerant primary, then the visible-only fallback once
// if the primary failed. Falling back logs a warning.
CaptureOutcome captureWithFallback(const CaptureStrategy& primary,
                                   const CaptureStrategy& fallback,
                                   const CaptureOptions& options,
                                   Logger& log);

// Reads the window rect again once the pixels are copied. A rect that
// changed or can no longer be read fails the capture, since the pixels no
// longer line up with result.windowRect.
CaptureOutcome confirmWindowRect(CaptureOutcome outcome,
                                 const std::function<bool(WindowRect&)>& readRect);

// First visible window whose title passes the filter, else the first window
// passing the filter.
std::optional<WindowInfo> selectTargetWindow(
    const std::vector<WindowInfo>& windows, const CaptureOptions& options);

}  // namespace gamevision
