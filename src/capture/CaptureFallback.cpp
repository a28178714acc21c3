#include "capture/CaptureFallback.hpp"

#include <utility>

#include "platform/FileUtil.hpp"

namespace gamevision {

namespace {

CaptureOutcome runStrategy(const CaptureStrategy& strategy, bool tolerant) {
    if (!strategy.run) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       strategy.name + ": not supported");
    }
    CaptureOutcome outcome = strategy.run();
    if (outcome.ok()) {
        if (outcome.result.image.empty() || outcome.result.windowRect.empty()) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                strategy.name + ": returned an empty image");
        }
        outcome.result.occlusionTolerant = tolerant;
        outcome.result.strategy = strategy.name;
    } else if (outcome.message.empty()) {
        outcome.message = strategy.name + ": " +
                          captureStatusToString(outcome.status);
    }
    return outcome;
}

}  // namespace

std::string captureStatusToString(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Ok:
            return "ok";
        case CaptureStatus::WindowNotFound:
            return "window not found";
        case CaptureStatus::CaptureFailed:
            return "capture failed";
    }
    return "capture failed";
}

CaptureOutcome captureWithFallback(const CaptureStrategy& primary,
                                   const CaptureStrategy& fallback,
                                   const CaptureOptions& options,
                                   Logger& log) {
    if (!options.includeHidden) {
        log.debug("capture: occlusion tolerance not requested, using %s",
                  fallback.name.c_str());
        return runStrategy(fallback, false);
    }

    CaptureOutcome first = runStrategy(primary, true);
    if (first.ok() || first.status == CaptureStatus::WindowNotFound) {
        return first;
    }

    log.warn("capture: %s failed (%s); falling back to %s, covered regions "
             "will not be captured",
             primary.name.c_str(), first.message.c_str(),
             fallback.name.c_str());

    CaptureOutcome second = runStrategy(fallback, false);
    if (second.ok() || second.status == CaptureStatus::WindowNotFound) {
        return second;
    }
    return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                   first.message + "; " + second.message);
}

CaptureOutcome confirmWindowRect(
    CaptureOutcome outcome, const std::function<bool(WindowRect&)>& readRect) {
    if (!outcome.ok()) {
        return outcome;
    }
    WindowRect after;
    if (!readRect(after)) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       "window vanished during capture");
    }
    if (!(after == outcome.result.windowRect)) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       "window moved during capture");
    }
    return outcome;
}

std::optional<WindowInfo> selectTargetWindow(
    const std::vector<WindowInfo>& windows, const CaptureOptions& options) {
    std::optional<WindowInfo> firstMatch;
    std::string filter =
        options.windowTitle ? toLowerAscii(*options.windowTitle) : "";
    for (const auto& w : windows) {
        if (!filter.empty() &&
            toLowerAscii(w.title).find(filter) == std::string::npos) {
            continue;
        }
        if (w.visible) {
            return w;
        }
        if (!firstMatch) {
            firstMatch = w;
        }
    }
    return firstMatch;
}

}  // namespace gamevision
