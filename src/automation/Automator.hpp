#pragma once

#include <string>
#include <vector>

#include "capture/ICaptureBackend.hpp"
#include "geometry/Geometry.hpp"
#include "image/PixelBuffer.hpp"
#include "input/IInputBackend.hpp"
#include "match/MatchTypes.hpp"
#include "match/MultiScaleMatcher.hpp"
#include "platform/Log.hpp"

namespace gamevision {

enum class AutomationStage { Capture, Match, Click, Done };

const char* automationStageName(AutomationStage stage);

struct FindRequest {
    ProcessId pid = 0;
    PixelBuffer templ;
    MultiScaleConfig config;
    CaptureOptions capture;
    // Every match above threshold instead of the best one.
    bool all = false;
    bool click = false;
    // Click through the window without moving the real pointer.
    bool inWindow = false;
    ClickOptions clickOptions;
};

struct FoundMatch {
    MatchResult match;
    ScreenRect screenBox;
    ScreenPoint screenCenter;
};

// stage is where the run stopped: Done on success, otherwise the failing
// stage with reason set.
struct AutomationOutcome {
    AutomationStage stage = AutomationStage::Capture;
    bool ok = false;
    std::string reason;
    CaptureStatus captureStatus = CaptureStatus::CaptureFailed;
    InputStatus inputStatus = InputStatus::Ok;
    WindowInfo window;
    WindowRect windowRect;
    bool occlusionTolerant = false;
    std::string strategy;
    std::vector<FoundMatch> matches;  // best first
    bool clicked = false;
    ScreenPoint clickPoint;
};

// capture -> match -> map -> click. Invalid requests throw
// std::invalid_argument before anything is captured.
class Automator {
public:
    // input may be null when no clicks are requested.
    Automator(ICaptureBackend& capture, const MultiScaleMatcher& matcher,
              IInputBackend* input, Logger& log);

    AutomationOutcome findAndAct(const FindRequest& request);

private:
    ICaptureBackend& capture_;
    const MultiScaleMatcher& matcher_;
    IInputBackend* input_;
    Logger& log_;
};

}  // namespace gamevision
