#include "automation/Automator.hpp"

#include <stdexcept>
#include <utility>

#include "geometry/CoordinateMapper.hpp"

namespace gamevision {

const char* automationStageName(AutomationStage stage) {
    switch (stage) {
        case AutomationStage::Capture:
            return "capture";
        case AutomationStage::Match:
            return "match";
        case AutomationStage::Click:
            return "click";
        case AutomationStage::Done:
            return "done";
    }
    return "capture";
}

Automator::Automator(ICaptureBackend& capture, const MultiScaleMatcher& matcher,
                     IInputBackend* input, Logger& log)
    : capture_(capture), matcher_(matcher), input_(input), log_(log) {}

AutomationOutcome Automator::findAndAct(const FindRequest& request) {
    if (request.templ.empty()) {
        throw std::invalid_argument("template image is empty");
    }
    request.config.validate();

    AutomationOutcome outcome;
    outcome.stage = AutomationStage::Capture;
    CaptureOutcome captured = capture_.captureWindow(request.pid,
                                                     request.capture);
    outcome.captureStatus = captured.status;
    if (!captured.ok()) {
        outcome.reason = captured.message.empty()
                             ? captureStatusToString(captured.status)
                             : captured.message;
        return outcome;
    }
    const CaptureResult& frame = captured.result;
    outcome.window = frame.window;
    outcome.windowRect = frame.windowRect;
    outcome.occlusionTolerant = frame.occlusionTolerant;
    outcome.strategy = frame.strategy;
    log_.debug("captured %dx%d via %s", frame.image.w, frame.image.h,
               frame.strategy.c_str());

    outcome.stage = AutomationStage::Match;
    std::vector<MatchResult> matches;
    try {
        if (request.all) {
            matches = matcher_.matchAllScales(frame.image, request.templ,
                                              request.config);
        } else {
            MatchResult best = matcher_.matchBestScale(
                frame.image, request.templ, request.config);
            if (best.found()) {
                matches.push_back(best);
            }
        }
    } catch (const CorrelationError& e) {
        outcome.reason = std::string("correlation failed: ") + e.what();
        return outcome;
    }
    if (matches.empty()) {
        outcome.reason = "no match at threshold " +
                         std::to_string(request.config.threshold);
        return outcome;
    }
    for (const auto& m : matches) {
        FoundMatch found;
        found.match = m;
        found.screenBox = toScreenRect(m.boundingBox, frame.windowRect);
        found.screenCenter = clickTarget(m, frame.windowRect);
        outcome.matches.push_back(found);
    }

    if (request.click) {
        outcome.stage = AutomationStage::Click;
        if (!input_) {
            outcome.inputStatus = InputStatus::Unsupported;
            outcome.reason = "no input backend available";
            return outcome;
        }
        outcome.clickPoint = outcome.matches.front().screenCenter;
        std::string err;
        if (request.inWindow) {
            outcome.inputStatus = input_->clickInWindow(
                frame.window.handle, outcome.clickPoint.x,
                outcome.clickPoint.y, request.clickOptions, &err);
        } else {
            outcome.inputStatus =
                input_->click(outcome.clickPoint.x, outcome.clickPoint.y,
                              request.clickOptions, &err);
        }
        if (outcome.inputStatus != InputStatus::Ok) {
            outcome.reason = err.empty()
                                 ? inputStatusToString(outcome.inputStatus)
                                 : err;
            return outcome;
        }
        outcome.clicked = true;
    }

    outcome.stage = AutomationStage::Done;
    outcome.ok = true;
    return outcome;
}

}  // namespace gamevision
