#include "input/InputTypes.hpp"

#include <utility>

#include "platform/FileUtil.hpp"
#include "platform/Time.hpp"

namespace gamevision {

const char* mouseButtonName(MouseButton button) {
    switch (button) {
        case MouseButton::Left:
            return "left";
        case MouseButton::Right:
            return "right";
        case MouseButton::Middle:
            return "middle";
    }
    return "left";
}

bool parseMouseButton(const std::string& text, MouseButton& button) {
    std::string lower = toLowerAscii(text);
    if (lower == "left") {
        button = MouseButton::Left;
    } else if (lower == "right") {
        button = MouseButton::Right;
    } else if (lower == "middle") {
        button = MouseButton::Middle;
    } else {
        return false;
    }
    return true;
}

const char* inputStatusToString(InputStatus status) {
    switch (status) {
        case InputStatus::Ok:
            return "ok";
        case InputStatus::InvalidCoordinate:
            return "invalid coordinate";
        case InputStatus::Unsupported:
            return "unsupported";
        case InputStatus::Failed:
            return "failed";
    }
    return "failed";
}

InputStatus pressHoldRelease(const ButtonAction& press,
                             const ButtonAction& release, int holdMs,
                             std::string* err) {
    std::string why;
    if (!press(why)) {
        if (err) {
            *err = "press failed: " + why;
        }
        return InputStatus::Failed;
    }
    sleepMillis(holdMs);
    if (release(why)) {
        return InputStatus::Ok;
    }
    std::string firstWhy = std::move(why);
    why.clear();
    sleepMillis(10);
    if (release(why)) {
        return InputStatus::Ok;
    }
    if (err) {
        *err = "release failed, button may still be held: " + firstWhy;
    }
    return InputStatus::Failed;
}

}  // namespace gamevision
