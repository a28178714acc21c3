#pragma once

#include <functional>
#include <string>

namespace gamevision {

enum class MouseButton { Left, Right, Middle };

const char* mouseButtonName(MouseButton button);
bool parseMouseButton(const std::string& text, MouseButton& button);

struct ClickOptions {
    MouseButton button = MouseButton::Left;
    // Hold time between press and release.
    int delayMs = 50;
    // Adds 5-14 ms before the press and 3-9 ms after the release.
    bool randomDelay = false;
    // Gives focus back to the window that had it before the click.
    bool restoreFocus = false;
    // Moves the pointer back to where it was before the click.
    bool restoreCursor = true;
};

enum class InputStatus { Ok, InvalidCoordinate, Unsupported, Failed };

const char* inputStatusToString(InputStatus status);

// Sends one press or release; fills `why` and returns false when it could
// not be sent.
using ButtonAction = std::function<bool(std::string& why)>;

// Press, hold for holdMs, release. Once the press went through, a release
// that fails is sent a second time so the button is not left held down.
InputStatus pressHoldRelease(const ButtonAction& press,
                             const ButtonAction& release, int holdMs,
                             std::string* err);

}  // namespace gamevision
