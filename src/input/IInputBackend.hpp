#pragma once

#include <string>

#include "capture/CaptureTypes.hpp"
#include "input/InputTypes.hpp"

namespace gamevision {

// Synthesizes mouse input at absolute screen coordinates. On failure the
// returned status says what went wrong and *err, when given, the details.
class IInputBackend {
public:
    virtual ~IInputBackend() = default;
    virtual std::string name() const = 0;

    // Moves the real pointer, clicks, and restores pointer/focus as asked.
    virtual InputStatus click(int screenX, int screenY,
                              const ClickOptions& options,
                              std::string* err) = 0;

    // Delivers the click to the deepest child of window under the point
    // without moving the real pointer.
    virtual InputStatus clickInWindow(const WindowHandle& window, int screenX,
                                      int screenY, const ClickOptions& options,
                                      std::string* err) = 0;

    virtual bool screenSize(int& width, int& height) = 0;

    bool isValidCoordinate(int x, int y) {
        int width = 0;
        int height = 0;
        if (!screenSize(width, height)) {
            return false;
        }
        return x >= 0 && y >= 0 && x < width && y < height;
    }
};

}  // namespace gamevision
