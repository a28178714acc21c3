#pragma once

#include <X11/Xlib.h>

#include <memory>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"
#include "image/PixelBuffer.hpp"

namespace gamevision {

struct DisplayCloser {
    void operator()(Display* display) const {
        if (display) {
            XCloseDisplay(display);
        }
    }
};

using DisplayPtr = std::unique_ptr<Display, DisplayCloser>;

// nullptr when DISPLAY is unset or the server refuses the connection.
DisplayPtr openDisplay();

// Collects X protocol errors raised while it is alive instead of letting
// Xlib's default handler terminate the process. Not thread-safe: Xlib error
// handlers are process-wide.
class X11ErrorTrap {
public:
    explicit X11ErrorTrap(Display* display);
    ~X11ErrorTrap();

    X11ErrorTrap(const X11ErrorTrap&) = delete;
    X11ErrorTrap& operator=(const X11ErrorTrap&) = delete;

    // Flushes the request queue and reports whether any error arrived.
    bool failed();
    int errorCode() const;
    std::string describe() const;

private:
    Display* display_;
    int (*previous_)(Display*, XErrorEvent*) = nullptr;
};

// Holds the server grab for its lifetime so geometry and pixels are read
// against the same server state.
class X11ServerGrab {
public:
    explicit X11ServerGrab(Display* display) : display_(display) {
        XGrabServer(display_);
    }
    ~X11ServerGrab() {
        XUngrabServer(display_);
        XFlush(display_);
    }

    X11ServerGrab(const X11ServerGrab&) = delete;
    X11ServerGrab& operator=(const X11ServerGrab&) = delete;

private:
    Display* display_;
};

std::vector<MonitorInfo> listMonitorsX11(Display* display);

// Selection a compositing manager owns for the given screen (EWMH).
std::string compositingSelectionName(int screen);

// True when some client owns _NET_WM_CM_S<screen>. Without one, windows are
// only redirected for the length of a capture and their pixmap holds
// whatever covered them until the client repaints.
bool compositingManagerRunning(Display* display, int screen);

// ZPixmap XImage -> RGBA, honouring the visual's channel masks.
bool ximageToPixelBuffer(XImage* image, int w, int h, PixelBuffer& out);

}  // namespace gamevision
