#include "capture/BackendX11.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xcomposite.h>

#include <cstdlib>
#include <memory>
#include <utility>
#include <string>

#include "capture/CaptureFallback.hpp"
#include "platform/X11Display.hpp"

namespace gamevision {

namespace {

// Whole property as 32-bit items (XA_CARDINAL / XA_WINDOW). Xlib stores
// format-32 data as longs.
std::vector<unsigned long> readLongProperty(Display* display, Window window,
                                            Atom property, Atom type) {
    std::vector<unsigned long> values;
    Atom actualType = None;
    int actualFormat = 0;
    unsigned long count = 0;
    unsigned long remaining = 0;
    unsigned char* data = nullptr;
    int rc = XGetWindowProperty(display, window, property, 0, 1L << 16, False,
                                type, &actualType, &actualFormat, &count,
                                &remaining, &data);
    if (rc == Success && data && actualType == type && actualFormat == 32) {
        const unsigned long* items = reinterpret_cast<unsigned long*>(data);
        values.assign(items, items + count);
    }
    if (data) {
        XFree(data);
    }
    return values;
}

std::string readWindowTitle(Display* display, Window window) {
    Atom netWmName = XInternAtom(display, "_NET_WM_NAME", False);
    Atom utf8 = XInternAtom(display, "UTF8_STRING", False);
    Atom actualType = None;
    int actualFormat = 0;
    unsigned long count = 0;
    unsigned long remaining = 0;
    unsigned char* data = nullptr;
    std::string title;
    if (XGetWindowProperty(display, window, netWmName, 0, 1024, False, utf8,
                           &actualType, &actualFormat, &count, &remaining,
                           &data) == Success &&
        data && actualFormat == 8) {
        title.assign(reinterpret_cast<char*>(data), count);
    }
    if (data) {
        XFree(data);
    }
    if (!title.empty()) {
        return title;
    }
    char* name = nullptr;
    if (XFetchName(display, window, &name) && name) {
        title = name;
        XFree(name);
    }
    return title;
}

bool windowPid(Display* display, Window window, ProcessId& pid) {
    Atom netWmPid = XInternAtom(display, "_NET_WM_PID", False);
    auto values = readLongProperty(display, window, netWmPid, XA_CARDINAL);
    if (values.empty()) {
        return false;
    }
    pid = static_cast<ProcessId>(values[0]);
    return true;
}

// Root-relative geometry. The caller holds the server grab when the rect
// must match a following pixel read.
bool readWindowRect(Display* display, Window window, WindowRect& rect,
                    bool& viewable) {
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display, window, &attrs)) {
        return false;
    }
    int rootX = 0;
    int rootY = 0;
    Window child = None;
    if (!XTranslateCoordinates(display, window, attrs.root, 0, 0, &rootX,
                               &rootY, &child)) {
        return false;
    }
    rect.minX = rootX;
    rect.minY = rootY;
    rect.maxX = rootX + attrs.width;
    rect.maxY = rootY + attrs.height;
    viewable = attrs.map_state == IsViewable;
    return true;
}

// Without an EWMH window manager, walk the tree two levels deep: top-level
// frames and the clients reparented into them.
void collectTreeWindows(Display* display, Window parent, int depth,
                        std::vector<Window>& out) {
    Window rootReturn = None;
    Window parentReturn = None;
    Window* children = nullptr;
    unsigned int count = 0;
    if (!XQueryTree(display, parent, &rootReturn, &parentReturn, &children,
                    &count)) {
        return;
    }
    for (unsigned int i = 0; i < count; ++i) {
        out.push_back(children[i]);
        if (depth > 1) {
            collectTreeWindows(display, children[i], depth - 1, out);
        }
    }
    if (children) {
        XFree(children);
    }
}

std::string ximageFailure(const char* what, X11ErrorTrap& trap) {
    std::string message = std::string(what) + " failed";
    if (trap.failed()) {
        message += ": " + trap.describe();
    }
    return message;
}

class X11CaptureBackend final : public ICaptureBackend {
public:
    explicit X11CaptureBackend(Logger& log) : log_(log) {}

    std::string name() const override {
        return "x11";
    }

    bool isAvailable() const override {
        return openDisplay() != nullptr;
    }

    std::vector<MonitorInfo> listMonitors() override {
        DisplayPtr display = openDisplay();
        if (!display) {
            log_.error("X11: failed to open display for monitor list");
            return {};
        }
        auto monitors = listMonitorsX11(display.get());
        if (monitors.empty()) {
            log_.warn("X11: XRandR reported no connected outputs");
        }
        return monitors;
    }

    std::vector<WindowInfo> listWindows(ProcessId pid) override {
        DisplayPtr display = openDisplay();
        if (!display) {
            log_.error("X11: failed to open display for window list");
            return {};
        }
        return listWindowsOn(display.get(), pid);
    }

    CaptureOutcome captureWindow(ProcessId pid,
                                 const CaptureOptions& options) override {
        DisplayPtr display = openDisplay();
        if (!display) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "X11: cannot open display");
        }
        auto target =
            selectTargetWindow(listWindowsOn(display.get(), pid), options);
        if (!target) {
            return CaptureOutcome::failure(
                CaptureStatus::WindowNotFound,
                "no top-level window for pid " + std::to_string(pid));
        }
        log_.debug("X11: capturing window 0x%llx \"%s\" of pid %u",
                   static_cast<unsigned long long>(target->handle.native()),
                   target->title.c_str(), static_cast<unsigned>(pid));

        Display* dpy = display.get();
        const WindowInfo window = *target;
        CaptureStrategy primary{
            "xcomposite",
            [this, dpy, &window]() { return captureComposite(dpy, window); }};
        CaptureStrategy fallback{
            "xgetimage-window",
            [this, dpy, &window]() { return captureVisible(dpy, window); }};
        return captureWithFallback(primary, fallback, options, log_);
    }

private:
    std::vector<WindowInfo> listWindowsOn(Display* display, ProcessId pid) {
        Window root = DefaultRootWindow(display);
        Atom clientList = XInternAtom(display, "_NET_CLIENT_LIST", False);
        std::vector<Window> candidates;
        for (unsigned long w :
             readLongProperty(display, root, clientList, XA_WINDOW)) {
            candidates.push_back(static_cast<Window>(w));
        }
        if (candidates.empty()) {
            log_.debug("X11: _NET_CLIENT_LIST unavailable, walking the tree");
            collectTreeWindows(display, root, 2, candidates);
        }

        std::vector<WindowInfo> result;
        X11ErrorTrap trap(display);
        for (Window w : candidates) {
            ProcessId owner = 0;
            if (!windowPid(display, w, owner) || owner != pid) {
                continue;
            }
            WindowInfo info;
            info.handle = WindowHandle::fromNative(static_cast<std::uint64_t>(w));
            info.pid = owner;
            info.title = readWindowTitle(display, w);
            if (!readWindowRect(display, w, info.rect, info.visible)) {
                // Destroyed between listing and query.
                continue;
            }
            result.push_back(info);
        }
        if (trap.failed()) {
            log_.debug("X11: ignored error while listing windows: %s",
                       trap.describe().c_str());
        }
        return result;
    }

    CaptureOutcome captureComposite(Display* display,
                                    const WindowInfo& target) {
        int eventBase = 0;
        int errorBase = 0;
        if (!XCompositeQueryExtension(display, &eventBase, &errorBase)) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "Composite extension unavailable");
        }
        int major = 0;
        int minor = 2;
        XCompositeQueryVersion(display, &major, &minor);
        if (major == 0 && minor < 2) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                "Composite 0.2 required for NameWindowPixmap");
        }
        if (!compositingManagerRunning(display, DefaultScreen(display))) {
            // A pixmap created by our own redirect starts as a copy of the
            // screen, covering windows included.
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "no compositing manager");
        }

        Window window = static_cast<Window>(target.handle.native());
        X11ErrorTrap trap(display);
        XCompositeRedirectWindow(display, window, CompositeRedirectAutomatic);
        if (trap.failed()) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                "XCompositeRedirectWindow: " + trap.describe());
        }

        CaptureOutcome outcome = readCompositePixmap(display, window, target);
        XCompositeUnredirectWindow(display, window, CompositeRedirectAutomatic);
        return outcome;
    }

    CaptureOutcome readCompositePixmap(Display* display, Window window,
                                       const WindowInfo& target) {
        X11ErrorTrap trap(display);
        X11ServerGrab grab(display);

        CaptureResult result;
        result.window = target;
        bool viewable = false;
        if (!readWindowRect(display, window, result.windowRect, viewable)) {
            return CaptureOutcome::failure(CaptureStatus::WindowNotFound,
                                           "window vanished before capture");
        }
        if (!viewable) {
            // Unmapped windows have no backing pixmap to name.
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "window is not mapped");
        }

        Pixmap pixmap = XCompositeNameWindowPixmap(display, window);
        if (trap.failed() || pixmap == None) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                ximageFailure("XCompositeNameWindowPixmap", trap));
        }

        const int w = result.windowRect.width();
        const int h = result.windowRect.height();
        XImage* image = XGetImage(display, pixmap, 0, 0,
                                  static_cast<unsigned int>(w),
                                  static_cast<unsigned int>(h), AllPlanes,
                                  ZPixmap);
        XFreePixmap(display, pixmap);
        if (!image) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                ximageFailure("XGetImage on composite pixmap", trap));
        }
        bool converted = ximageToPixelBuffer(image, w, h, result.image);
        XDestroyImage(image);
        if (!converted) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "pixel conversion failed");
        }
        result.window.rect = result.windowRect;
        return CaptureOutcome::success(std::move(result));
    }

    // Reads what is on screen inside the window's area; covered regions come
    // back with whatever the server has there.
    CaptureOutcome captureVisible(Display* display, const WindowInfo& target) {
        Window window = static_cast<Window>(target.handle.native());
        X11ErrorTrap trap(display);
        X11ServerGrab grab(display);

        CaptureResult result;
        result.window = target;
        bool viewable = false;
        if (!readWindowRect(display, window, result.windowRect, viewable)) {
            return CaptureOutcome::failure(CaptureStatus::WindowNotFound,
                                           "window vanished before capture");
        }
        if (!viewable) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "window is not viewable");
        }

        const int w = result.windowRect.width();
        const int h = result.windowRect.height();
        XImage* image = XGetImage(display, window, 0, 0,
                                  static_cast<unsigned int>(w),
                                  static_cast<unsigned int>(h), AllPlanes,
                                  ZPixmap);
        if (!image) {
            return CaptureOutcome::failure(
                CaptureStatus::CaptureFailed,
                ximageFailure("XGetImage on window", trap));
        }
        bool converted = ximageToPixelBuffer(image, w, h, result.image);
        XDestroyImage(image);
        if (!converted) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "pixel conversion failed");
        }
        result.window.rect = result.windowRect;
        return CaptureOutcome::success(std::move(result));
    }

    Logger& log_;
};

}  // namespace

std::unique_ptr<ICaptureBackend> CreateBackendX11(Logger& log) {
    return std::make_unique<X11CaptureBackend>(log);
}

}  // namespace gamevision
