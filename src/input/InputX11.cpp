#include "input/InputX11.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XTest.h>

#include <memory>
#include <string>
#include <utility>

#include "input/ClickJitter.hpp"
#include "platform/Time.hpp"
#include "platform/X11Display.hpp"

namespace gamevision {

namespace {

unsigned int x11Button(MouseButton button) {
    switch (button) {
        case MouseButton::Left:
            return Button1;
        case MouseButton::Middle:
            return Button2;
        case MouseButton::Right:
            return Button3;
    }
    return Button1;
}

unsigned int x11ButtonMask(MouseButton button) {
    switch (button) {
        case MouseButton::Left:
            return Button1Mask;
        case MouseButton::Middle:
            return Button2Mask;
        case MouseButton::Right:
            return Button3Mask;
    }
    return Button1Mask;
}

InputStatus fail(std::string* err, InputStatus status, std::string message) {
    if (err) {
        *err = std::move(message);
    }
    return status;
}

class X11InputBackend final : public IInputBackend {
public:
    explicit X11InputBackend(Logger& log) : log_(log) {}

    std::string name() const override {
        return "x11";
    }

    InputStatus click(int screenX, int screenY, const ClickOptions& options,
                      std::string* err) override {
        DisplayPtr display = openDisplay();
        if (!display) {
            return fail(err, InputStatus::Failed, "X11: cannot open display");
        }
        Display* dpy = display.get();
        if (!insideRoot(dpy, screenX, screenY)) {
            return fail(err, InputStatus::InvalidCoordinate,
                        outOfBoundsMessage(dpy, screenX, screenY));
        }
        int eventBase = 0;
        int errorBase = 0;
        int major = 0;
        int minor = 0;
        if (!XTestQueryExtension(dpy, &eventBase, &errorBase, &major,
                                 &minor)) {
            return fail(err, InputStatus::Unsupported,
                        "XTEST extension unavailable");
        }

        Window root = DefaultRootWindow(dpy);
        Window rootReturn = None;
        Window childReturn = None;
        int savedX = 0;
        int savedY = 0;
        int winX = 0;
        int winY = 0;
        unsigned int mask = 0;
        bool havePointer =
            XQueryPointer(dpy, root, &rootReturn, &childReturn, &savedX,
                          &savedY, &winX, &winY, &mask) == True;

        Window savedFocus = None;
        int savedRevert = RevertToParent;
        if (options.restoreFocus) {
            XGetInputFocus(dpy, &savedFocus, &savedRevert);
        }

        if (options.randomDelay) {
            sleepMillis(jitter_.preDelayMs());
        }

        X11ErrorTrap trap(dpy);
        const unsigned int button = x11Button(options.button);
        XTestFakeMotionEvent(dpy, -1, screenX, screenY, CurrentTime);
        XTestFakeButtonEvent(dpy, button, True, CurrentTime);
        XFlush(dpy);
        sleepMillis(options.delayMs);
        XTestFakeButtonEvent(dpy, button, False, CurrentTime);
        XFlush(dpy);

        if (options.randomDelay) {
            sleepMillis(jitter_.postDelayMs());
        }

        if (options.restoreCursor && havePointer) {
            XTestFakeMotionEvent(dpy, -1, savedX, savedY, CurrentTime);
        }
        if (options.restoreFocus && savedFocus != None &&
            savedFocus != PointerRoot) {
            XSetInputFocus(dpy, savedFocus, savedRevert, CurrentTime);
            log_.debug("X11: restored focus to 0x%lx", savedFocus);
        }
        if (trap.failed()) {
            return fail(err, InputStatus::Failed,
                        "X11 click failed: " + trap.describe());
        }

        log_.info("click performed at (%d, %d) with %s button", screenX,
                  screenY, mouseButtonName(options.button));
        return InputStatus::Ok;
    }

    InputStatus clickInWindow(const WindowHandle& window, int screenX,
                              int screenY, const ClickOptions& options,
                              std::string* err) override {
        if (!window.isValid()) {
            return fail(err, InputStatus::Failed, "invalid window handle");
        }
        DisplayPtr display = openDisplay();
        if (!display) {
            return fail(err, InputStatus::Failed, "X11: cannot open display");
        }
        Display* dpy = display.get();
        if (!insideRoot(dpy, screenX, screenY)) {
            return fail(err, InputStatus::InvalidCoordinate,
                        outOfBoundsMessage(dpy, screenX, screenY));
        }

        X11ErrorTrap trap(dpy);
        Window root = DefaultRootWindow(dpy);
        Window target = static_cast<Window>(window.native());
        int localX = 0;
        int localY = 0;
        if (!deepestChildAt(dpy, root, screenX, screenY, target, localX,
                            localY) ||
            trap.failed()) {
            return fail(err, InputStatus::Failed,
                        "point is not inside the window: " + trap.describe());
        }
        log_.debug("X11: screen (%d, %d) -> window 0x%lx local (%d, %d)",
                   screenX, screenY, target, localX, localY);

        if (options.randomDelay) {
            sleepMillis(jitter_.preDelayMs());
        }

        XEvent event;
        fillButtonEvent(event, dpy, root, target, localX, localY, screenX,
                        screenY, options.button);
        event.type = ButtonPress;
        event.xbutton.state = 0;
        Status pressed =
            XSendEvent(dpy, target, True, ButtonPressMask, &event);
        XFlush(dpy);
        sleepMillis(options.delayMs > 0 ? options.delayMs : 10);

        event.type = ButtonRelease;
        event.xbutton.state = x11ButtonMask(options.button);
        Status released =
            XSendEvent(dpy, target, True, ButtonReleaseMask, &event);
        XFlush(dpy);

        if (options.randomDelay) {
            sleepMillis(jitter_.postDelayMs());
        }
        if (!pressed || !released || trap.failed()) {
            return fail(err, InputStatus::Failed,
                        "XSendEvent failed: " + trap.describe());
        }
        log_.info("click sent to window 0x%lx at local (%d, %d)", target,
                  localX, localY);
        return InputStatus::Ok;
    }

    bool screenSize(int& width, int& height) override {
        DisplayPtr display = openDisplay();
        if (!display) {
            log_.error("X11: cannot open display for screen size");
            return false;
        }
        int screen = DefaultScreen(display.get());
        width = DisplayWidth(display.get(), screen);
        height = DisplayHeight(display.get(), screen);
        return width > 0 && height > 0;
    }

private:
    static bool insideRoot(Display* dpy, int x, int y) {
        int screen = DefaultScreen(dpy);
        return x >= 0 && y >= 0 && x < DisplayWidth(dpy, screen) &&
               y < DisplayHeight(dpy, screen);
    }

    static std::string outOfBoundsMessage(Display* dpy, int x, int y) {
        int screen = DefaultScreen(dpy);
        return "coordinates (" + std::to_string(x) + ", " + std::to_string(y) +
               ") are out of screen bounds (0, 0) to (" +
               std::to_string(DisplayWidth(dpy, screen) - 1) + ", " +
               std::to_string(DisplayHeight(dpy, screen) - 1) + ")";
    }

    // Descends from window to the deepest mapped child containing the
    // point. Fails when the point lies outside window itself.
    static bool deepestChildAt(Display* dpy, Window root, int screenX,
                               int screenY, Window& window, int& localX,
                               int& localY) {
        Window child = None;
        if (!XTranslateCoordinates(dpy, root, window, screenX, screenY,
                                   &localX, &localY, &child)) {
            return false;
        }
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(dpy, window, &attrs) || localX < 0 ||
            localY < 0 || localX >= attrs.width || localY >= attrs.height) {
            return false;
        }
        while (child != None) {
            Window next = None;
            window = child;
            if (!XTranslateCoordinates(dpy, root, window, screenX, screenY,
                                       &localX, &localY, &next)) {
                return false;
            }
            child = next;
        }
        return true;
    }

    static void fillButtonEvent(XEvent& event, Display* dpy, Window root,
                                Window target, int localX, int localY,
                                int screenX, int screenY, MouseButton button) {
        event = XEvent();
        event.xbutton.display = dpy;
        event.xbutton.window = target;
        event.xbutton.root = root;
        event.xbutton.subwindow = None;
        event.xbutton.time = CurrentTime;
        event.xbutton.x = localX;
        event.xbutton.y = localY;
        event.xbutton.x_root = screenX;
        event.xbutton.y_root = screenY;
        event.xbutton.button = x11Button(button);
        event.xbutton.same_screen = True;
    }

    Logger& log_;
    ClickJitter jitter_;
};

}  // namespace

std::unique_ptr<IInputBackend> CreateInputX11(Logger& log) {
    return std::make_unique<X11InputBackend>(log);
}

}  // namespace gamevision
