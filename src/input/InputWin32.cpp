#include "input/InputWin32.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <memory>
#include <string>
#include <utility>

#include "input/ClickJitter.hpp"
#include "platform/Time.hpp"

namespace gamevision {

namespace {

InputStatus fail(std::string* err, InputStatus status, std::string message) {
    if (err) {
        *err = std::move(message);
    }
    return status;
}

struct ButtonFlags {
    DWORD down;
    DWORD up;
    UINT downMsg;
    UINT upMsg;
    WPARAM downState;
};

ButtonFlags flagsFor(MouseButton button) {
    switch (button) {
        case MouseButton::Left:
            return {MOUSEEVENTF_LEFTDOWN, MOUSEEVENTF_LEFTUP, WM_LBUTTONDOWN,
                    WM_LBUTTONUP, MK_LBUTTON};
        case MouseButton::Right:
            return {MOUSEEVENTF_RIGHTDOWN, MOUSEEVENTF_RIGHTUP, WM_RBUTTONDOWN,
                    WM_RBUTTONUP, MK_RBUTTON};
        case MouseButton::Middle:
            return {MOUSEEVENTF_MIDDLEDOWN, MOUSEEVENTF_MIDDLEUP,
                    WM_MBUTTONDOWN, WM_MBUTTONUP, MK_MBUTTON};
    }
    return {MOUSEEVENTF_LEFTDOWN, MOUSEEVENTF_LEFTUP, WM_LBUTTONDOWN,
            WM_LBUTTONUP, MK_LBUTTON};
}

LPARAM packPoint(int x, int y) {
    return static_cast<LPARAM>((x & 0xFFFF) | ((y & 0xFFFF) << 16));
}

class Win32InputBackend final : public IInputBackend {
public:
    explicit Win32InputBackend(Logger& log) : log_(log) {}

    std::string name() const override {
        return "win32";
    }

    InputStatus click(int screenX, int screenY, const ClickOptions& options,
                      std::string* err) override {
        int width = 0;
        int height = 0;
        if (!screenSize(width, height)) {
            return fail(err, InputStatus::Failed,
                        "invalid screen dimensions");
        }
        if (screenX < 0 || screenY < 0 || screenX >= width ||
            screenY >= height) {
            return fail(err, InputStatus::InvalidCoordinate,
                        "coordinates (" + std::to_string(screenX) + ", " +
                            std::to_string(screenY) +
                            ") are out of screen bounds");
        }

        POINT saved;
        if (!GetCursorPos(&saved)) {
            return fail(err, InputStatus::Failed, "GetCursorPos failed");
        }
        HWND savedForeground = options.restoreFocus ? GetForegroundWindow()
                                                    : nullptr;
        if (options.randomDelay) {
            sleepMillis(jitter_.preDelayMs());
        }

        // Absolute SendInput coordinates are normalized to 0..65535.
        LONG absX = static_cast<LONG>((static_cast<long long>(screenX) * 65535) /
                                      width);
        LONG absY = static_cast<LONG>((static_cast<long long>(screenY) * 65535) /
                                      height);
        ButtonFlags flags = flagsFor(options.button);
        INPUT down;
        ZeroMemory(&down, sizeof(down));
        down.type = INPUT_MOUSE;
        down.mi.dx = absX;
        down.mi.dy = absY;
        down.mi.dwFlags = flags.down | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_MOVE;
        INPUT up = down;
        up.mi.dwFlags = flags.up | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_MOVE;

        auto send = [](INPUT& input) {
            return [&input](std::string& why) {
                if (SendInput(1, &input, sizeof(INPUT)) == 1) {
                    return true;
                }
                why = "SendInput error " + std::to_string(GetLastError());
                return false;
            };
        };
        InputStatus status =
            pressHoldRelease(send(down), send(up), options.delayMs, err);
        if (status != InputStatus::Ok) {
            return status;
        }
        if (options.randomDelay) {
            sleepMillis(jitter_.postDelayMs());
        }

        if (options.restoreCursor && !SetCursorPos(saved.x, saved.y)) {
            return fail(err, InputStatus::Failed,
                        "failed to restore cursor position");
        }
        if (savedForeground) {
            SetForegroundWindow(savedForeground);
            log_.debug("restored focus to hwnd %p",
                       static_cast<void*>(savedForeground));
        }
        log_.info("click performed at (%d, %d) with %s button", screenX,
                  screenY, mouseButtonName(options.button));
        return InputStatus::Ok;
    }

    InputStatus clickInWindow(const WindowHandle& window, int screenX,
                              int screenY, const ClickOptions& options,
                              std::string* err) override {
        HWND parent =
            reinterpret_cast<HWND>(static_cast<uintptr_t>(window.native()));
        if (!window.isValid() || !IsWindow(parent)) {
            return fail(err, InputStatus::Failed, "invalid window handle");
        }
        POINT pt{screenX, screenY};
        HWND target = WindowFromPoint(pt);
        if (!target || (target != parent && !IsChild(parent, target))) {
            log_.warn("WindowFromPoint did not hit the window, using the "
                      "top-level handle");
            target = parent;
        }
        POINT client = pt;
        if (!ScreenToClient(target, &client)) {
            return fail(err, InputStatus::Failed, "ScreenToClient failed");
        }

        if (options.randomDelay) {
            sleepMillis(jitter_.preDelayMs());
        }
        ButtonFlags flags = flagsFor(options.button);
        LPARAM lParam = packPoint(client.x, client.y);
        SendMessageW(target, WM_MOUSEMOVE, 0, lParam);
        sleepMillis(10);
        SendMessageW(target, flags.downMsg, flags.downState, lParam);
        sleepMillis(options.delayMs > 0 ? options.delayMs : 10);
        SendMessageW(target, flags.upMsg, 0, lParam);
        if (options.randomDelay) {
            sleepMillis(jitter_.postDelayMs());
        }
        log_.info("click sent to hwnd %p at client (%ld, %ld)",
                  static_cast<void*>(target), static_cast<long>(client.x),
                  static_cast<long>(client.y));
        return InputStatus::Ok;
    }

    bool screenSize(int& width, int& height) override {
        width = GetSystemMetrics(SM_CXSCREEN);
        height = GetSystemMetrics(SM_CYSCREEN);
        return width > 0 && height > 0;
    }

private:
    Logger& log_;
    ClickJitter jitter_;
};

}  // namespace

std::unique_ptr<IInputBackend> CreateInputWin32(Logger& log) {
    return std::make_unique<Win32InputBackend>(log);
}

}  // namespace gamevision
