#include "capture/BackendWin32.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "capture/CaptureFallback.hpp"

#ifndef PW_RENDERFULLCONTENT
#define PW_RENDERFULLCONTENT 0x00000002
#endif

namespace gamevision {

namespace {

struct EnumContext {
    ProcessId pid;
    std::vector<WindowInfo>* out;
};

std::string windowTitle(HWND hwnd) {
    int length = GetWindowTextLengthW(hwnd);
    if (length <= 0) {
        return {};
    }
    std::wstring wide(static_cast<size_t>(length) + 1, L'\0');
    int copied = GetWindowTextW(hwnd, &wide[0], length + 1);
    wide.resize(static_cast<size_t>(copied > 0 ? copied : 0));
    int bytes = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(),
                                    static_cast<int>(wide.size()), nullptr, 0,
                                    nullptr, nullptr);
    std::string title(static_cast<size_t>(bytes > 0 ? bytes : 0), '\0');
    if (bytes > 0) {
        WideCharToMultiByte(CP_UTF8, 0, wide.c_str(),
                            static_cast<int>(wide.size()), &title[0], bytes,
                            nullptr, nullptr);
    }
    return title;
}

bool readWindowRect(HWND hwnd, WindowRect& rect) {
    RECT r;
    if (!GetWindowRect(hwnd, &r)) {
        return false;
    }
    rect.minX = r.left;
    rect.minY = r.top;
    rect.maxX = r.right;
    rect.maxY = r.bottom;
    return true;
}

BOOL CALLBACK collectWindow(HWND hwnd, LPARAM param) {
    auto* ctx = reinterpret_cast<EnumContext*>(param);
    DWORD owner = 0;
    GetWindowThreadProcessId(hwnd, &owner);
    if (owner != ctx->pid || GetWindow(hwnd, GW_OWNER) != nullptr) {
        return TRUE;
    }
    WindowInfo info;
    info.handle = WindowHandle::fromNative(
        static_cast<std::uint64_t>(reinterpret_cast<uintptr_t>(hwnd)));
    info.pid = owner;
    info.title = windowTitle(hwnd);
    info.visible = IsWindowVisible(hwnd) && !IsIconic(hwnd);
    if (readWindowRect(hwnd, info.rect)) {
        ctx->out->push_back(info);
    }
    return TRUE;
}

// BGRA top-down DIB -> RGBA.
void copyDibToRgba(const std::vector<std::uint8_t>& bgra, int w, int h,
                   PixelBuffer& out) {
    out.w = w;
    out.h = h;
    out.rgba.resize(out.expectedBytes());
    for (size_t i = 0; i < out.rgba.size(); i += 4) {
        out.rgba[i + 0] = bgra[i + 2];
        out.rgba[i + 1] = bgra[i + 1];
        out.rgba[i + 2] = bgra[i + 0];
        out.rgba[i + 3] = 255;
    }
}

enum class CopyMode { PrintWindow, BitBlt };

CaptureOutcome copyWindowPixels(HWND hwnd, const WindowInfo& target,
                                CopyMode mode) {
    CaptureResult result;
    result.window = target;
    if (!IsWindow(hwnd) || !readWindowRect(hwnd, result.windowRect)) {
        return CaptureOutcome::failure(CaptureStatus::WindowNotFound,
                                       "window vanished before capture");
    }
    const int w = result.windowRect.width();
    const int h = result.windowRect.height();
    if (w <= 0 || h <= 0) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       "window has an empty rectangle");
    }

    HDC source = mode == CopyMode::PrintWindow ? GetWindowDC(hwnd)
                                               : GetDC(nullptr);
    if (!source) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       "GetDC failed");
    }
    HDC memory = CreateCompatibleDC(source);
    HBITMAP bitmap = CreateCompatibleBitmap(source, w, h);
    HGDIOBJ previous = SelectObject(memory, bitmap);

    BOOL copied = FALSE;
    if (mode == CopyMode::PrintWindow) {
        copied = PrintWindow(hwnd, memory, PW_RENDERFULLCONTENT);
    } else {
        copied = BitBlt(memory, 0, 0, w, h, source, result.windowRect.minX,
                        result.windowRect.minY, SRCCOPY | CAPTUREBLT);
    }

    std::vector<std::uint8_t> bgra;
    if (copied) {
        BITMAPINFO bmi;
        ZeroMemory(&bmi, sizeof(bmi));
        bmi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
        bmi.bmiHeader.biWidth = w;
        bmi.bmiHeader.biHeight = -h;
        bmi.bmiHeader.biPlanes = 1;
        bmi.bmiHeader.biBitCount = 32;
        bmi.bmiHeader.biCompression = BI_RGB;
        bgra.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4u);
        SelectObject(memory, previous);
        if (GetDIBits(memory, bitmap, 0, static_cast<UINT>(h), bgra.data(),
                      &bmi, DIB_RGB_COLORS) != h) {
            bgra.clear();
        }
    } else {
        SelectObject(memory, previous);
    }

    DeleteObject(bitmap);
    DeleteDC(memory);
    if (mode == CopyMode::PrintWindow) {
        ReleaseDC(hwnd, source);
    } else {
        ReleaseDC(nullptr, source);
    }

    if (!copied) {
        return CaptureOutcome::failure(
            CaptureStatus::CaptureFailed,
            std::string(mode == CopyMode::PrintWindow ? "PrintWindow"
                                                      : "BitBlt") +
                " failed (error " + std::to_string(GetLastError()) + ")");
    }
    if (bgra.empty()) {
        return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                       "GetDIBits failed");
    }
    copyDibToRgba(bgra, w, h, result.image);
    result.window.rect = result.windowRect;
    return confirmWindowRect(
        CaptureOutcome::success(std::move(result)),
        [hwnd](WindowRect& rect) { return readWindowRect(hwnd, rect); });
}

BOOL CALLBACK collectMonitor(HMONITOR monitor, HDC, LPRECT, LPARAM param) {
    auto* out = reinterpret_cast<std::vector<MonitorInfo>*>(param);
    MONITORINFOEXA info;
    info.cbSize = sizeof(info);
    if (GetMonitorInfoA(monitor, &info)) {
        MonitorInfo mon;
        mon.name = info.szDevice;
        mon.x = info.rcMonitor.left;
        mon.y = info.rcMonitor.top;
        mon.w = info.rcMonitor.right - info.rcMonitor.left;
        mon.h = info.rcMonitor.bottom - info.rcMonitor.top;
        mon.primary = (info.dwFlags & MONITORINFOF_PRIMARY) != 0;
        out->push_back(mon);
    }
    return TRUE;
}

class Win32CaptureBackend final : public ICaptureBackend {
public:
    explicit Win32CaptureBackend(Logger& log) : log_(log) {}

    std::string name() const override {
        return "win32";
    }

    bool isAvailable() const override {
        return GetDesktopWindow() != nullptr;
    }

    std::vector<MonitorInfo> listMonitors() override {
        std::vector<MonitorInfo> result;
        if (!EnumDisplayMonitors(nullptr, nullptr, collectMonitor,
                                 reinterpret_cast<LPARAM>(&result))) {
            log_.error("Win32: EnumDisplayMonitors failed");
        }
        return result;
    }

    std::vector<WindowInfo> listWindows(ProcessId pid) override {
        std::vector<WindowInfo> result;
        EnumContext ctx{pid, &result};
        if (!EnumWindows(collectWindow, reinterpret_cast<LPARAM>(&ctx))) {
            log_.error("Win32: EnumWindows failed (error %lu)",
                       static_cast<unsigned long>(GetLastError()));
        }
        return result;
    }

    CaptureOutcome captureWindow(ProcessId pid,
                                 const CaptureOptions& options) override {
        auto target = selectTargetWindow(listWindows(pid), options);
        if (!target) {
            return CaptureOutcome::failure(
                CaptureStatus::WindowNotFound,
                "no top-level window for pid " + std::to_string(pid));
        }
        HWND hwnd = reinterpret_cast<HWND>(
            static_cast<uintptr_t>(target->handle.native()));
        const WindowInfo window = *target;
        CaptureStrategy primary{"printwindow", [hwnd, &window]() {
                                    return copyWindowPixels(
                                        hwnd, window, CopyMode::PrintWindow);
                                }};
        CaptureStrategy fallback{"bitblt-screen", [hwnd, &window]() {
                                     return copyWindowPixels(hwnd, window,
                                                             CopyMode::BitBlt);
                                 }};
        return captureWithFallback(primary, fallback, options, log_);
    }

private:
    Logger& log_;
};

}  // namespace

std::unique_ptr<ICaptureBackend> CreateBackendWin32(Logger& log) {
    return std::make_unique<Win32CaptureBackend>(log);
}

}  // namespace gamevision
