#include <cstdlib>
#include <memory>

#include "capture/BackendFactory.hpp"

#if defined(GAMEVISION_HAS_X11)
#include "capture/BackendX11.hpp"
#endif
#if defined(GAMEVISION_HAS_WIN32)
#include "capture/BackendWin32.hpp"
#endif

namespace gamevision {

namespace {

std::unique_ptr<ICaptureBackend> createX11(Logger& log) {
#if defined(GAMEVISION_HAS_X11)
    return CreateBackendX11(log);
#else
    (void)log;
    return nullptr;
#endif
}

std::unique_ptr<ICaptureBackend> createWin32(Logger& log) {
#if defined(GAMEVISION_HAS_WIN32)
    return CreateBackendWin32(log);
#else
    (void)log;
    return nullptr;
#endif
}

}  // namespace

class BackendAuto final : public ICaptureBackend {
public:
    explicit BackendAuto(Logger& log) : log_(log) {}

    std::string name() const override {
        auto backend = selectBackend();
        return backend ? backend->name() : "auto";
    }

    bool isAvailable() const override {
        return selectBackend() != nullptr;
    }

    std::vector<MonitorInfo> listMonitors() override {
        auto backend = selectBackend();
        if (!backend) {
            return {};
        }
        return backend->listMonitors();
    }

    std::vector<WindowInfo> listWindows(ProcessId pid) override {
        auto backend = selectBackend();
        if (!backend) {
            return {};
        }
        return backend->listWindows(pid);
    }

    CaptureOutcome captureWindow(ProcessId pid,
                                 const CaptureOptions& options) override {
        auto backend = selectBackend();
        if (!backend) {
            return CaptureOutcome::failure(CaptureStatus::CaptureFailed,
                                           "no capture backend available");
        }
        return backend->captureWindow(pid, options);
    }

private:
    ICaptureBackend* selectBackend() const {
        if (selected_) {
            return selected_.get();
        }

        auto win32 = createWin32(log_);
        if (win32 && win32->isAvailable()) {
            selected_ = std::move(win32);
            log_.debug("auto backend selected: win32");
            return selected_.get();
        }

        bool hasX11 = std::getenv("DISPLAY") != nullptr;
        if (hasX11) {
            auto backend = createX11(log_);
            if (backend && backend->isAvailable()) {
                if (std::getenv("WAYLAND_DISPLAY") != nullptr) {
                    log_.info("Wayland session: only XWayland windows can be "
                              "captured");
                }
                selected_ = std::move(backend);
                log_.debug("auto backend selected: x11");
                return selected_.get();
            }
        }

        log_.error("auto backend selection failed: no available backend");
        return nullptr;
    }

    Logger& log_;
    mutable std::unique_ptr<ICaptureBackend> selected_;
};

bool parseBackendKind(const std::string& text, BackendKind& kind) {
    if (text == "auto") {
        kind = BackendKind::Auto;
    } else if (text == "x11") {
        kind = BackendKind::X11;
    } else if (text == "win32") {
        kind = BackendKind::Win32;
    } else {
        return false;
    }
    return true;
}

const char* backendKindName(BackendKind kind) {
    switch (kind) {
        case BackendKind::Auto:
            return "auto";
        case BackendKind::X11:
            return "x11";
        case BackendKind::Win32:
            return "win32";
    }
    return "auto";
}

std::unique_ptr<ICaptureBackend> CreateCaptureBackend(BackendKind kind,
                                                      Logger& log) {
    switch (kind) {
        case BackendKind::Auto:
            return std::make_unique<BackendAuto>(log);
        case BackendKind::X11: {
            auto backend = createX11(log);
            if (!backend) {
                log.error("x11 backend disabled at build time");
            }
            return backend;
        }
        case BackendKind::Win32: {
            auto backend = createWin32(log);
            if (!backend) {
                log.error("win32 backend disabled at build time");
            }
            return backend;
        }
    }
    return nullptr;
}

}  // namespace gamevision
