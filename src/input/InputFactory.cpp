#include "input/InputFactory.hpp"

#include <cstdlib>

#if defined(GAMEVISION_HAS_X11)
#include "input/InputX11.hpp"
#endif
#if defined(GAMEVISION_HAS_WIN32)
#include "input/InputWin32.hpp"
#endif

namespace gamevision {

namespace {

std::unique_ptr<IInputBackend> createX11(Logger& log) {
#if defined(GAMEVISION_HAS_X11)
    return CreateInputX11(log);
#else
    (void)log;
    return nullptr;
#endif
}

std::unique_ptr<IInputBackend> createWin32(Logger& log) {
#if defined(GAMEVISION_HAS_WIN32)
    return CreateInputWin32(log);
#else
    (void)log;
    return nullptr;
#endif
}

}  // namespace

std::unique_ptr<IInputBackend> CreateInputBackend(BackendKind kind,
                                                  Logger& log) {
    switch (kind) {
        case BackendKind::Auto: {
            auto backend = createWin32(log);
            if (backend) {
                return backend;
            }
            if (std::getenv("DISPLAY") != nullptr) {
                backend = createX11(log);
            }
            if (!backend) {
                log.error("no input backend available");
            }
            return backend;
        }
        case BackendKind::X11: {
            auto backend = createX11(log);
            if (!backend) {
                log.error("x11 input disabled at build time");
            }
            return backend;
        }
        case BackendKind::Win32: {
            auto backend = createWin32(log);
            if (!backend) {
                log.error("win32 input disabled at build time");
            }
            return backend;
        }
    }
    return nullptr;
}

}  // namespace gamevision
