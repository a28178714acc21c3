#pragma once

#include <memory>
#include <string>

#include "capture/ICaptureBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

enum class BackendKind { Auto, X11, Win32 };

bool parseBackendKind(const std::string& text, BackendKind& kind);
const char* backendKindName(BackendKind kind);

// nullptr when the requested backend was not compiled in.
std::unique_ptr<ICaptureBackend> CreateCaptureBackend(BackendKind kind,
                                                      Logger& log);

}  // namespace gamevision
