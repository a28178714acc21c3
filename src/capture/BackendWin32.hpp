#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

std::unique_ptr<ICaptureBackend> CreateBackendWin32(Logger& log);

}  // namespace gamevision
