#pragma once

#include <memory>

#include "capture/ICaptureBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

std::unique_ptr<ICaptureBackend> CreateBackendX11(Logger& log);

}  // namespace gamevision
