#pragma once

#include <memory>

#include "capture/BackendFactory.hpp"
#include "input/IInputBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

// Auto picks the actuator matching the platform the capture side would use.
std::unique_ptr<IInputBackend> CreateInputBackend(BackendKind kind,
                                                  Logger& log);

}  // namespace gamevision
