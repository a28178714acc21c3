#pragma once

#include <memory>

#include "input/IInputBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

std::unique_ptr<IInputBackend> CreateInputWin32(Logger& log);

}  // namespace gamevision
