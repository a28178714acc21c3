#pragma once

#include <memory>

#include "input/IInputBackend.hpp"
#include "platform/Log.hpp"

namespace gamevision {

std::unique_ptr<IInputBackend> CreateInputX11(Logger& log);

}  // namespace gamevision
