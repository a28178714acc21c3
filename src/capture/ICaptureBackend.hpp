#pragma once

#include <memory>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace gamevision {

class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;
    virtual std::string name() const = 0;
    virtual bool isAvailable() const = 0;
    virtual std::vector<MonitorInfo> listMonitors() = 0;
    // Top-level windows owned by pid, in stacking/enumeration order.
    virtual std::vector<WindowInfo> listWindows(ProcessId pid) = 0;
    virtual CaptureOutcome captureWindow(ProcessId pid,
                                         const CaptureOptions& options) = 0;
};

}  // namespace gamevision
