#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "capture/CaptureTypes.hpp"
#include "platform/Log.hpp"

namespace gamevision {

struct ProcessInfo {
    ProcessId pid = 0;
    std::string name;
    std::string path;
};

enum class MatchMode { Exact, Fuzzy };

// Exact: case-insensitive equality, a trailing ".exe" on either side is
// ignored. Fuzzy: case-insensitive substring.
bool processNameMatches(const std::string& candidate, const std::string& query,
                        MatchMode mode);

class IProcessManager {
public:
    virtual ~IProcessManager() = default;

    // Processes that disappear while being listed are skipped.
    virtual std::vector<ProcessInfo> listAll() = 0;
    virtual std::optional<ProcessInfo> findByPid(ProcessId pid) = 0;
    virtual bool isRunning(ProcessId pid) = 0;

    std::vector<ProcessInfo> findByName(const std::string& name,
                                        MatchMode mode) {
        std::vector<ProcessInfo> result;
        for (auto& info : listAll()) {
            if (processNameMatches(info.name, name, mode)) {
                result.push_back(std::move(info));
            }
        }
        return result;
    }
};

std::unique_ptr<IProcessManager> CreateProcessManager(Logger& log);

// First match in listing order; additional matches are logged.
std::optional<ProcessId> firstPidByName(IProcessManager& manager,
                                        const std::string& name,
                                        MatchMode mode, Logger& log);

// Accepts a decimal pid or a process name. Names are matched exactly first,
// then fuzzily.
std::optional<ProcessId> resolveProcess(IProcessManager& manager,
                                        const std::string& nameOrPid,
                                        Logger& log);

}  // namespace gamevision
