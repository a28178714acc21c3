#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "platform/FileUtil.hpp"
#include "process/ProcessManager.hpp"

namespace gamevision {

namespace {

std::string stripExe(const std::string& name) {
    const std::string suffix = ".exe";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return name.substr(0, name.size() - suffix.size());
    }
    return name;
}

bool allDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool processNameMatches(const std::string& candidate, const std::string& query,
                        MatchMode mode) {
    if (query.empty()) {
        return false;
    }
    std::string lowerCandidate = toLowerAscii(candidate);
    std::string lowerQuery = toLowerAscii(query);
    switch (mode) {
        case MatchMode::Exact:
            return stripExe(lowerCandidate) == stripExe(lowerQuery);
        case MatchMode::Fuzzy:
            return lowerCandidate.find(lowerQuery) != std::string::npos;
    }
    return false;
}

std::optional<ProcessId> firstPidByName(IProcessManager& manager,
                                        const std::string& name,
                                        MatchMode mode, Logger& log) {
    auto matches = manager.findByName(name, mode);
    if (matches.empty()) {
        log.debug("process not found: %s", name.c_str());
        return std::nullopt;
    }
    if (matches.size() > 1) {
        log.info("found %zu processes matching %s, using pid %u",
                 matches.size(), name.c_str(),
                 static_cast<unsigned>(matches[0].pid));
        for (const auto& m : matches) {
            log.debug("  pid %u %s", static_cast<unsigned>(m.pid),
                      m.name.c_str());
        }
    }
    return matches[0].pid;
}

std::optional<ProcessId> resolveProcess(IProcessManager& manager,
                                        const std::string& nameOrPid,
                                        Logger& log) {
    if (allDigits(nameOrPid)) {
        unsigned long long value = std::strtoull(nameOrPid.c_str(), nullptr, 10);
        if (value == 0 || value > UINT32_MAX || nameOrPid.size() > 10) {
            log.warn("pid out of range: %s", nameOrPid.c_str());
            return std::nullopt;
        }
        auto pid = static_cast<ProcessId>(value);
        if (!manager.isRunning(pid)) {
            log.warn("pid %u is not running", static_cast<unsigned>(pid));
            return std::nullopt;
        }
        return pid;
    }
    auto pid = firstPidByName(manager, nameOrPid, MatchMode::Exact, log);
    if (!pid) {
        pid = firstPidByName(manager, nameOrPid, MatchMode::Fuzzy, log);
    }
    if (!pid) {
        log.warn("process not found: %s", nameOrPid.c_str());
    }
    return pid;
}

}  // namespace gamevision
