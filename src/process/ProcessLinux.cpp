#include <dirent.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "platform/FileUtil.hpp"
#include "process/ProcessManager.hpp"

namespace gamevision {

namespace {

bool parsePidDir(const char* name, ProcessId& pid) {
    if (!name || name[0] == '\0') {
        return false;
    }
    char* end = nullptr;
    unsigned long value = std::strtoul(name, &end, 10);
    if (*end != '\0' || value == 0 || value > UINT32_MAX) {
        return false;
    }
    pid = static_cast<ProcessId>(value);
    return true;
}

// comm is truncated to 15 bytes by the kernel; the exe basename is not.
bool readProcess(ProcessId pid, ProcessInfo& info) {
    const std::string base = "/proc/" + std::to_string(pid);
    std::string comm;
    if (!readTextFile(base + "/comm", comm)) {
        return false;
    }
    info.pid = pid;
    info.name = trimWhitespace(comm);

    char target[PATH_MAX];
    ssize_t len = readlink((base + "/exe").c_str(), target, sizeof(target) - 1);
    if (len > 0) {
        target[len] = '\0';
        info.path = target;
        std::string exeName = info.path.substr(info.path.rfind('/') + 1);
        if (exeName.size() > info.name.size() &&
            exeName.compare(0, info.name.size(), info.name) == 0) {
            info.name = exeName;
        }
    }
    return true;
}

class LinuxProcessManager final : public IProcessManager {
public:
    explicit LinuxProcessManager(Logger& log) : log_(log) {}

    std::vector<ProcessInfo> listAll() override {
        std::vector<ProcessInfo> result;
        DIR* dir = opendir("/proc");
        if (!dir) {
            log_.error("failed to open /proc");
            return result;
        }
        while (dirent* entry = readdir(dir)) {
            ProcessId pid = 0;
            if (!parsePidDir(entry->d_name, pid)) {
                continue;
            }
            ProcessInfo info;
            if (readProcess(pid, info)) {
                result.push_back(std::move(info));
            }
        }
        closedir(dir);
        log_.debug("listed %zu processes", result.size());
        return result;
    }

    std::optional<ProcessInfo> findByPid(ProcessId pid) override {
        ProcessInfo info;
        if (!readProcess(pid, info)) {
            return std::nullopt;
        }
        return info;
    }

    bool isRunning(ProcessId pid) override {
        if (pid == 0) {
            return false;
        }
        if (kill(static_cast<pid_t>(pid), 0) == 0) {
            return true;
        }
        return errno == EPERM;
    }

private:
    Logger& log_;
};

}  // namespace

std::unique_ptr<IProcessManager> CreateProcessManager(Logger& log) {
    return std::make_unique<LinuxProcessManager>(log);
}

}  // namespace gamevision
