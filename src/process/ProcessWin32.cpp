#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>

#include <string>

#include "process/ProcessManager.hpp"

namespace gamevision {

namespace {

std::string narrow(const wchar_t* wide) {
    int bytes = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr,
                                    nullptr);
    if (bytes <= 1) {
        return {};
    }
    std::string out(static_cast<size_t>(bytes - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, &out[0], bytes, nullptr,
                        nullptr);
    return out;
}

std::string imagePath(DWORD pid) {
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process) {
        return {};
    }
    wchar_t buffer[MAX_PATH];
    DWORD size = MAX_PATH;
    std::string path;
    if (QueryFullProcessImageNameW(process, 0, buffer, &size)) {
        path = narrow(buffer);
    }
    CloseHandle(process);
    return path;
}

class Win32ProcessManager final : public IProcessManager {
public:
    explicit Win32ProcessManager(Logger& log) : log_(log) {}

    std::vector<ProcessInfo> listAll() override {
        std::vector<ProcessInfo> result;
        HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
        if (snapshot == INVALID_HANDLE_VALUE) {
            log_.error("CreateToolhelp32Snapshot failed (error %lu)",
                       static_cast<unsigned long>(GetLastError()));
            return result;
        }
        PROCESSENTRY32W entry;
        entry.dwSize = sizeof(entry);
        if (Process32FirstW(snapshot, &entry)) {
            do {
                ProcessInfo info;
                info.pid = entry.th32ProcessID;
                info.name = narrow(entry.szExeFile);
                info.path = imagePath(entry.th32ProcessID);
                result.push_back(std::move(info));
            } while (Process32NextW(snapshot, &entry));
        }
        CloseHandle(snapshot);
        log_.debug("listed %zu processes", result.size());
        return result;
    }

    std::optional<ProcessInfo> findByPid(ProcessId pid) override {
        for (auto& info : listAll()) {
            if (info.pid == pid) {
                return info;
            }
        }
        return std::nullopt;
    }

    bool isRunning(ProcessId pid) override {
        HANDLE process =
            OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
        if (!process) {
            return false;
        }
        DWORD code = 0;
        bool running = GetExitCodeProcess(process, &code) && code == STILL_ACTIVE;
        CloseHandle(process);
        return running;
    }

private:
    Logger& log_;
};

}  // namespace

std::unique_ptr<IProcessManager> CreateProcessManager(Logger& log) {
    return std::make_unique<Win32ProcessManager>(log);
}

}  // namespace gamevision
