#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#define GAMEVISION_PRINTF_FORMAT(fmtIndex, argIndex) \
    __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define GAMEVISION_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace gamevision {

enum class LogLevel { Info, Warn, Error, Debug };

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Debug:
            return "DEBUG";
    }
    return "INFO";
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string& message) = 0;
};

class StderrSink final : public LogSink {
public:
    void write(LogLevel level, const std::string& message) override {
        std::fprintf(stderr, "[%s] %s\n", logLevelTag(level), message.c_str());
    }
};

// Appends to a file; the banner marks each process start.
class FileSink final : public LogSink {
public:
    explicit FileSink(const std::string& path) {
        file_ = std::fopen(path.c_str(), "a");
        if (file_) {
            std::fprintf(file_, "\n=== gamevision started ===\n");
            std::fflush(file_);
        }
    }

    ~FileSink() override {
        if (file_) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    bool isOpen() const {
        return file_ != nullptr;
    }

    void write(LogLevel level, const std::string& message) override {
        if (!file_) {
            return;
        }
        std::fprintf(file_, "[%s] %s\n", logLevelTag(level), message.c_str());
        std::fflush(file_);
    }

private:
    FILE* file_ = nullptr;
};

// Keeps every line in memory. Used by tests to assert on warnings.
class CapturingSink final : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string message;
    };

    void write(LogLevel level, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back({level, message});
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.level == level) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// Logger handed to every component by reference. With no sinks attached it
// discards everything.
class Logger {
public:
    Logger() = default;

    void addSink(std::shared_ptr<LogSink> sink) {
        if (sink) {
            sinks_.push_back(std::move(sink));
        }
    }

    void setDebugEnabled(bool enabled) {
        debugEnabled_ = enabled;
    }

    bool debugEnabled() const {
        return debugEnabled_;
    }

    GAMEVISION_PRINTF_FORMAT(2, 3)
    void info(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(LogLevel::Info, fmt, args);
        va_end(args);
    }

    GAMEVISION_PRINTF_FORMAT(2, 3)
    void warn(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(LogLevel::Warn, fmt, args);
        va_end(args);
    }

    GAMEVISION_PRINTF_FORMAT(2, 3)
    void error(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(LogLevel::Error, fmt, args);
        va_end(args);
    }

    GAMEVISION_PRINTF_FORMAT(2, 3)
    void debug(const char* fmt, ...) {
        if (!debugEnabled_) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        vlog(LogLevel::Debug, fmt, args);
        va_end(args);
    }

private:
    void vlog(LogLevel level, const char* fmt, va_list args) {
        if (sinks_.empty()) {
            return;
        }
        va_list sizing;
        va_copy(sizing, args);
        int len = std::vsnprintf(nullptr, 0, fmt, sizing);
        va_end(sizing);
        if (len < 0) {
            return;
        }
        std::string message(static_cast<std::size_t>(len), '\0');
        std::vsnprintf(&message[0], message.size() + 1, fmt, args);

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sink : sinks_) {
            sink->write(level, message);
        }
    }

    std::vector<std::shared_ptr<LogSink>> sinks_;
    bool debugEnabled_ = false;
    std::mutex mutex_;
};

// Stderr always, plus the file named by GAMEVISION_LOG_FILE when set.
inline void attachDefaultSinks(Logger& logger) {
    logger.addSink(std::make_shared<StderrSink>());
    const char* logPath = std::getenv("GAMEVISION_LOG_FILE");
    if (logPath && logPath[0] != '\0') {
        auto file = std::make_shared<FileSink>(logPath);
        if (file->isOpen()) {
            logger.addSink(std::move(file));
        } else {
            logger.warn("Cannot open log file %s", logPath);
        }
    }
}

}  // namespace gamevision
