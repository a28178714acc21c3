#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "app/cli.hpp"
#include "automation/Automator.hpp"
#include "capture/BackendFactory.hpp"
#include "capture/CaptureTypes.hpp"
#include "image/ImageIO.hpp"
#include "input/InputFactory.hpp"
#include "match/Correlator.hpp"
#include "match/ImageComparer.hpp"
#include "match/MultiScaleMatcher.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"
#include "process/ProcessManager.hpp"

namespace gamevision {

namespace {

constexpr const char* kVersion = "1.0.0";

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,  // also unexpected errors
    kExitProcessNotFound = 2,
    kExitCaptureFailed = 3,
    kExitNoMatch = 4,
    kExitClickFailed = 5,
};

void printMonitorList(const std::string& backendName,
                      const std::vector<MonitorInfo>& monitors) {
    std::cout << "Backend: " << backendName << "\n";
    if (monitors.empty()) {
        std::cout << "(no monitors reported)\n";
        return;
    }
    for (size_t i = 0; i < monitors.size(); ++i) {
        const auto& m = monitors[i];
        std::cout << "[" << i << "] " << m.name << " " << m.x << "," << m.y
                  << " " << m.w << "x" << m.h << " scale=" << m.scale;
        if (m.primary) {
            std::cout << " primary";
        }
        std::cout << "\n";
    }
}

void printWindowList(const std::vector<WindowInfo>& windows) {
    if (windows.empty()) {
        std::cout << "(no top-level windows)\n";
        return;
    }
    for (const auto& w : windows) {
        char handle[32];
        std::snprintf(handle, sizeof(handle), "0x%llx",
                      static_cast<unsigned long long>(w.handle.native()));
        std::cout << handle << " " << w.rect.minX << "," << w.rect.minY << " "
                  << w.rect.width() << "x" << w.rect.height()
                  << (w.visible ? " visible" : " hidden") << " \""
                  << w.title << "\"\n";
    }
}

ImageFormat formatForPath(const std::string& path) {
    std::string lower = toLowerAscii(path);
    auto endsWith = [&lower](const std::string& suffix) {
        return lower.size() >= suffix.size() &&
               lower.compare(lower.size() - suffix.size(), suffix.size(),
                             suffix) == 0;
    };
    if (endsWith(".jpg") || endsWith(".jpeg")) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Png;
}

std::unique_ptr<ICaptureBackend> openCaptureBackend(const CliOptions& options,
                                                    Logger& log) {
    auto backend = CreateCaptureBackend(options.backend, log);
    if (!backend) {
        log.error("failed to create backend");
        return nullptr;
    }
    if (!backend->isAvailable()) {
        if (options.backend == BackendKind::X11) {
            log.error(
                "X11 backend unavailable (DISPLAY missing or access denied)");
        } else {
            log.error("backend '%s' is not available",
                      backend->name().c_str());
        }
        return nullptr;
    }
    return backend;
}

int runList(Logger& log) {
    auto processes = CreateProcessManager(log)->listAll();
    std::cout << "Found " << processes.size() << " processes:\n";
    std::cout << "PID\tProcess Name\n";
    for (const auto& p : processes) {
        std::cout << p.pid << "\t" << p.name << "\n";
    }
    return kExitOk;
}

int runWindows(const CliOptions& options, Logger& log) {
    auto manager = CreateProcessManager(log);
    auto pid = resolveProcess(*manager, options.args[0], log);
    if (!pid) {
        log.error("process not found: %s", options.args[0].c_str());
        return kExitProcessNotFound;
    }
    auto backend = openCaptureBackend(options, log);
    if (!backend) {
        return kExitCaptureFailed;
    }
    std::cout << "Process " << options.args[0] << " (pid " << *pid << ")\n";
    printWindowList(backend->listWindows(*pid));
    return kExitOk;
}

int runMonitors(const CliOptions& options, Logger& log) {
    auto backend = openCaptureBackend(options, log);
    if (!backend) {
        return kExitCaptureFailed;
    }
    printMonitorList(backend->name(), backend->listMonitors());
    return kExitOk;
}

int runCapture(const CliOptions& options, Logger& log) {
    auto manager = CreateProcessManager(log);
    auto pid = resolveProcess(*manager, options.args[0], log);
    if (!pid) {
        log.error("process not found: %s", options.args[0].c_str());
        return kExitProcessNotFound;
    }
    auto backend = openCaptureBackend(options, log);
    if (!backend) {
        return kExitCaptureFailed;
    }

    CaptureOptions captureOptions;
    captureOptions.includeHidden = !options.visibleOnly;
    captureOptions.windowTitle = options.title;
    CaptureOutcome outcome = backend->captureWindow(*pid, captureOptions);
    if (!outcome.ok()) {
        log.error("capture failed (%s): %s",
                  captureStatusToString(outcome.status).c_str(),
                  outcome.message.c_str());
        return kExitCaptureFailed;
    }

    const std::string path =
        options.args.size() > 1 ? options.args[1] : "capture.png";
    ImageFormat format = options.format ? *options.format : formatForPath(path);
    std::string err;
    if (!saveImage(outcome.result.image, path, format, options.quality,
                   &err)) {
        log.error("failed to save screenshot: %s", err.c_str());
        return kExitCaptureFailed;
    }
    const auto& r = outcome.result;
    std::cout << "Screenshot saved to: " << path << "\n"
              << "Image size: " << r.image.w << "x" << r.image.h << "\n"
              << "Window: \"" << r.window.title << "\" at "
              << r.windowRect.minX << "," << r.windowRect.minY << "\n"
              << "Strategy: " << r.strategy
              << (r.occlusionTolerant ? " (occlusion tolerant)"
                                      : " (visible pixels only)")
              << "\n";
    return kExitOk;
}

int runCompare(const CliOptions& options, Logger& log) {
    const std::string& path1 = options.args[0];
    const std::string& path2 = options.args[1];
    PixelBuffer img1;
    PixelBuffer img2;
    std::string err;
    if (!loadImage(path1, img1, &err) || !loadImage(path2, img2, &err)) {
        log.error("%s", err.c_str());
        return kExitUsage;
    }

    NccCorrelator correlator;
    ImageComparer comparer(options.method, correlator, log);
    MatchResult result = comparer.compare(img1, img2);
    const bool isMatch = result.similarity >= options.compareThreshold;

    std::ostringstream report;
    report.setf(std::ios::fixed);
    report.precision(4);
    report << "Method: " << compareMethodName(result.method) << "\n"
           << "Similarity: " << result.similarity << "\n"
           << "Confidence: " << result.confidence << "\n";
    if (result.location.x != 0 || result.location.y != 0) {
        report << "Match location: (" << result.location.x << ", "
               << result.location.y << ")\n";
    }
    report.precision(2);
    report << "Match (threshold " << options.compareThreshold
           << "): " << (isMatch ? "true" : "false") << "\n";
    if (options.verbose) {
        report << "Image 1: " << path1 << " " << img1.w << "x" << img1.h
               << "\n"
               << "Image 2: " << path2 << " " << img2.w << "x" << img2.h
               << "\n";
    }
    std::cout << report.str();

    if (options.output) {
        if (!writeTextFile(*options.output, report.str(), &err)) {
            log.warn("failed to save result: %s", err.c_str());
        } else {
            std::cout << "Result saved to: " << *options.output << "\n";
        }
    }
    return isMatch ? kExitOk : kExitNoMatch;
}

int runFind(const CliOptions& options, Logger& log) {
    PixelBuffer templ;
    std::string err;
    if (!loadImage(options.args[1], templ, &err)) {
        log.error("%s", err.c_str());
        return kExitUsage;
    }
    auto manager = CreateProcessManager(log);
    auto pid = resolveProcess(*manager, options.args[0], log);
    if (!pid) {
        log.error("process not found: %s", options.args[0].c_str());
        return kExitProcessNotFound;
    }
    auto backend = openCaptureBackend(options, log);
    if (!backend) {
        return kExitCaptureFailed;
    }
    std::unique_ptr<IInputBackend> input;
    if (options.click) {
        input = CreateInputBackend(options.backend, log);
    }

    FindRequest request;
    request.pid = *pid;
    request.templ = std::move(templ);
    request.config = options.match;
    request.capture.includeHidden = !options.visibleOnly;
    request.capture.windowTitle = options.title;
    request.all = options.all;
    request.click = options.click;
    request.inWindow = options.inWindow;
    request.clickOptions.button = options.button;
    request.clickOptions.delayMs = options.delayMs;
    request.clickOptions.randomDelay = options.randomDelay;
    request.clickOptions.restoreFocus = options.restoreFocus;

    NccCorrelator correlator;
    MultiScaleMatcher matcher(correlator, log);
    Automator automator(*backend, matcher, input.get(), log);
    AutomationOutcome outcome = automator.findAndAct(request);

    for (size_t i = 0; i < outcome.matches.size(); ++i) {
        const auto& m = outcome.matches[i];
        std::printf(
            "[%zu] similarity=%.4f scale=%.2f window=(%d,%d) box=(%d,%d)-(%d,%d) "
            "screen=(%d,%d)-(%d,%d) centre=(%d,%d)\n",
            i, m.match.similarity, m.match.scale, m.match.location.x,
            m.match.location.y, m.match.boundingBox.minX,
            m.match.boundingBox.minY, m.match.boundingBox.maxX,
            m.match.boundingBox.maxY, m.screenBox.minX, m.screenBox.minY,
            m.screenBox.maxX, m.screenBox.maxY, m.screenCenter.x,
            m.screenCenter.y);
    }
    if (outcome.clicked) {
        std::printf("clicked at (%d,%d)\n", outcome.clickPoint.x,
                    outcome.clickPoint.y);
    }
    if (outcome.ok) {
        return kExitOk;
    }

    log.error("%s stage failed: %s", automationStageName(outcome.stage),
              outcome.reason.c_str());
    switch (outcome.stage) {
        case AutomationStage::Capture:
            return kExitCaptureFailed;
        case AutomationStage::Match:
            return kExitNoMatch;
        case AutomationStage::Click:
            return kExitClickFailed;
        case AutomationStage::Done:
            break;
    }
    return kExitOk;
}

int runCommand(const CliOptions& options, const char* exe, Logger& log) {
    switch (options.command) {
        case Command::List:
            return runList(log);
        case Command::Windows:
            return runWindows(options, log);
        case Command::Monitors:
            return runMonitors(options, log);
        case Command::Capture:
            return runCapture(options, log);
        case Command::Compare:
            return runCompare(options, log);
        case Command::Find:
            return runFind(options, log);
        case Command::Help:
            printUsage(std::cout, exe);
            return kExitOk;
        case Command::Version:
            std::cout << "gamevision " << kVersion << "\n";
            return kExitOk;
    }
    return kExitUsage;
}

}  // namespace

}  // namespace gamevision

int main(int argc, char** argv) {
    using namespace gamevision;

    Logger log;
    attachDefaultSinks(log);

    CliOptions options;
    std::string err;
    if (!parseCli(argc, argv, options, err)) {
        log.error("%s", err.c_str());
        printUsage(std::cerr, argv[0]);
        return kExitUsage;
    }
    log.setDebugEnabled(options.debug);
    log.debug("command: %s, backend: %s", commandName(options.command),
              backendKindName(options.backend));

    try {
        return runCommand(options, argv[0], log);
    } catch (const std::invalid_argument& e) {
        log.error("invalid argument: %s", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        log.error("%s", e.what());
        return kExitUsage;
    }
}
