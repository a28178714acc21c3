#include "app/cli.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ostream>

namespace gamevision {

namespace {

struct CommandEntry {
    const char* name;
    Command command;
    std::size_t minArgs;
    std::size_t maxArgs;
};

const CommandEntry kCommands[] = {
    {"list", Command::List, 0, 0},
    {"windows", Command::Windows, 1, 1},
    {"monitors", Command::Monitors, 0, 0},
    {"capture", Command::Capture, 1, 2},
    {"compare", Command::Compare, 2, 2},
    {"find", Command::Find, 2, 2},
    {"help", Command::Help, 0, 0},
    {"version", Command::Version, 0, 0},
};

bool takeValue(int argc, char** argv, int& i, const std::string& flag,
               std::string& value, std::string& err) {
    if (i + 1 >= argc) {
        err = flag + " requires a value";
        return false;
    }
    value = argv[++i];
    return true;
}

bool parseDouble(const std::string& flag, const std::string& text, double lo,
                 double hi, double& out, std::string& err) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || errno == ERANGE ||
        !std::isfinite(value)) {
        err = flag + ": not a number: " + text;
        return false;
    }
    if (value < lo || value > hi) {
        err = flag + ": value out of range: " + text;
        return false;
    }
    out = value;
    return true;
}

bool parseInt(const std::string& flag, const std::string& text, long lo,
              long hi, long& out, std::string& err) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE) {
        err = flag + ": not an integer: " + text;
        return false;
    }
    if (value < lo || value > hi) {
        err = flag + ": value out of range: " + text;
        return false;
    }
    out = value;
    return true;
}

}  // namespace

const char* commandName(Command command) {
    for (const auto& entry : kCommands) {
        if (entry.command == command) {
            return entry.name;
        }
    }
    return "help";
}

void printUsage(std::ostream& os, const char* exe) {
    os << "Usage: " << exe << " <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  list                           List running processes\n"
       << "  windows <process>              List top-level windows of a "
          "process\n"
       << "  monitors                       List monitors\n"
       << "  capture <process> [output]     Capture a window "
          "(default: capture.png)\n"
       << "  compare <image1> <image2>      Compare two images\n"
       << "  find <process> <template>      Locate a template in a window\n"
       << "  help                           Show this help message\n"
       << "  version                        Show version information\n"
       << "\n"
       << "<process> is a process name or a pid.\n"
       << "\n"
       << "Global options:\n"
       << "  --backend <mode>       Platform backend: auto|x11|win32 "
          "(default: auto)\n"
       << "  --debug                Enable debug logging\n"
       << "\n"
       << "Capture options:\n"
       << "  --title <text>         Only windows whose title contains text\n"
       << "  --visible-only         Skip the occlusion-tolerant capture\n"
       << "  --format <fmt>         png|jpeg (default: from file name)\n"
       << "  --quality <1-100>      JPEG quality (default: 90)\n"
       << "\n"
       << "Find options:\n"
       << "  --min-scale <s>        Smallest template scale (default: 0.7)\n"
       << "  --max-scale <s>        Largest template scale (default: 1.3)\n"
       << "  --scale-step <s>       Scale increment (default: 0.05)\n"
       << "  --threshold <v>        Minimum similarity 0-1 (default: 0.75, "
          "compare: 0.5)\n"
       << "  --max-results <n>      Matches reported with --all "
          "(default: 5)\n"
       << "  --all                  Report every match, not just the best\n"
       << "  --click                Click the centre of the best match\n"
       << "  --in-window            Click through the window, leave the "
          "pointer alone\n"
       << "  --button <b>           left|right|middle (default: left)\n"
       << "  --delay <ms>           Press-to-release delay (default: 50)\n"
       << "  --random-delay         Randomize timing around the click\n"
       << "  --restore-focus        Give focus back after the click\n"
       << "\n"
       << "Compare options:\n"
       << "  --method <m>           template|feature|histogram|similarity\n"
       << "  --output <file>        Write the result to a file\n"
       << "  --verbose              Show detailed information\n"
       << "\n"
       << "Environment:\n"
       << "  GAMEVISION_LOG_FILE    Also append log lines to this file\n";
}

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err) {
    bool haveCommand = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (arg == "--backend") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            if (!parseBackendKind(value, out.backend)) {
                err = "unknown backend: " + value;
                return false;
            }
        } else if (arg == "--debug") {
            out.debug = true;
        } else if (arg == "--title") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            out.title = value;
        } else if (arg == "--visible-only") {
            out.visibleOnly = true;
        } else if (arg == "--format") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            ImageFormat format = ImageFormat::Png;
            if (!parseImageFormat(value, format)) {
                err = "unknown image format: " + value;
                return false;
            }
            out.format = format;
        } else if (arg == "--quality") {
            long quality = 0;
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseInt(arg, value, 1, 100, quality, err)) {
                return false;
            }
            out.quality = static_cast<int>(quality);
        } else if (arg == "--min-scale") {
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseDouble(arg, value, 0.01, 100.0, out.match.minScale,
                             err)) {
                return false;
            }
        } else if (arg == "--max-scale") {
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseDouble(arg, value, 0.01, 100.0, out.match.maxScale,
                             err)) {
                return false;
            }
        } else if (arg == "--scale-step") {
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseDouble(arg, value, 0.001, 100.0, out.match.scaleStep,
                             err)) {
                return false;
            }
        } else if (arg == "--threshold") {
            double threshold = 0.0;
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseDouble(arg, value, 0.0, 1.0, threshold, err)) {
                return false;
            }
            out.match.threshold = threshold;
            out.compareThreshold = threshold;
        } else if (arg == "--max-results") {
            long maxResults = 0;
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseInt(arg, value, 1, 1000, maxResults, err)) {
                return false;
            }
            out.match.maxResults = static_cast<std::size_t>(maxResults);
        } else if (arg == "--all") {
            out.all = true;
        } else if (arg == "--click") {
            out.click = true;
        } else if (arg == "--in-window") {
            out.inWindow = true;
        } else if (arg == "--button") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            if (!parseMouseButton(value, out.button)) {
                err = "unknown mouse button: " + value;
                return false;
            }
        } else if (arg == "--delay") {
            long delay = 0;
            if (!takeValue(argc, argv, i, arg, value, err) ||
                !parseInt(arg, value, 0, 10000, delay, err)) {
                return false;
            }
            out.delayMs = static_cast<int>(delay);
        } else if (arg == "--random-delay") {
            out.randomDelay = true;
        } else if (arg == "--restore-focus") {
            out.restoreFocus = true;
        } else if (arg == "--method") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            if (!parseCompareMethod(value, out.method)) {
                err = "unknown compare method: " + value;
                return false;
            }
        } else if (arg == "--output") {
            if (!takeValue(argc, argv, i, arg, value, err)) {
                return false;
            }
            out.output = value;
        } else if (arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            out.command = Command::Help;
            haveCommand = true;
        } else if (arg == "-v" || arg == "--version") {
            out.command = Command::Version;
            haveCommand = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err = "unknown argument: " + arg;
            return false;
        } else if (!haveCommand) {
            bool known = false;
            for (const auto& entry : kCommands) {
                if (arg == entry.name) {
                    out.command = entry.command;
                    known = true;
                    break;
                }
            }
            if (!known) {
                err = "unknown command: " + arg;
                return false;
            }
            haveCommand = true;
        } else {
            out.args.push_back(arg);
        }
    }

    if (out.command == Command::Help || out.command == Command::Version) {
        out.args.clear();
        return true;
    }
    for (const auto& entry : kCommands) {
        if (entry.command != out.command) {
            continue;
        }
        if (out.args.size() < entry.minArgs || out.args.size() > entry.maxArgs) {
            err = std::string("wrong number of arguments for '") + entry.name +
                  "'";
            return false;
        }
    }
    if (out.match.minScale > out.match.maxScale) {
        err = "--min-scale must not exceed --max-scale";
        return false;
    }
    if (out.inWindow && !out.click) {
        err = "--in-window requires --click";
        return false;
    }
    return true;
}

}  // namespace gamevision
