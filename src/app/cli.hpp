#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "capture/BackendFactory.hpp"
#include "image/ImageIO.hpp"
#include "input/InputTypes.hpp"
#include "match/MatchTypes.hpp"

namespace gamevision {

enum class Command {
    List,
    Windows,
    Monitors,
    Capture,
    Compare,
    Find,
    Help,
    Version
};

struct CliOptions {
    Command command = Command::Help;
    std::vector<std::string> args;

    BackendKind backend = BackendKind::Auto;
    bool debug = false;

    // capture / find
    std::optional<std::string> title;
    bool visibleOnly = false;
    std::optional<ImageFormat> format;
    int quality = 90;

    // find
    MultiScaleConfig match;
    bool all = false;
    bool click = false;
    bool inWindow = false;
    MouseButton button = MouseButton::Left;
    int delayMs = 50;
    bool randomDelay = false;
    bool restoreFocus = false;

    // compare
    CompareMethod method = CompareMethod::Template;
    double compareThreshold = 0.5;
    std::optional<std::string> output;
    bool verbose = false;
};

// Fills out from argv. Returns false with err set for unknown commands or
// flags, missing or out-of-range values and wrong positional counts.
bool parseCli(int argc, char** argv, CliOptions& out, std::string& err);

void printUsage(std::ostream& os, const char* exe);
const char* commandName(Command command);

}  // namespace gamevision
