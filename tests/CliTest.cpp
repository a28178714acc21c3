#include <gtest/gtest.h>

#include <sstream>

#include "app/cli.hpp"
#include "TestSupport.hpp"

namespace gamevision {
namespace {

using test::Args;

bool parse(Args& args, CliOptions& out, std::string& err) {
    return parseCli(args.argc(), args.argv(), out, err);
}

TEST(CliTest, NoArgumentsShowsHelp) {
    Args args({});
    CliOptions options;
    std::string err;
    ASSERT_TRUE(parse(args, options, err)) << err;
    EXPECT_EQ(options.command, Command::Help);
}

TEST(CliTest, ParsesFindWithMatcherAndClickFlags) {
    Args args({"find", "game", "button.png", "--min-scale", "0.5",
               "--max-scale", "1.5", "--scale-step", "0.1", "--threshold",
               "0.8", "--max-results", "3", "--all", "--click", "--in-window",
               "--button", "right", "--delay", "120", "--random-delay",
               "--restore-focus", "--backend", "x11", "--debug"});
    CliOptions options;
    std::string err;
    ASSERT_TRUE(parse(args, options, err)) << err;

    EXPECT_EQ(options.command, Command::Find);
    ASSERT_EQ(options.args.size(), 2u);
    EXPECT_EQ(options.args[0], "game");
    EXPECT_EQ(options.args[1], "button.png");
    EXPECT_DOUBLE_EQ(options.match.minScale, 0.5);
    EXPECT_DOUBLE_EQ(options.match.maxScale, 1.5);
    EXPECT_DOUBLE_EQ(options.match.scaleStep, 0.1);
    EXPECT_DOUBLE_EQ(options.match.threshold, 0.8);
    EXPECT_EQ(options.match.maxResults, 3u);
    EXPECT_TRUE(options.all);
    EXPECT_TRUE(options.click);
    EXPECT_TRUE(options.inWindow);
    EXPECT_EQ(options.button, MouseButton::Right);
    EXPECT_EQ(options.delayMs, 120);
    EXPECT_TRUE(options.randomDelay);
    EXPECT_TRUE(options.restoreFocus);
    EXPECT_EQ(options.backend, BackendKind::X11);
    EXPECT_TRUE(options.debug);
}

TEST(CliTest, ParsesCaptureOptions) {
    Args args({"capture", "notepad", "shot.jpg", "--title", "Untitled",
               "--visible-only", "--format", "jpeg", "--quality", "70"});
    CliOptions options;
    std::string err;
    ASSERT_TRUE(parse(args, options, err)) << err;

    EXPECT_EQ(options.command, Command::Capture);
    ASSERT_TRUE(options.title.has_value());
    EXPECT_EQ(*options.title, "Untitled");
    EXPECT_TRUE(options.visibleOnly);
    ASSERT_TRUE(options.format.has_value());
    EXPECT_EQ(*options.format, ImageFormat::Jpeg);
    EXPECT_EQ(options.quality, 70);
}

TEST(CliTest, CompareDefaultsAndOverrides) {
    Args defaults({"compare", "a.png", "b.png"});
    CliOptions options;
    std::string err;
    ASSERT_TRUE(parse(defaults, options, err)) << err;
    EXPECT_EQ(options.method, CompareMethod::Template);
    EXPECT_DOUBLE_EQ(options.compareThreshold, 0.5);

    Args custom({"compare", "a.png", "b.png", "--method", "histogram",
                 "--threshold", "0.9", "--output", "out.txt", "--verbose"});
    CliOptions customOptions;
    ASSERT_TRUE(parse(custom, customOptions, err)) << err;
    EXPECT_EQ(customOptions.method, CompareMethod::Histogram);
    EXPECT_DOUBLE_EQ(customOptions.compareThreshold, 0.9);
    ASSERT_TRUE(customOptions.output.has_value());
    EXPECT_EQ(*customOptions.output, "out.txt");
    EXPECT_TRUE(customOptions.verbose);
}

TEST(CliTest, RejectsBadInput) {
    const std::vector<std::vector<const char*>> cases = {
        {"frobnicate"},
        {"find", "game"},
        {"list", "extra"},
        {"find", "game", "t.png", "--threshold", "1.5"},
        {"find", "game", "t.png", "--threshold", "abc"},
        {"find", "game", "t.png", "--min-scale", "1.4", "--max-scale", "1.2"},
        {"find", "game", "t.png", "--max-results", "0"},
        {"find", "game", "t.png", "--button", "side"},
        {"find", "game", "t.png", "--in-window"},
        {"capture", "game", "--quality", "101"},
        {"capture", "game", "--format", "gif"},
        {"list", "--backend", "wayland"},
        {"list", "--backend"},
        {"list", "--bogus"},
    };
    for (const auto& c : cases) {
        std::vector<std::string> owned(c.begin(), c.end());
        std::vector<char*> argv;
        std::string program = "gamevision";
        argv.push_back(&program[0]);
        for (auto& s : owned) {
            argv.push_back(&s[0]);
        }
        CliOptions options;
        std::string err;
        EXPECT_FALSE(parseCli(static_cast<int>(argv.size()), argv.data(),
                              options, err))
            << "accepted: " << owned[0] << " ...";
        EXPECT_FALSE(err.empty());
    }
}

TEST(CliTest, HelpFlagWinsOverCommandArguments) {
    Args args({"find", "game", "--help"});
    CliOptions options;
    std::string err;
    ASSERT_TRUE(parse(args, options, err)) << err;
    EXPECT_EQ(options.command, Command::Help);
}

TEST(CliTest, UsageMentionsEveryCommand) {
    std::ostringstream os;
    printUsage(os, "gamevision");
    for (const char* name : {"list", "windows", "monitors", "capture",
                             "compare", "find", "help", "version"}) {
        EXPECT_NE(os.str().find(name), std::string::npos) << name;
    }
    EXPECT_STREQ(commandName(Command::Find), "find");
}

}  // namespace
}  // namespace gamevision
