#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "launch_options.h"

namespace {

// Owns mutable copies of the arguments for the char *argv[] interface.
class Args {
public:
    Args(std::initializer_list<const char *> args) {
        for (const char *arg : args) storage_.emplace_back(arg);
        for (std::string &arg : storage_) pointers_.push_back(&arg[0]);
        pointers_.push_back(nullptr);
    }
    int argc() const { return (int)storage_.size(); }
    char **argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char *> pointers_;
};

std::vector<std::string> to_strings(const std::vector<char *> &argv) {
    std::vector<std::string> out;
    for (char *arg : argv) out.emplace_back(arg);
    return out;
}

} // namespace

TEST(LaunchOptionsTest, NoFlags) {
    Args args{"minifin", "--enable-logging"};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    EXPECT_FALSE(options.has_settle_delay);
    EXPECT_FALSE(options.has_url);
    EXPECT_EQ(effective_settle_delay_ms(options, 1000), 1000);
}

TEST(LaunchOptionsTest, SettleDelayEqualsForm) {
    Args args{"minifin", "--minifin-settle-ms=250"};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    ASSERT_TRUE(options.has_settle_delay);
    EXPECT_EQ(options.settle_delay_ms, 250);
    EXPECT_EQ(effective_settle_delay_ms(options, 1000), 250);
}

TEST(LaunchOptionsTest, SettleDelaySeparateForm) {
    Args args{"minifin", "--minifin-settle-ms", "0"};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    ASSERT_TRUE(options.has_settle_delay);
    EXPECT_EQ(options.settle_delay_ms, 0);
    EXPECT_EQ(effective_settle_delay_ms(options, 1000), 0);
}

TEST(LaunchOptionsTest, InvalidSettleDelayIgnored) {
    const char *values[] = {"-1", "60001", "fast", "10ms", ""};
    for (const char *value : values) {
        std::string arg = std::string("--minifin-settle-ms=") + value;
        Args args{"minifin", arg.c_str()};
        LaunchOptions options = parse_launch_options(args.argc(), args.argv());
        EXPECT_FALSE(options.has_settle_delay) << value;
    }
}

TEST(LaunchOptionsTest, UrlFlagIsRecorded) {
    Args separate{"minifin", "--minifin-url", "https://media.example.com"};
    LaunchOptions options = parse_launch_options(separate.argc(), separate.argv());
    ASSERT_TRUE(options.has_url);
    EXPECT_EQ(options.url, "https://media.example.com");

    Args equals{"minifin", "--minifin-url=media.example.com"};
    options = parse_launch_options(equals.argc(), equals.argv());
    ASSERT_TRUE(options.has_url);
    EXPECT_EQ(options.url, "media.example.com");
}

TEST(LaunchOptionsTest, EmptyUrlFlagIgnored) {
    Args args{"minifin", "--minifin-url="};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    EXPECT_FALSE(options.has_url);
}

TEST(LaunchOptionsTest, FlagPrefixAloneDoesNotMatch) {
    Args args{"minifin", "--minifin-urlx=https://x"};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    EXPECT_FALSE(options.has_url);
}

TEST(LaunchOptionsTest, CefArgvDropsOwnSwitches) {
    Args args{"minifin", "--minifin-settle-ms", "300", "--disable-gpu",
              "--minifin-url=https://x", "--type=renderer"};
    std::vector<char *> cef_argv;
    build_cef_argv(args.argc(), args.argv(), &cef_argv);
    std::vector<std::string> expected = {"minifin", "--disable-gpu", "--type=renderer"};
    EXPECT_EQ(to_strings(cef_argv), expected);
}

TEST(LaunchOptionsTest, CefArgvKeepsProgramNameOnly) {
    Args args{"minifin"};
    std::vector<char *> cef_argv;
    build_cef_argv(args.argc(), args.argv(), &cef_argv);
    ASSERT_EQ(cef_argv.size(), 1u);
    EXPECT_STREQ(cef_argv[0], "minifin");
}

TEST(LaunchOptionsTest, TrailingFlagWithoutValue) {
    Args args{"minifin", "--minifin-settle-ms"};
    LaunchOptions options = parse_launch_options(args.argc(), args.argv());
    EXPECT_FALSE(options.has_settle_delay);
    std::vector<char *> cef_argv;
    build_cef_argv(args.argc(), args.argv(), &cef_argv);
    EXPECT_EQ(cef_argv.size(), 1u);
}
