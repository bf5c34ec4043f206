#include <sstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "testrunner/arguments.hpp"
#include "testrunner/common/exceptions.hpp"
#include "testrunner/config.hpp"

using namespace std;
using namespace testrunner;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ArgumentsTest, CommandOnlyTest) {
    invocation inv = parse_arguments({"./tst_foo", "arg1", "arg2"});
    EXPECT_FALSE(inv.help);
    EXPECT_FALSE(inv.verbose);
    EXPECT_FALSE(inv.use_timeout);
    EXPECT_TRUE(inv.label.empty());
    EXPECT_TRUE(inv.chdir.empty());
    EXPECT_THAT(inv.command, ElementsAre("./tst_foo", "arg1", "arg2"));
}

TEST(ArgumentsTest, SingleTokenCommandTest) {
    invocation inv = parse_arguments({"--verbose", "./tst_foo"});
    EXPECT_TRUE(inv.verbose);
    EXPECT_THAT(inv.command, ElementsAre("./tst_foo"));
}

TEST(ArgumentsTest, AllOptionsTest) {
    invocation inv = parse_arguments({"--verbose", "--label=tst_foo", "--timeout", "2.5", "--chdir", "/tmp", "--", "./tst_foo"});
    EXPECT_TRUE(inv.verbose);
    EXPECT_EQ(inv.label, "tst_foo");
    EXPECT_TRUE(inv.use_timeout);
    EXPECT_DOUBLE_EQ(inv.timeout.seconds, 2.5);
    EXPECT_EQ(inv.chdir, "/tmp");
    EXPECT_THAT(inv.command, ElementsAre("./tst_foo"));
}

TEST(ArgumentsTest, LabelSeparateValueTest) {
    invocation inv = parse_arguments({"--label", "my:label", "cmd"});
    EXPECT_EQ(inv.label, "my:label");
    EXPECT_THAT(inv.command, ElementsAre("cmd"));
}

TEST(ArgumentsTest, ShortChdirTest) {
    invocation inv = parse_arguments({"-C", "/tmp", "cmd", "x"});
    EXPECT_EQ(inv.chdir, "/tmp");
    EXPECT_THAT(inv.command, ElementsAre("cmd", "x"));
}

TEST(ArgumentsTest, OptionsAfterSeparatorBelongToCommandTest) {
    invocation inv = parse_arguments({"--", "cmd", "--help", "--verbose", "--timeout", "1", "-C", "/", "--"});
    EXPECT_FALSE(inv.help);
    EXPECT_FALSE(inv.verbose);
    EXPECT_FALSE(inv.use_timeout);
    EXPECT_TRUE(inv.chdir.empty());
    EXPECT_THAT(inv.command, ElementsAre("cmd", "--help", "--verbose", "--timeout", "1", "-C", "/", "--"));
}

TEST(ArgumentsTest, OptionsAfterCommandBelongToCommandTest) {
    invocation inv = parse_arguments({"--timeout", "3", "cmd", "--help", "--label=x"});
    EXPECT_FALSE(inv.help);
    EXPECT_TRUE(inv.label.empty());
    EXPECT_THAT(inv.command, ElementsAre("cmd", "--help", "--label=x"));
}

TEST(ArgumentsTest, SeparatorIsDroppedOnceTest) {
    invocation inv = parse_arguments({"--", "--", "x"});
    EXPECT_THAT(inv.command, ElementsAre("--", "x"));
}

TEST(ArgumentsTest, CommandBytesUntouchedTest) {
    vector<string> tricky = {
        "cmd",
        "hello world",
        "  leading and trailing  ",
        "tab\there",
        "new\nline",
        "$HOME",
        "*.cpp",
        "a;b|c&d",
        "'single'",
        "\"double\"",
        "back\\slash\\",
        "\xc3\xbc\xc3\xb1\xc3\xaf\xc3\xa7\xc3\xb8\xc3\xb0\xc3\xa9",
        "",
        "-",
        "--label=notmine",
    };
    vector<string> args = {"--verbose", "--"};
    args.insert(args.end(), tricky.begin(), tricky.end());

    invocation inv = parse_arguments(args);
    EXPECT_EQ(inv.command, tricky);
}

TEST(ArgumentsTest, HelpTest) {
    EXPECT_TRUE(parse_arguments({"--help"}).help);
    EXPECT_TRUE(parse_arguments({"--verbose", "--help", "cmd"}).help);
}

TEST(ArgumentsTest, NoArgumentsTest) {
    try {
        parse_arguments(vector<string>{});
        FAIL() << "expected argument_error";
    } catch (argument_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("not enough arguments"));
    }
}

TEST(ArgumentsTest, OptionsWithoutCommandTest) {
    EXPECT_THROW(parse_arguments({"--verbose"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout", "5", "--"}), argument_error);
}

TEST(ArgumentsTest, InvalidTimeoutTest) {
    EXPECT_THROW(parse_arguments({"--timeout", "abc", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout", "0", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout", "-1", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout", "inf", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout"}), argument_error);
}

TEST(ArgumentsTest, HugeTimeoutTest) {
    invocation inv = parse_arguments({"--timeout", "1e9", "cmd"});
    EXPECT_DOUBLE_EQ(inv.timeout.seconds, MAX_TIMEOUT);

    EXPECT_THROW(parse_arguments({"--timeout", "1e10", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--timeout", "1e300", "cmd"}), argument_error);
}

TEST(ArgumentsTest, UnknownOptionTest) {
    EXPECT_THROW(parse_arguments({"--frobnicate", "cmd"}), argument_error);
    EXPECT_THROW(parse_arguments({"--verb", "cmd"}), argument_error);
}

TEST(ArgumentsTest, ArgcArgvOverloadTest) {
    const char *argv[] = {"testrunner", "--label", "x", "cmd", "--verbose"};
    invocation inv = parse_arguments(5, argv);
    EXPECT_EQ(inv.label, "x");
    EXPECT_FALSE(inv.verbose);
    EXPECT_THAT(inv.command, ElementsAre("cmd", "--verbose"));
}

TEST(ArgumentsTest, UsageTest) {
    stringstream ss;
    print_usage(ss);
    EXPECT_THAT(ss.str(), HasSubstr("Usage: testrunner [options] [--] <command> [args...]"));
    EXPECT_THAT(ss.str(), HasSubstr("--timeout"));
    EXPECT_THAT(ss.str(), HasSubstr("--chdir"));
    EXPECT_THAT(ss.str(), ::testing::Not(HasSubstr("--command")));
}
