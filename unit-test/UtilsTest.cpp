#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "testrunner/common/exceptions.hpp"
#include "testrunner/common/utils.hpp"
#include "testrunner/config.hpp"

using namespace std;
using namespace testrunner;

TEST(UtilsTest, GetEnvTest) {
    unsetenv("TESTRUNNER_TEST_VALUE");
    EXPECT_EQ(get_env("TESTRUNNER_TEST_VALUE", "fallback"), "fallback");

    set_env("TESTRUNNER_TEST_VALUE", "value");
    EXPECT_EQ(get_env("TESTRUNNER_TEST_VALUE", "fallback"), "value");

    set_env("TESTRUNNER_TEST_VALUE", "other", false);
    EXPECT_EQ(get_env("TESTRUNNER_TEST_VALUE", "fallback"), "value");

    set_env("TESTRUNNER_TEST_VALUE", "");
    EXPECT_EQ(get_env("TESTRUNNER_TEST_VALUE", "fallback"), "");
    unsetenv("TESTRUNNER_TEST_VALUE");
}

TEST(UtilsTest, JoinCommandTest) {
    EXPECT_EQ(join_command({"tst_foo"}), "tst_foo");
    EXPECT_EQ(join_command({"/bin/sh", "-c", "exit 1"}), "/bin/sh -c exit 1");
    EXPECT_EQ(join_command({}), "");
}

TEST(UtilsTest, ElapsedTimeTest) {
    elapsed_time clock;
    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_GE(clock.duration<chrono::milliseconds>().count(), 50);
    EXPECT_GE(clock.seconds(), 0.05);
    EXPECT_LT(clock.seconds(), 10);
}

TEST(UtilsTest, LoadEnvironmentTest) {
    string saved_debug = get_env("TESTRUNNER_DEBUG", "");
    string saved_dir = get_env("TESTRUNNER_LOG_DIR", "");
    bool saved_flag = DEBUG;
    auto saved_path = LOG_DIR;

    set_env("TESTRUNNER_DEBUG", "1");
    set_env("TESTRUNNER_LOG_DIR", "/tmp/testrunner-logs");
    load_environment();
    EXPECT_TRUE(DEBUG);
    EXPECT_EQ(LOG_DIR, "/tmp/testrunner-logs");

    set_env("TESTRUNNER_DEBUG", "0");
    load_environment();
    EXPECT_FALSE(DEBUG);

    unsetenv("TESTRUNNER_DEBUG");
    unsetenv("TESTRUNNER_LOG_DIR");
    load_environment();
    EXPECT_FALSE(DEBUG);
    EXPECT_TRUE(LOG_DIR.empty());

    if (!saved_debug.empty()) set_env("TESTRUNNER_DEBUG", saved_debug);
    if (!saved_dir.empty()) set_env("TESTRUNNER_LOG_DIR", saved_dir);
    DEBUG = saved_flag;
    LOG_DIR = saved_path;
}

TEST(UtilsTest, ExceptionMessageTest) {
    internal_error e("waitpid failed");
    EXPECT_STREQ(e.what(), "waitpid failed");

    auto appended = configuration_error("bad directory: ") << "/missing" << 42;
    EXPECT_STREQ(appended.what(), "bad directory: /missing42");

    stringstream ss;
    ss << e;
    EXPECT_THAT(ss.str(), ::testing::HasSubstr("waitpid failed"));
}

TEST(UtilsTest, SpawnErrorTest) {
    spawn_error e("tst_missing", ENOENT);
    EXPECT_EQ(e.command(), "tst_missing");
    EXPECT_EQ(e.error_code(), ENOENT);
    EXPECT_STREQ(e.what(), strerror(ENOENT));

    spawn_error custom("tst_missing", 2, "The system cannot find the file specified.");
    EXPECT_STREQ(custom.what(), "The system cannot find the file specified.");
}

TEST(UtilsTest, ExceptionExitCodeTest) {
    EXPECT_EQ(argument_error("not enough arguments").exit_code(), E_USAGE);
    EXPECT_EQ(argument_error("not enough arguments").diagnostic(), "not enough arguments");

    EXPECT_EQ(configuration_error("no such directory: /x").exit_code(), E_CONFIGURATION);
    EXPECT_EQ(configuration_error("no such directory: /x").diagnostic(), "no such directory: /x");

    EXPECT_EQ(spawn_error("tst_missing", ENOENT).exit_code(), E_COMMAND_NOT_FOUND);
    EXPECT_EQ(spawn_error("tst_plain", EACCES).exit_code(), E_CANNOT_EXECUTE);
    EXPECT_EQ(spawn_error("tst_plain", EACCES).diagnostic(), "tst_plain: " + string(strerror(EACCES)));

    internal_error internal("waitpid failed");
    const testrunner_exception &base = internal;
    EXPECT_EQ(base.exit_code(), E_INTERNAL_ERROR);
    EXPECT_EQ(base.diagnostic(), "internal error: waitpid failed");
}
