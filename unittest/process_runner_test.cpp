#include <gtest/gtest.h>
#include "transport/process_runner.hpp"
#include <cstdlib>

class PopenProcessRunnerTest : public ::testing::Test {
protected:
    PopenProcessRunner runner_;
};

TEST_F(PopenProcessRunnerTest, CapturesOutputAndExitStatus) {
    ProcessResult result;
    ASSERT_TRUE(runner_.run("sh -c 'echo out; echo err >&2; exit 3'", ProcessEnvironment(), result));
    EXPECT_EQ(result.exitStatus, 3);
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST_F(PopenProcessRunnerTest, EnvironmentReachesChildWithoutLeaking) {
    unsetenv("OOBCTL_TEST_SECRET");

    ProcessResult result;
    ASSERT_TRUE(runner_.run("printf '%s' \"$OOBCTL_TEST_SECRET\"",
                            {{"OOBCTL_TEST_SECRET", "TopSecret123"}}, result));
    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_EQ(result.output, "TopSecret123");
    EXPECT_EQ(std::getenv("OOBCTL_TEST_SECRET"), nullptr);
}

TEST_F(PopenProcessRunnerTest, PreviousValueIsRestored) {
    setenv("OOBCTL_TEST_SECRET", "original", 1);

    ProcessResult result;
    ASSERT_TRUE(runner_.run("true", {{"OOBCTL_TEST_SECRET", "override"}}, result));
    ASSERT_NE(std::getenv("OOBCTL_TEST_SECRET"), nullptr);
    EXPECT_STREQ(std::getenv("OOBCTL_TEST_SECRET"), "original");
    unsetenv("OOBCTL_TEST_SECRET");
}
