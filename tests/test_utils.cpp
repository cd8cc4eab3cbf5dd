#include <lgctl/core/utils.hpp>
#include <lgctl/core/process.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <csignal>

using namespace lgctl;
using lgctl::test::TempDir;

TEST(UtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ((std::vector<std::string>{"a", "", "b"}), split("a..b", '.'));
    EXPECT_EQ((std::vector<std::string>{"web"}), split("web", '.'));
}

TEST(UtilsTest, ParsePositiveInt) {
    int v = 0;
    EXPECT_TRUE(parse_positive_int("4", v));
    EXPECT_EQ(4, v);
    EXPECT_FALSE(parse_positive_int("0", v));
    EXPECT_FALSE(parse_positive_int("-2", v));
    EXPECT_FALSE(parse_positive_int("4x", v));
    EXPECT_FALSE(parse_positive_int("", v));
    EXPECT_FALSE(parse_positive_int("99999999999999", v));
}

TEST(UtilsTest, Truthiness) {
    EXPECT_TRUE(is_truthy("TRUE"));
    EXPECT_TRUE(is_truthy("1"));
    EXPECT_TRUE(is_truthy("yes"));
    EXPECT_FALSE(is_truthy("0"));
    EXPECT_FALSE(is_truthy(""));
}

TEST(UtilsTest, Sha256OfKnownInput) {
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
              sha256_hex("abc"));
}

TEST(UtilsTest, WriteFileCreatesParents) {
    TempDir tmp;
    std::string path = tmp.file("a/b/c.txt");
    ASSERT_TRUE(write_file(path, "hello"));

    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ("hello", content);
}

TEST(UtilsTest, JoinPathHandlesSlashes) {
    EXPECT_EQ("/etc/lgctl/ui", join_path("/etc/lgctl", "ui"));
    EXPECT_EQ("/etc/lgctl/ui", join_path("/etc/lgctl/", "ui"));
}

TEST(ChildProcessTest, ReportsExitCode) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn({"sh", "-c", "exit 5"}));
    child.wait();
    EXPECT_FALSE(child.running());
    EXPECT_EQ(5, child.exit_code());
}

TEST(ChildProcessTest, MissingExecutableExits127) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn({"lgctl-no-such-binary"}));
    child.wait();
    EXPECT_EQ(127, child.exit_code());
}

TEST(ChildProcessTest, TerminateKillsStubbornChild) {
    ChildProcess child;
    ASSERT_TRUE(child.spawn({"sh", "-c", "trap '' TERM; sleep 30"}));
    sleep_ms(200);
    child.terminate(300);
    EXPECT_FALSE(child.running());
    EXPECT_EQ(128 + SIGKILL, child.exit_code());
}

TEST(ChildProcessTest, OwnGroupTerminateReachesGrandchildren) {
    TempDir tmp;
    std::string marker = tmp.file("marker");

    ChildProcess child;
    child.set_own_process_group(true);
    ASSERT_TRUE(child.spawn({"sh", "-c", "(trap '' TERM; sleep 2; touch '" + marker + "') & wait"}));
    sleep_ms(200);
    child.terminate(1000);
    EXPECT_FALSE(child.running());

    sleep_ms(2500);
    EXPECT_FALSE(file_exists(marker));
}
