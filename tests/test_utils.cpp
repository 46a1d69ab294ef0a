#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/types.hpp>

TEST(UtilsTest, JoinRemotePath) {
    EXPECT_EQ(join_remote_path("/home/robot", "demo"), "/home/robot/demo");
    EXPECT_EQ(join_remote_path("/home/robot/", "/demo"), "/home/robot/demo");
    EXPECT_EQ(join_remote_path("/", "demo"), "/demo");
    EXPECT_EQ(join_remote_path("", "demo"), "demo");
    EXPECT_EQ(join_remote_path("/home/robot", ""), "/home/robot");
}

TEST(UtilsTest, ParentSegments) {
    EXPECT_EQ(parent_segments("demo/sub/hello.py"), (std::vector<std::string>{"demo", "sub"}));
    EXPECT_EQ(parent_segments("./demo/hello.py"), std::vector<std::string>{"demo"});
    EXPECT_EQ(parent_segments("demo\\hello.py"), std::vector<std::string>{"demo"});
    EXPECT_EQ(parent_segments("demo/sub/"), (std::vector<std::string>{"demo", "sub"}));
    EXPECT_TRUE(parent_segments("hello.py").empty());
    EXPECT_TRUE(parent_segments("").empty());
}

TEST(UtilsTest, ToRemoteRelative) {
    EXPECT_EQ(to_remote_relative("./demo//hello.py"), "demo/hello.py");
    EXPECT_EQ(to_remote_relative("demo\\sub\\x.py"), "demo/sub/x.py");
}

TEST(UtilsTest, ShellQuote) {
    EXPECT_EQ(shell_quote("/home/robot/a b.py"), "'/home/robot/a b.py'");
    EXPECT_EQ(shell_quote("it's.py"), "'it'\\''s.py'");
}

TEST(UtilsTest, FillPlaceholder) {
    EXPECT_EQ(fill_placeholder("brickrun -r -- pybricks-micropython {}", "x.py"),
              "brickrun -r -- pybricks-micropython x.py");
    EXPECT_EQ(fill_placeholder("micropython", "x.py"), "micropython x.py");
}

TEST(UtilsTest, ErrorKindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::StaleHandle), "stale-handle");
    EXPECT_STREQ(error_kind_name(ErrorKind::RemoteFilesystem), "remote-filesystem");
}

TEST(UtilsTest, SignalExitCodeIsNonZero) {
    EXPECT_EQ(signal_exit_code("SEGV"), 139);
    EXPECT_EQ(signal_exit_code("SIGKILL"), 137);
    EXPECT_EQ(signal_exit_code("TERM"), 143);
    EXPECT_EQ(signal_exit_code("WEIRD"), 255);
    EXPECT_EQ(signal_exit_code(""), 255);
}
