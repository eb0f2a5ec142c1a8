#include <gtest/gtest.h>
#include <transfer/remote_path.hpp>

TEST(RemotePath, TildeIsHome) {
    EXPECT_EQ(normalize_remote_path("~", "/home/ops"), "/home/ops");
    EXPECT_EQ(normalize_remote_path("", "/home/ops"), "/home/ops");
}

TEST(RemotePath, TildeSlashPrefix) {
    EXPECT_EQ(normalize_remote_path("~/logs/app.log", "/home/ops"), "/home/ops/logs/app.log");
    EXPECT_EQ(normalize_remote_path("~/", "/home/ops"), "/home/ops");
}

TEST(RemotePath, RelativeAgainstHome) {
    EXPECT_EQ(normalize_remote_path("notes.txt", "/root"), "/root/notes.txt");
    EXPECT_EQ(normalize_remote_path("./a/./b", "/root"), "/root/a/b");
}

TEST(RemotePath, DotDotPopsSegments) {
    EXPECT_EQ(normalize_remote_path("/var/log/../lib", "/root"), "/var/lib");
    EXPECT_EQ(normalize_remote_path("../../..", "/home/ops"), "/");
    EXPECT_EQ(normalize_remote_path("~/../other", "/home/ops"), "/home/other");
}

TEST(RemotePath, AbsoluteKeptAndCleaned) {
    EXPECT_EQ(normalize_remote_path("/etc//ssh/", "/root"), "/etc/ssh");
    EXPECT_EQ(normalize_remote_path("/", "/root"), "/");
}

TEST(RemotePath, TildeUserIsNotExpanded) {
    // "~bob" is not "~/": taken as a relative name
    EXPECT_EQ(normalize_remote_path("~bob/x", "/root"), "/root/~bob/x");
}

TEST(RemotePath, JoinBasenameDirname) {
    EXPECT_EQ(remote_join("/a", "b"), "/a/b");
    EXPECT_EQ(remote_join("/", "b"), "/b");
    EXPECT_EQ(remote_basename("/a/b/"), "b");
    EXPECT_EQ(remote_basename("/"), "/");
    EXPECT_EQ(remote_basename("file"), "file");
    EXPECT_EQ(remote_dirname("/a/b"), "/a");
    EXPECT_EQ(remote_dirname("/a"), "/");
    EXPECT_EQ(remote_dirname("a"), ".");
}
