#pragma once

#include <string>

// Lexical remote path handling. No symlink resolution.
//
//   "~" and "~/x" resolve against home, relative paths resolve against
//   home, "." segments are dropped and ".." pops the previous segment.
std::string normalize_remote_path(const std::string& path, const std::string& home);

std::string remote_join(const std::string& dir, const std::string& name);

// Last path segment ("/a/b/" -> "b"). "/" for the root.
std::string remote_basename(const std::string& path);

// Everything before the last segment ("/a/b" -> "/a").
std::string remote_dirname(const std::string& path);
