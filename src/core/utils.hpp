#pragma once

#include <string>
#include <vector>

// Join two remote (POSIX) path fragments with exactly one '/'.
// An empty side yields the other side unchanged.
std::string join_remote_path(const std::string& base, const std::string& rel);

// Split the directory part of a relative path into its segments, root first.
// "demo/sub/hello.py" -> {"demo", "sub"}; "hello.py" -> {}.
// Empty and "." segments are dropped; both '/' and '\\' separate.
std::vector<std::string> parent_segments(const std::string& rel_path);

// Convert a relative path to forward-slash form, dropping "." segments.
std::string to_remote_relative(const std::string& rel_path);

// Wrap in single quotes for a POSIX shell, escaping embedded quotes.
std::string shell_quote(const std::string& s);

// Substitute the first "{}" in tmpl with value; appends " value" if absent.
std::string fill_placeholder(const std::string& tmpl, const std::string& value);

// Shell-style exit code for a process killed by a signal: 128 + signal number.
// Accepts "SEGV" or "SIGSEGV"; unknown names map to 255.
int signal_exit_code(const std::string& signal_name);
