/*
 * Argument quoting - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace shellwrap {

enum class ShellFamily { Cmd, Posix };

ShellFamily family_for(bool on_windows);

// "cmd.exe" -> Cmd, "" -> the host family, anything else -> Posix.
ShellFamily family_for_shell(const std::string& shell_name);

// Join argv into one command line the target shell splits back into argv.
// Cmd follows the MS C runtime rules (same as CommandLineToArgvW).
// Posix picks one quote char per argument and does not escape it when the
// argument also contains that char.
std::string quote_for_shell(const std::vector<std::string>& arguments, ShellFamily family);
std::string quote_for_shell(const std::vector<std::string>& arguments, const std::string& shell_name);

std::string join_windows_cmdline(const std::vector<std::string>& arguments);

} // namespace shellwrap
