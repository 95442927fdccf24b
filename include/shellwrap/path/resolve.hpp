/*
 * Executable resolution utilities - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace shellwrap {

// Resolve command name against a search list such as the value of PATH.
// If cmd contains a directory separator it is checked as given.
std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::string& search_path,
                                              char list_separator = ':');

// Same, reading PATH from the process environment.
std::optional<std::string> resolve_executable(const std::string& cmd);

} // namespace shellwrap
