/*
 * Environment lookup - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shellwrap {

// Compile-time host flavour.
bool host_is_windows();
bool host_is_bsd();

// Returns nullopt if the variable is not set.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
EnvLookup process_env();

// Fixed set of variables; used to run both host flavours in one process.
EnvLookup fixed_env(std::map<std::string, std::string> vars);

std::string getenv_or(const EnvLookup& env, const std::string& key, const std::string& def = "");

// "a::b" -> {"a", "", "b"}; empty input gives one empty piece.
std::vector<std::string> split_list(const std::string& list, char separator);

} // namespace shellwrap
