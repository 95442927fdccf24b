/*
 * Executable resolution implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/path/resolve.hpp>
#include <shellwrap/util/env.hpp>
#include <filesystem>
#include <string>
#include <system_error>

namespace shellwrap {
namespace fs = std::filesystem;

static bool is_executable(const fs::path& p) {
    std::error_code ec;
    const fs::file_status st = fs::status(p, ec);
    if (ec || !fs::is_regular_file(st)) return false;
#ifdef _WIN32
    return true;
#else
    const fs::perms exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (st.permissions() & exec_bits) != fs::perms::none;
#endif
}

static bool has_dir_separator(const std::string& cmd) {
#ifdef _WIN32
    return cmd.find_first_of("/\\") != std::string::npos;
#else
    return cmd.find('/') != std::string::npos;
#endif
}

std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::string& search_path,
                                              char list_separator) {
    if (cmd.empty()) return std::nullopt;
    if (has_dir_separator(cmd)) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    for (const std::string& dir : split_list(search_path, list_separator)) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / cmd;
        if (is_executable(candidate)) return candidate.string();
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    auto search_path = process_env()("PATH");
    if (!search_path) return std::nullopt;
    return resolve_executable(cmd, *search_path, host_is_windows() ? ';' : ':');
}

} // namespace shellwrap
