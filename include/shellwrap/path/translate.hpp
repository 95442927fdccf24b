/*
 * Path translation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Converts single paths and path lists between POSIX form (/c/Users/x),
 *   native Windows form (C:\Users\x) and the Cygwin drive form
 *   (/cygdrive/c/Users/x). All functions are pure.
 */
#pragma once
#include <string>

namespace shellwrap {

using PathConverter = std::string (*)(const std::string&);

// Returned unchanged; used where no conversion applies.
std::string path_identity(const std::string& path);

// /c/foo:/d/bar -> C:\foo;D:\bar. Input that already looks native is only
// slash-normalised. Pass "/cygdrive" as prefix for Cygwin style input.
std::string posix_to_windows(const std::string& path, const std::string& cygdrive_prefix = "");

// C:\foo;D:\bar -> /c/foo:/d/bar
std::string windows_to_posix(const std::string& path, const std::string& cygdrive_prefix = "");

std::string cygwin_to_windows(const std::string& path);
std::string windows_to_cygwin(const std::string& path);

// Single-argument forms usable as PathConverter.
std::string posix_to_windows_path(const std::string& path);
std::string windows_to_posix_path(const std::string& path);

// Apply translator to each '\n' separated line.
std::string translate_stream(const std::string& text, PathConverter translator);

enum class PathStyle { Posix, Windows, Cygwin };

// A path string together with the convention it is written in.
struct StyledPath {
    std::string value;
    PathStyle style = PathStyle::Posix;

    StyledPath to(PathStyle target) const;
};

} // namespace shellwrap
