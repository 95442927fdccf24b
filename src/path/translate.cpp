/*
 * Path translation implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/path/translate.hpp>
#include <shellwrap/util/env.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace shellwrap {

static bool is_drive_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

static bool is_slash(char c) { return c == '/' || c == '\\'; }

static bool is_space(char c) { return c == ' ' || (c >= '\t' && c <= '\r'); }

// Non-overlapping, single pass (a///b -> a//b).
static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

static bool looks_like_windows(const std::string& path) {
    if (path.size() <= 1) return false;
    if (path.find(';') != std::string::npos) return true;
    return path[1] == ':' && std::count(path.begin(), path.end(), ':') == 1;
}

std::string path_identity(const std::string& path) { return path; }

std::string posix_to_windows(const std::string& path, const std::string& cygdrive_prefix) {
    if (looks_like_windows(path)) {
        std::string out = path;
        std::replace(out.begin(), out.end(), '/', '\\');
        return out;
    }
    // <prefix>/x/ then everything up to a reserved char or a space/colon starting a new path.
    const size_t n = path.size(), plen = cygdrive_prefix.size();
    std::string out; out.reserve(n);
    size_t last = 0, i = 0;
    while (i + plen + 3 <= n) {
        if (path.compare(i, plen, cygdrive_prefix) != 0 || path[i+plen] != '/' ||
            !is_drive_letter(path[i+plen+1]) || path[i+plen+2] != '/') { ++i; continue; }
        size_t end = i + plen + 3;
        for (; end < n; ++end) {
            char c = path[end];
            if (c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>') break;
            if (is_space(c) && end + 1 < n && path[end+1] == '/') break;
        }
        out.append(path, last, i - last);
        std::string rest = path.substr(i + plen + 3, end - (i + plen + 3));
        std::replace(rest.begin(), rest.end(), '/', '\\');
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(path[i+plen+1]))));
        out += ":\\";
        out += rest;
        last = i = end;
    }
    out.append(path, last, std::string::npos);
    // Several drives in one list leave "...:D:\"; the colon there was the list separator.
    static const std::regex list_sep_re(R"re(:([a-zA-Z]):\\)re");
    return std::regex_replace(out, list_sep_re, ";$1:\\");
}

// A native path must not continue a word, a drive letter or a POSIX path.
static bool blocks_drive_match(char prev) {
    return prev == ':' || prev == '/' || prev == '^' || std::isalpha(static_cast<unsigned char>(prev));
}

static bool is_path_char(char c) {
    return c != ':' && c != '*' && c != '?' && c != '"' && c != '<' && c != '>' && c != '|';
}

// End of the native path starting at i ("X:" plus a slash), or npos.
// The path runs to its last directory separator, then takes the following
// name one character at a time until it is not directly followed by another
// "X:"; the rest of that name is left to the caller unchanged.
static size_t native_path_end(const std::string& s, size_t i) {
    const size_t n = s.size();
    if (i + 2 >= n || !is_drive_letter(s[i]) || s[i+1] != ':' || !is_slash(s[i+2])) return std::string::npos;
    size_t run_end = i + 2;
    while (run_end < n && is_path_char(s[run_end])) ++run_end;
    size_t first = i + 2;
    while (first < run_end && is_slash(s[first])) ++first;
    // Try name starts from the rightmost one: each follows a separator run.
    for (size_t g = run_end; g-- > first; ) {
        if (is_slash(s[g]) || s[g] == ';' || !is_slash(s[g-1])) continue;
        for (size_t e = g + 1; ; ++e) {
            bool next_drive = e + 1 < n && is_drive_letter(s[e]) && s[e+1] == ':';
            if (!next_drive) return e;
            if (e >= run_end || is_slash(s[e]) || s[e] == ';') break;
        }
    }
    return std::string::npos;
}

std::string windows_to_posix(const std::string& path, const std::string& cygdrive_prefix) {
    if (path.empty()) return std::string();
    std::string out; out.reserve(path.size() + 16);
    size_t copied = 0;
    for (size_t i = 0; i < path.size(); ) {
        size_t end = (i > 0 && blocks_drive_match(path[i-1])) ? std::string::npos : native_path_end(path, i);
        if (end == std::string::npos) { ++i; continue; }
        out.append(path, copied, i - copied);
        std::string found = replace_all(path.substr(i, end - i), "\\", "/");
        found.erase(std::remove(found.begin(), found.end(), ':'), found.end());
        found = replace_all(found, "//", "/");
        found[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(found[0])));
        out += cygdrive_prefix;
        out.push_back('/');
        out += found;
        copied = i = end;
    }
    out.append(path, copied, std::string::npos);
    return replace_all(out, ";/", ":/");
}

std::string cygwin_to_windows(const std::string& path) { return posix_to_windows(path, "/cygdrive"); }

std::string windows_to_cygwin(const std::string& path) { return windows_to_posix(path, "/cygdrive"); }

std::string posix_to_windows_path(const std::string& path) { return posix_to_windows(path); }

std::string windows_to_posix_path(const std::string& path) { return windows_to_posix(path); }

std::string translate_stream(const std::string& text, PathConverter translator) {
    std::string out; out.reserve(text.size());
    bool first = true;
    for (const std::string& line : split_list(text, '\n')) {
        if (!first) out.push_back('\n');
        out += translator(line);
        first = false;
    }
    return out;
}

StyledPath StyledPath::to(PathStyle target) const {
    if (target == style) return *this;
    std::string native;
    switch (style) {
        case PathStyle::Posix: native = posix_to_windows(value); break;
        case PathStyle::Cygwin: native = cygwin_to_windows(value); break;
        case PathStyle::Windows: native = value; break;
    }
    switch (target) {
        case PathStyle::Windows: return StyledPath{native, target};
        case PathStyle::Posix: return StyledPath{windows_to_posix(native), target};
        case PathStyle::Cygwin: return StyledPath{windows_to_cygwin(native), target};
    }
    return StyledPath{native, PathStyle::Windows};
}

} // namespace shellwrap
