/*
 * Argument quoting implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/shell/quote.hpp>
#include <shellwrap/util/env.hpp>
#include <string>

namespace shellwrap {

ShellFamily family_for(bool on_windows) { return on_windows ? ShellFamily::Cmd : ShellFamily::Posix; }

ShellFamily family_for_shell(const std::string& shell_name) {
    if (shell_name.empty()) return family_for(host_is_windows());
    return shell_name == "cmd.exe" ? ShellFamily::Cmd : ShellFamily::Posix;
}

std::string join_windows_cmdline(const std::vector<std::string>& arguments) {
    std::string out;
    for (size_t i=0;i<arguments.size();++i) {
        const std::string& a = arguments[i];
        if (i) out.push_back(' ');
        bool needQ = a.empty() || a.find_first_of(" \t") != std::string::npos;
        if (needQ) out.push_back('"');
        size_t n_slashes = 0;
        for (char c : a) {
            if (c == '\\') { ++n_slashes; continue; }
            if (c == '"') {
                // backslashes before a quote are doubled, then the quote escaped
                out.append(n_slashes * 2, '\\');
                n_slashes = 0;
                out += "\\\"";
                continue;
            }
            out.append(n_slashes, '\\');
            n_slashes = 0;
            out.push_back(c);
        }
        out.append(n_slashes, '\\');
        if (needQ) {
            // trailing backslashes would escape the closing quote
            out.append(n_slashes, '\\');
            out.push_back('"');
        }
    }
    return out;
}

static std::string posix_quote_char(const std::string& arg) {
    if (arg.find('"') != std::string::npos) return "'";
    if (arg.find('\'') != std::string::npos) return "\"";
    if (arg.find(' ') == std::string::npos && arg.find('\n') == std::string::npos) return "";
    return "\"";
}

std::string quote_for_shell(const std::vector<std::string>& arguments, ShellFamily family) {
    if (family == ShellFamily::Cmd) return join_windows_cmdline(arguments);
    std::string out;
    for (size_t i=0;i<arguments.size();++i) {
        if (i) out.push_back(' ');
        std::string q = posix_quote_char(arguments[i]);
        out += q; out += arguments[i]; out += q;
    }
    return out;
}

std::string quote_for_shell(const std::vector<std::string>& arguments, const std::string& shell_name) {
    return quote_for_shell(arguments, family_for_shell(shell_name));
}

} // namespace shellwrap
