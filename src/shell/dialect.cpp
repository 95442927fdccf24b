/*
 * Shell dialects implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/shell/dialect.hpp>
#include <string>

namespace shellwrap {

std::string ShellDialect::format_variable(const std::string& var) const {
    std::string out = variable_format;
    size_t pos = out.find("{}");
    if (pos != std::string::npos) out.replace(pos, 2, var);
    return out;
}

// No executable here: each entry names either a program on PATH or a full path.
ShellDialect posix_shell_base() {
    ShellDialect d;
    d.bin_subdir = "/bin/";
    d.echo_command = "echo";
    d.env_script_suffix = ".sh";
    d.null_redirect = "2>/dev/null";
    d.path_from = path_identity;
    d.path_to = path_identity;
    d.list_separator = ":";
    d.print_default_env = "echo $CONDA_DEFAULT_ENV";
    d.print_path = "echo $PATH";
    d.print_prompt = "echo $CONDA_PROMPT_MODIFIER";
    d.prompt_variable = "PS1";
    d.path_separator = "/";
    d.set_var = "export ";
    d.invocation_args = {"-l", "-c"};
    d.script_suffix = "";
    d.slash_convert = {"\\", "/"};
    d.source_command = "source";
    d.test_echo_extra = "";
    d.variable_format = "${}";
    return d;
}

ShellDialect msys2_shell_base() {
    DialectOverrides o;
    o.path_from = posix_to_windows_path;
    o.path_to = windows_to_posix_path;
    o.bin_subdir = "/bin/";
    // Drop the first PATH entry (prepended by the launcher) and print the rest in POSIX form.
    o.print_path = "python -c \"import os; print(';'.join(os.environ['PATH'].split(';')[1:]))\""
                   " | cygpath --path -f -";
    return derive(posix_shell_base(), "", o);
}

ShellDialect derive(const ShellDialect& base, const std::string& name, const DialectOverrides& overrides) {
    ShellDialect d = base;
    d.name = name;
    if (overrides.executable) d.executable = *overrides.executable;
    if (overrides.bin_subdir) d.bin_subdir = *overrides.bin_subdir;
    if (overrides.list_separator) d.list_separator = *overrides.list_separator;
    if (overrides.source_command) d.source_command = *overrides.source_command;
    if (overrides.path_from) d.path_from = *overrides.path_from;
    if (overrides.path_to) d.path_to = *overrides.path_to;
    if (overrides.print_path) d.print_path = *overrides.print_path;
    return d;
}

static ShellDialect cmd_exe_dialect() {
    ShellDialect d;
    d.name = "cmd.exe";
    d.echo_command = "@echo";
    d.variable_format = "%{}%";
    d.bin_subdir = "\\Scripts\\";
    d.source_command = "call";
    d.test_echo_extra = "";
    d.null_redirect = "1>NUL 2>&1";
    d.set_var = "set ";
    d.script_suffix = ".bat";
    d.env_script_suffix = ".bat";
    d.print_prompt = "@echo %PROMPT%";
    d.prompt_variable = "PROMPT";
    // Parentheses are unbalanced on purpose: "echo(" prints an empty line.
    d.print_default_env = "IF NOT \"%CONDA_DEFAULT_ENV%\" == \"\" (\n"
                          "echo %CONDA_DEFAULT_ENV% ) ELSE (\n"
                          "echo()";
    d.print_path = "@echo %PATH%";
    d.executable = "cmd.exe";
    d.invocation_args = {"/d", "/c"};
    d.path_from = path_identity;
    d.path_to = path_identity;
    d.slash_convert = {"/", "\\"};
    d.path_separator = "\\";
    d.list_separator = ";";
    return d;
}

static DialectOverrides exe_only(const std::string& exe) {
    DialectOverrides o;
    o.executable = exe;
    return o;
}

DialectRegistry::DialectRegistry(bool on_windows) : m_on_windows(on_windows) {
    auto add = [&](ShellDialect d) { std::string key = d.name; m_shells.emplace(key, std::move(d)); };
    if (on_windows) {
        add(cmd_exe_dialect());
        DialectOverrides cyg;
        cyg.executable = "bash.exe";
        cyg.bin_subdir = "/Scripts/";
        cyg.path_from = cygwin_to_windows;
        cyg.path_to = windows_to_cygwin;
        add(derive(posix_shell_base(), "cygwin", cyg));
        // Whichever bash is on PATH; Cygwin users want the "cygwin" entry for /cygdrive.
        const ShellDialect msys2 = msys2_shell_base();
        for (const char* exe : {"bash.exe", "bash", "sh.exe", "zsh.exe", "zsh"}) {
            add(derive(msys2, exe, exe_only(exe)));
        }
    } else {
        const ShellDialect posix = posix_shell_base();
        add(derive(posix, "bash", exe_only("bash")));
        DialectOverrides dash = exe_only("dash");
        dash.source_command = ".";
        add(derive(posix, "dash", dash));
        add(derive(posix, "zsh", exe_only("zsh")));
        // fish keeps PATH as a list, printed space separated.
        DialectOverrides fish = exe_only("fish");
        fish.list_separator = " ";
        add(derive(posix, "fish", fish));
    }
}

const DialectRegistry& DialectRegistry::host() {
#ifdef _WIN32
    static const DialectRegistry registry(true);
#else
    static const DialectRegistry registry(false);
#endif
    return registry;
}

std::optional<ShellDialect> DialectRegistry::lookup(const std::string& name) const {
    auto it = m_shells.find(name);
    if (it == m_shells.end()) return std::nullopt;
    return it->second;
}

const ShellDialect& DialectRegistry::resolve(const std::optional<std::string>& name) const {
    std::string key = (name && !name->empty()) ? *name : default_shell();
    auto it = m_shells.find(key);
    if (it == m_shells.end()) throw UnknownShell(key);
    return it->second;
}

std::string DialectRegistry::default_shell() const { return m_on_windows ? "cmd.exe" : "bash"; }

std::vector<std::string> DialectRegistry::names() const {
    std::vector<std::string> out; out.reserve(m_shells.size());
    for (auto &kv : m_shells) out.push_back(kv.first);
    return out;
}

} // namespace shellwrap
