/*
 * Activation wrapper scripts implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/wrap/wrapper.hpp>
#include <shellwrap/wrap/temp_file.hpp>
#include <shellwrap/shell/quote.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace shellwrap {
namespace fs = std::filesystem;

static std::string abspath(const fs::path& p) {
    return fs::absolute(p).lexically_normal().string();
}

bool is_multiline(const std::vector<std::string>& arguments) {
    return arguments.size() == 1 && arguments[0].find('\n') != std::string::npos;
}

std::vector<std::string> activation_entry_point(const std::string& root_prefix, bool dev_mode, const EnvLookup& env) {
    // Dev mode: an env with e.g. an old python must still run the current sources.
    if (dev_mode) return {abspath(fs::path(root_prefix) / "bin" / "python"), "-m", "conda"};
    auto exe = env("CONDA_EXE");
    if (exe) return {*exe};
    return {abspath(fs::path(root_prefix) / "bin" / "conda")};
}

std::string activation_batch_file(const std::string& root_prefix, const EnvLookup& env) {
    auto bat = env("CONDA_BAT");
    if (bat) return *bat;
    return abspath(fs::path(root_prefix) / "condabin" / "conda.bat");
}

static std::string windows_script(const WrapRequest& req, const std::string& conda_bat) {
    std::string s;
    s += "@FOR /F \"tokens=100\" %%F IN ('chcp') DO @SET CONDA_OLD_CHCP=%%F\n";
    s += "@chcp 65001>NUL\n";
    s += "@CALL \"" + conda_bat + "\" activate \"" + req.prefix + "\"\n";
    if (is_multiline(req.arguments)) {
        // Not silenced: the caller would have to prefix every line with @ anyway.
        s += req.arguments[0] + "\n";
    } else {
        s += "@" + quote_for_shell(req.arguments, ShellFamily::Cmd) + "\n";
    }
    s += "@chcp %CONDA_OLD_CHCP%>NUL\n";
    return s;
}

static std::string posix_script(const WrapRequest& req, const std::vector<std::string>& conda_exe) {
    std::vector<std::string> hook_argv = conda_exe;
    hook_argv.push_back("shell.posix");
    hook_argv.push_back("hook");
    const std::string hook_quoted = quote_for_shell(hook_argv, ShellFamily::Posix);

    std::string s;
    if (req.debug_wrapper_scripts) {
        s += ">&2 echo '*** environment before ***'\n"
             ">&2 env\n";
        s += ">&2 echo \"$(" + hook_quoted + ")\"\n";
    }
    s += "eval \"$(" + hook_quoted + ")\"\n";
    s += "conda activate " + quote_for_shell({req.prefix}, ShellFamily::Posix) + "\n";
    if (req.debug_wrapper_scripts) {
        s += ">&2 echo '*** environment after ***'\n"
             ">&2 env\n";
    }
    if (is_multiline(req.arguments) || req.arguments.size() == 1) {
        s += req.arguments[0] + "\n";
    } else {
        s += quote_for_shell(req.arguments, ShellFamily::Posix) + "\n";
    }
    return s;
}

WrappedCall wrap_subprocess_call(const WrapRequest& request, const EnvLookup& env) {
    const std::string tmp_prefix = abspath(fs::path(request.prefix) / ".tmp");
    WrappedCall call;
    if (request.on_windows) {
        auto comspec = env("COMSPEC");
        if (!comspec) throw MissingEnvironmentVariable("COMSPEC");
        const std::string content = windows_script(request, activation_batch_file(request.root_prefix, env));
        TempFile fh = TempFile::create(tmp_prefix, ".bat");
        fh.write(content);
        fh.close();
        call.script_path = fh.path();
        call.command_args = {*comspec, "/d", "/c", call.script_path};
    } else {
        const std::string shell_path = request.on_bsd ? "sh" : "bash";
        const std::string content = posix_script(request, activation_entry_point(request.root_prefix, request.dev_mode, env));
        TempFile fh = TempFile::create(tmp_prefix);
        fh.write(content);
        fh.close();
        call.script_path = fh.path();
        call.command_args = {shell_path, "-x", call.script_path};
    }
    return call;
}

} // namespace shellwrap
