/*
 * Activation wrapper scripts - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Writes a temporary script that activates an environment and then runs
 *   the caller's command, and returns the argv that executes the script.
 *   Nothing is executed here and the script is never deleted here: the
 *   caller launches it and removes script_path when done.
 */
#pragma once
#include <shellwrap/util/env.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace shellwrap {

struct WrapRequest {
    bool on_windows = host_is_windows();
    bool on_bsd = host_is_bsd();     // selects sh instead of bash
    std::string root_prefix;         // installation holding condabin/ and bin/
    std::string prefix;              // environment to activate; script goes here
    bool dev_mode = false;           // run the entry point as <root>/bin/python -m conda
    bool debug_wrapper_scripts = false;
    std::vector<std::string> arguments;
};

struct WrappedCall {
    std::string script_path;
    std::vector<std::string> command_args;
};

class MissingEnvironmentVariable : public std::runtime_error {
public:
    explicit MissingEnvironmentVariable(const std::string& var)
        : std::runtime_error("required environment variable not set: " + var), m_var(var) {}
    const std::string& variable() const { return m_var; }
private:
    std::string m_var;
};

// One argument containing a newline is a script body, not a command word.
bool is_multiline(const std::vector<std::string>& arguments);

// argv prefix that runs the activation entry point on POSIX hosts.
std::vector<std::string> activation_entry_point(const std::string& root_prefix, bool dev_mode, const EnvLookup& env);

// CONDA_BAT or <root>/condabin/conda.bat
std::string activation_batch_file(const std::string& root_prefix, const EnvLookup& env);

// Creates exactly one file per call. Throws MissingEnvironmentVariable when
// COMSPEC is unset for a Windows wrapper and std::system_error if the script
// cannot be written.
WrappedCall wrap_subprocess_call(const WrapRequest& request, const EnvLookup& env = process_env());

} // namespace shellwrap
