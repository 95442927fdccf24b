/*
 * Configuration - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   ~/.shellwraprc holds key=value lines; '#' starts a comment line.
 *   SHELLWRAP_ROOT_PREFIX, SHELLWRAP_SHELL and SHELLWRAP_DEBUG override it.
 */
#pragma once
#include <shellwrap/util/env.hpp>
#include <string>

namespace shellwrap {

struct Config {
    std::string default_shell;                // empty: host default
    std::string root_prefix;                  // empty: derived from CONDA_EXE or cwd
    std::string cygdrive_prefix = "/cygdrive";
    bool debug = false;                       // verbose CLI diagnostics
    bool debug_wrapper_scripts = false;       // env dumps inside wrappers
    bool dev_mode = false;
    std::string hash_algorithm = "md5";
};

bool parse_bool(const std::string& val);

// Missing or unreadable file yields defaults. Unknown keys are ignored.
Config load_config(const std::string& path);

// ~/.shellwraprc followed by SHELLWRAP_* overrides.
Config load_user_config(const EnvLookup& env = process_env());

} // namespace shellwrap
