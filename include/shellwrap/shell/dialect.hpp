/*
 * Shell dialects - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Describes how each supported shell echoes, reads variables, separates
 *   paths and path lists, sources scripts and converts paths. Every named
 *   dialect is a complete record derived from one of two bases (POSIX,
 *   MSYS2) plus a handful of overrides. Tables are fixed per host flavour.
 */
#pragma once
#include <shellwrap/path/translate.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shellwrap {

struct ShellDialect {
    std::string name;
    std::string executable;          // on PATH or absolute
    std::string bin_subdir;          // mind the trailing separator
    std::string path_separator;      // between path components
    std::string list_separator;      // between entries of PATH
    std::string source_command;
    std::string variable_format;     // "{}" is replaced by the variable name
    std::string echo_command;
    std::string prompt_variable;
    std::string script_suffix;
    std::string env_script_suffix;
    std::vector<std::string> invocation_args;
    PathConverter path_from = path_identity;   // shell form -> native
    PathConverter path_to = path_identity;     // native -> shell form
    std::string null_redirect;
    std::string set_var;
    std::string print_path;
    std::string print_prompt;
    std::string print_default_env;
    std::pair<std::string, std::string> slash_convert;
    std::string test_echo_extra;

    // $HOME / %HOME% / ...
    std::string format_variable(const std::string& var) const;
};

// Partial record: only engaged fields replace the base.
struct DialectOverrides {
    std::optional<std::string> executable;
    std::optional<std::string> bin_subdir;
    std::optional<std::string> list_separator;
    std::optional<std::string> source_command;
    std::optional<PathConverter> path_from;
    std::optional<PathConverter> path_to;
    std::optional<std::string> print_path;
};

ShellDialect posix_shell_base();
ShellDialect msys2_shell_base();

// Pure merge: a copy of base with overrides applied and the given name.
ShellDialect derive(const ShellDialect& base, const std::string& name, const DialectOverrides& overrides);

class UnknownShell : public std::invalid_argument {
public:
    explicit UnknownShell(const std::string& name)
        : std::invalid_argument("unknown shell: " + name), m_name(name) {}
    const std::string& name() const { return m_name; }
private:
    std::string m_name;
};

class DialectRegistry {
public:
    explicit DialectRegistry(bool on_windows);

    // Registry for the host this binary was compiled for; built on first use.
    static const DialectRegistry& host();

    // Returns nullopt if name is not registered.
    std::optional<ShellDialect> lookup(const std::string& name) const;

    // Lookup with the host default applied when no name is given.
    // Throws UnknownShell for an unregistered explicit name.
    const ShellDialect& resolve(const std::optional<std::string>& name = std::nullopt) const;

    std::string default_shell() const;
    std::vector<std::string> names() const;
    bool on_windows() const { return m_on_windows; }

private:
    bool m_on_windows;
    std::map<std::string, ShellDialect> m_shells;
};

} // namespace shellwrap
