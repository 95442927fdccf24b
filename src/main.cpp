// ShellWrap command line front end
#include <shellwrap/config/config.hpp>
#include <shellwrap/path/resolve.hpp>
#include <shellwrap/path/translate.hpp>
#include <shellwrap/shell/dialect.hpp>
#include <shellwrap/shell/quote.hpp>
#include <shellwrap/util/bytes.hpp>
#include <shellwrap/util/env.hpp>
#include <shellwrap/util/hash.hpp>
#include <shellwrap/wrap/wrapper.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace shellwrap;
namespace fs = std::filesystem;

static Config g_cfg;

static void debug_line(const std::string& msg) { if (g_cfg.debug) std::cerr << "[debug] " << msg << std::endl; }

static int usage() {
    std::cerr << "Usage: shellwrap [-d|--debug] <command> ...\n"
                 "  to-windows <path> [--cygdrive]\n"
                 "  to-posix <path> [--cygdrive]\n"
                 "  translate <to-windows|to-posix|to-cygwin|from-cygwin>   (stdin -> stdout)\n"
                 "  dialects [--windows|--posix]\n"
                 "  dialect [name] [--windows|--posix]\n"
                 "  quote [--shell NAME] [--] args...\n"
                 "  wrap --prefix P [--root R] [--windows] [--dev] [--debug-scripts] [--] args...\n"
                 "  hash <file> [algorithm]\n"
                 "  bytes <n>\n";
    return 1;
}

static std::string default_root_prefix(const EnvLookup& env) {
    if (!g_cfg.root_prefix.empty()) return g_cfg.root_prefix;
    if (auto exe = env("CONDA_EXE")) return fs::path(*exe).parent_path().parent_path().string();
    return fs::current_path().string();
}

// --windows / --posix pick the table; the host table otherwise.
static bool table_flavour(const std::vector<std::string>& args) {
    bool on_windows = host_is_windows();
    for (auto &a : args) {
        if (a == "--windows") on_windows = true;
        else if (a == "--posix") on_windows = false;
    }
    return on_windows;
}

static int cmd_convert(const std::vector<std::string>& args, bool to_windows) {
    std::string path; bool cygdrive = false;
    for (auto &a : args) { if (a == "--cygdrive") cygdrive = true; else path = a; }
    const std::string prefix = cygdrive ? g_cfg.cygdrive_prefix : std::string();
    std::cout << (to_windows ? posix_to_windows(path, prefix) : windows_to_posix(path, prefix)) << '\n';
    return 0;
}

static int cmd_translate(const std::vector<std::string>& args) {
    if (args.empty()) return usage();
    PathConverter fn = nullptr;
    if (args[0] == "to-windows") fn = posix_to_windows_path;
    else if (args[0] == "to-posix") fn = windows_to_posix_path;
    else if (args[0] == "to-cygwin") fn = windows_to_cygwin;
    else if (args[0] == "from-cygwin") fn = cygwin_to_windows;
    else { std::cerr << "translate: unknown mode: " << args[0] << '\n'; return 1; }
    std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    std::cout << translate_stream(text, fn);
    return 0;
}

static std::string converter_name(PathConverter fn) {
    if (fn == path_identity) return "identity";
    if (fn == posix_to_windows_path) return "posix_to_windows";
    if (fn == windows_to_posix_path) return "windows_to_posix";
    if (fn == cygwin_to_windows) return "cygwin_to_windows";
    if (fn == windows_to_cygwin) return "windows_to_cygwin";
    return "custom";
}

static int cmd_dialects(const std::vector<std::string>& args) {
    DialectRegistry reg(table_flavour(args));
    for (auto &n : reg.names()) std::cout << n << (n == reg.default_shell() ? " (default)" : "") << '\n';
    return 0;
}

static int cmd_dialect(const std::vector<std::string>& args) {
    DialectRegistry reg(table_flavour(args));
    std::optional<std::string> name;
    if (!g_cfg.default_shell.empty()) name = g_cfg.default_shell;
    for (auto &a : args) if (a != "--windows" && a != "--posix") name = a;
    const ShellDialect& d = reg.resolve(name);
    std::string joined;
    for (size_t i=0;i<d.invocation_args.size();++i) { if (i) joined.push_back(' '); joined += d.invocation_args[i]; }
    std::cout << "name=" << d.name << '\n'
              << "executable=" << d.executable << '\n'
              << "bin_subdir=" << d.bin_subdir << '\n'
              << "path_separator=" << d.path_separator << '\n'
              << "list_separator=" << d.list_separator << '\n'
              << "source_command=" << d.source_command << '\n'
              << "variable_format=" << d.variable_format << '\n'
              << "echo_command=" << d.echo_command << '\n'
              << "prompt_variable=" << d.prompt_variable << '\n'
              << "script_suffix=" << d.script_suffix << '\n'
              << "env_script_suffix=" << d.env_script_suffix << '\n'
              << "invocation_args=" << joined << '\n'
              << "path_from=" << converter_name(d.path_from) << '\n'
              << "path_to=" << converter_name(d.path_to) << '\n'
              << "null_redirect=" << d.null_redirect << '\n'
              << "set_var=" << d.set_var << '\n'
              << "print_path=" << d.print_path << '\n';
    auto where = resolve_executable(d.executable);
    std::cout << "resolved=" << (where ? *where : std::string("(not on PATH)")) << '\n';
    return 0;
}

static int cmd_quote(const std::vector<std::string>& args) {
    std::string shell = g_cfg.default_shell.empty() ? DialectRegistry::host().default_shell() : g_cfg.default_shell;
    std::vector<std::string> words;
    bool rest = false;
    for (size_t i=0;i<args.size();++i) {
        if (!rest && args[i] == "--") { rest = true; continue; }
        if (!rest && args[i] == "--shell") {
            if (i+1 >= args.size()) { std::cerr << "quote: --shell needs a value\n"; return 1; }
            shell = args[++i]; continue;
        }
        words.push_back(args[i]);
    }
    debug_line("quoting for " + shell);
    std::cout << quote_for_shell(words, shell) << '\n';
    return 0;
}

static int cmd_wrap(const std::vector<std::string>& args) {
    const EnvLookup env = process_env();
    WrapRequest req;
    req.dev_mode = g_cfg.dev_mode;
    req.debug_wrapper_scripts = g_cfg.debug_wrapper_scripts;
    bool rest = false;
    for (size_t i=0;i<args.size();++i) {
        const std::string& a = args[i];
        if (rest) { req.arguments.push_back(a); continue; }
        if (a == "--") rest = true;
        else if (a == "--prefix" || a == "--root") {
            if (i+1 >= args.size()) { std::cerr << "wrap: " << a << " needs a value\n"; return 1; }
            (a == "--prefix" ? req.prefix : req.root_prefix) = args[++i];
        }
        else if (a == "--windows") req.on_windows = true;
        else if (a == "--posix") req.on_windows = false;
        else if (a == "--dev") req.dev_mode = true;
        else if (a == "--debug-scripts") req.debug_wrapper_scripts = true;
        else req.arguments.push_back(a);
    }
    if (req.prefix.empty()) { std::cerr << "wrap: --prefix is required\n"; return 1; }
    if (req.root_prefix.empty()) req.root_prefix = default_root_prefix(env);
    if (req.on_windows) debug_line("activation script: " + activation_batch_file(req.root_prefix, env));
    else debug_line("activation entry point: " + quote_for_shell(activation_entry_point(req.root_prefix, req.dev_mode, env), ShellFamily::Posix));

    WrappedCall call = wrap_subprocess_call(req, env);
    if (g_cfg.debug) {
        std::ifstream in(call.script_path);
        std::ostringstream oss; oss << in.rdbuf();
        std::cerr << "[debug] " << call.script_path << ":\n" << oss.str();
    }
    std::cout << call.script_path << '\n';
    for (auto &c : call.command_args) std::cout << c << '\n';
    return 0;
}

static int cmd_hash(const std::vector<std::string>& args) {
    if (args.empty()) return usage();
    std::string algo = args.size() > 1 ? args[1] : g_cfg.hash_algorithm;
    std::cout << hashsum_file(args[0], algo) << "  " << args[0] << '\n';
    return 0;
}

static int cmd_bytes(const std::vector<std::string>& args) {
    if (args.empty()) return usage();
    std::uint64_t n = 0;
    try { n = std::stoull(args[0]); }
    catch (const std::exception&) { std::cerr << "bytes: not a number: " << args[0] << '\n'; return 1; }
    std::cout << human_bytes(n) << '\n';
    return 0;
}

int main(int argc, char* argv[]) {
    g_cfg = load_user_config();
    std::vector<std::string> args;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (args.empty() && (a == "--debug" || a == "-d")) { g_cfg.debug = true; continue; }
        args.push_back(a);
    }
    if (args.empty()) return usage();
    const std::string cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        if (cmd == "to-windows") return cmd_convert(rest, true);
        if (cmd == "to-posix") return cmd_convert(rest, false);
        if (cmd == "translate") return cmd_translate(rest);
        if (cmd == "dialects") return cmd_dialects(rest);
        if (cmd == "dialect") return cmd_dialect(rest);
        if (cmd == "quote") return cmd_quote(rest);
        if (cmd == "wrap") return cmd_wrap(rest);
        if (cmd == "hash") return cmd_hash(rest);
        if (cmd == "bytes") return cmd_bytes(rest);
    } catch (const std::exception& e) {
        std::cerr << "shellwrap: " << e.what() << std::endl;
        return 2;
    }
    std::cerr << "shellwrap: unknown command: " << cmd << '\n';
    return usage();
}
