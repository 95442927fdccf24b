/*
 * Configuration implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/config/config.hpp>
#include <fstream>
#include <string>

namespace shellwrap {

bool parse_bool(const std::string& val) { return val=="1"||val=="true"||val=="on"; }

Config load_config(const std::string& path) {
    Config cfg;
    std::ifstream in(path); if(!in) return cfg;
    std::string line;
    while(std::getline(in,line)){
        if(!line.empty() && line.back()=='\r') line.pop_back();
        if(line.empty()||line[0]=='#') continue;
        auto eq=line.find('='); if(eq==std::string::npos) continue;
        auto key=line.substr(0,eq); auto val=line.substr(eq+1);
        if(key=="default_shell") cfg.default_shell=val;
        else if(key=="root_prefix") cfg.root_prefix=val;
        else if(key=="cygdrive_prefix") cfg.cygdrive_prefix=val;
        else if(key=="debug") cfg.debug=parse_bool(val);
        else if(key=="debug_wrapper_scripts") cfg.debug_wrapper_scripts=parse_bool(val);
        else if(key=="dev_mode") cfg.dev_mode=parse_bool(val);
        else if(key=="hash_algorithm") { if(!val.empty()) cfg.hash_algorithm=val; }
    }
    return cfg;
}

Config load_user_config(const EnvLookup& env) {
    Config cfg;
    std::string home = getenv_or(env, "HOME");
#ifdef _WIN32
    if (home.empty()) home = getenv_or(env, "USERPROFILE");
#endif
    if (!home.empty()) cfg = load_config(home + "/.shellwraprc");
    if (auto v = env("SHELLWRAP_ROOT_PREFIX")) cfg.root_prefix = *v;
    if (auto v = env("SHELLWRAP_SHELL")) cfg.default_shell = *v;
    if (auto v = env("SHELLWRAP_DEBUG")) cfg.debug = parse_bool(*v);
    return cfg;
}

} // namespace shellwrap
