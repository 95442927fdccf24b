/*
 * Environment lookup implementation - ShellWrap
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellwrap/util/env.hpp>
#include <cstdlib>
#include <utility>

namespace shellwrap {

bool host_is_windows() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

bool host_is_bsd() {
#if defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__) || defined(__DragonFly__)
    return true;
#else
    return false;
#endif
}

EnvLookup process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

EnvLookup fixed_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& key) -> std::optional<std::string> {
        auto it = vars.find(key);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

std::string getenv_or(const EnvLookup& env, const std::string& key, const std::string& def) {
    auto v = env(key);
    return v ? *v : def;
}

std::vector<std::string> split_list(const std::string& list, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t sep; (sep = list.find(separator, start)) != std::string::npos; start = sep + 1)
        parts.push_back(list.substr(start, sep - start));
    parts.push_back(list.substr(start));
    return parts;
}

} // namespace shellwrap
