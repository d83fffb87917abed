#pragma once

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

#include "defaults.h"

static inline std::string_view sv_basename(std::string_view p) {
    size_t pos = p.find_last_of('/');
    return (pos == std::string_view::npos) ? p : p.substr(pos + 1);
}

// Extension of the last path component without the dot, "" if there is none.
static inline std::string_view sv_extension(std::string_view p) {
    std::string_view name = sv_basename(p);
    size_t pos = name.find_last_of('.');
    if (pos == std::string_view::npos || pos == 0) return {};
    return name.substr(pos + 1);
}

static inline std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
    return s;
}

static inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

static inline bool parse_bool(std::string_view v, bool& out) {
    v = trim(v);
    if (ieq(v,"1")||ieq(v,"true")||ieq(v,"yes")||ieq(v,"on"))   { out=true;  return true; }
    if (ieq(v,"0")||ieq(v,"false")||ieq(v,"no") ||ieq(v,"off")) { out=false; return true; }
    return false;
}

// "~/x" -> "$HOME/x". Left untouched when HOME is not set.
static inline std::string expand_home(std::string_view p) {
    if (p.empty() || p.front() != '~') return std::string(p);
    const char* home = std::getenv("HOME");
    if (!home) return std::string(p);

    std::string out(home);
    out.append(p.data() + 1, p.size() - 1);
    return out;
}
