#include "utils.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

static const char* const path_seps = "/\\";

static bool is_sep(char c) {
    return c == '/' || c == '\\';
}

std::string path_dirname(const std::string& path) {
    size_t pos = path.find_last_of(path_seps);
    if (pos == std::string::npos) return "";

    std::string head = path.substr(0, pos + 1);
    size_t end = head.find_last_not_of(path_seps);
    if (end == std::string::npos) return head;   // "/" or "//"
    if (head[end] == ':') return head;           // "C:\"
    return head.substr(0, end + 1);
}

std::string path_basename(const std::string& path) {
    size_t pos = path.find_last_of(path_seps);
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

// "/a/b/tool.py" -> "tool", "/a/pkg/" -> "pkg"
std::string path_module_name(const std::string& path) {
    std::string base = path_basename(path);
    if (base.empty()) {
        size_t end = path.find_last_not_of(path_seps);
        if (end == std::string::npos) return "";
        base = path_basename(path.substr(0, end + 1));
    }
    size_t dot = base.rfind('.');
    if (dot != std::string::npos && dot > 0) base.erase(dot);
    return base;
}

std::string path_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (is_sep(dir[dir.size() - 1])) return dir + name;
    return dir + "/" + name;
}

std::string temp_dir(void) {
    const char* env = getenv("TMPDIR");
    if (env && *env) {
        std::string dir = env;
        while (dir.size() > 1 && is_sep(dir[dir.size() - 1])) dir.erase(dir.size() - 1);
        return dir;
    }
    return "/tmp";
}

std::string escape_py_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string escape_mel_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

bool parse_port(const std::string& text, int& port) {
    std::string t = trim(text);
    if (t.empty()) return false;
    for (size_t i = 0; i < t.size(); i++) {
        if (!isdigit((unsigned char)t[i])) return false;
    }
    if (t.size() > 5) return false;
    long v = strtol(t.c_str(), nullptr, 10);
    if (v < 1 || v > 65535) return false;
    port = (int)v;
    return true;
}

bool starts_with_nocase(const std::string& s, const char* prefix) {
    size_t n = strlen(prefix);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; i++) {
        if (tolower((unsigned char)s[i]) != tolower((unsigned char)prefix[i])) return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace((unsigned char)s[b])) b++;
    while (e > b && isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}
