#pragma once

#include <string>

// Paths arrive from the editor in either separator style.
std::string path_dirname(const std::string& path);
std::string path_basename(const std::string& path);
std::string path_module_name(const std::string& path);
std::string path_join(const std::string& dir, const std::string& name);

std::string temp_dir(void);

// Body of a single-quoted Python string literal.
std::string escape_py_string(const std::string& s);
// Body of a double-quoted MEL string literal.
std::string escape_mel_string(const std::string& s);

bool parse_port(const std::string& text, int& port);
bool starts_with_nocase(const std::string& s, const char* prefix);
std::string trim(const std::string& s);
