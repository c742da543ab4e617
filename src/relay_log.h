#pragma once

#include <string>

// stdout carries the debugger protocol. Log lines go to stderr and, when
// opened, to an append-mode log file.

void relay_log_init(const char* file_path);   // nullptr = stderr only
void relay_log_shutdown(void);
void relay_log_set_verbose(bool on);
bool relay_log_verbose(void);

void relay_log(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void relay_log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// ---- Testing API ----
#ifdef RELAY_TESTING

#include <deque>

std::deque<std::string> relay_log_buffer(void);
void relay_log_clear(void);
bool relay_log_contains(const std::string& needle);

#endif // RELAY_TESTING
