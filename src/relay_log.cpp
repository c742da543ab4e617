#include "relay_log.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <mutex>
#include <vector>

#ifdef RELAY_TESTING
#include <deque>
#endif

static std::mutex log_mutex;
static FILE* log_file = nullptr;
static bool verbose = false;

#ifdef RELAY_TESTING
static std::deque<std::string> log_buffer;
#endif

void relay_log_init(const char* file_path) {
    std::lock_guard<std::mutex> lk(log_mutex);
    if (log_file) {
        fclose(log_file);
        log_file = nullptr;
    }
    if (!file_path || !*file_path) return;

    log_file = fopen(file_path, "a");
    if (!log_file) {
        fprintf(stderr, "dap_relay: cannot open log file %s: %s\n", file_path, strerror(errno));
    }
}

void relay_log_shutdown(void) {
    std::lock_guard<std::mutex> lk(log_mutex);
    if (log_file) {
        fclose(log_file);
        log_file = nullptr;
    }
}

void relay_log_set_verbose(bool on) {
    std::lock_guard<std::mutex> lk(log_mutex);
    verbose = on;
}

bool relay_log_verbose(void) {
    std::lock_guard<std::mutex> lk(log_mutex);
    return verbose;
}

static void log_write(const char* fmt, va_list ap) {
    va_list ap2;
    va_copy(ap2, ap);
    int n = vsnprintf(nullptr, 0, fmt, ap2);
    va_end(ap2);
    if (n < 0) return;

    std::vector<char> line((size_t)n + 1);
    vsnprintf(line.data(), line.size(), fmt, ap);

    std::lock_guard<std::mutex> lk(log_mutex);
    fprintf(stderr, "dap_relay: %s\n", line.data());
    if (log_file) {
        fprintf(log_file, "dap_relay: %s\n", line.data());
        fflush(log_file);
    }
#ifdef RELAY_TESTING
    log_buffer.push_back(std::string(line.data(), (size_t)n));
#endif
}

void relay_log(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    log_write(fmt, ap);
    va_end(ap);
}

void relay_log_debug(const char* fmt, ...) {
    if (!relay_log_verbose()) return;
    va_list ap;
    va_start(ap, fmt);
    log_write(fmt, ap);
    va_end(ap);
}

// ---- Testing API ----

#ifdef RELAY_TESTING

std::deque<std::string> relay_log_buffer(void) {
    std::lock_guard<std::mutex> lk(log_mutex);
    return log_buffer;
}

void relay_log_clear(void) {
    std::lock_guard<std::mutex> lk(log_mutex);
    log_buffer.clear();
}

bool relay_log_contains(const std::string& needle) {
    std::lock_guard<std::mutex> lk(log_mutex);
    for (const auto& line : log_buffer) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

#endif // RELAY_TESTING
