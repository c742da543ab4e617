#pragma once

#include <mutex>
#include <string>

// Connection to the host application's command port. Fire-and-forget:
// nothing is read back from the host.

typedef enum {
    HOST_CMD_OK,
    HOST_CMD_UNREACHABLE
} host_cmd_result_t;

static const int HOST_CMD_CONNECT_TIMEOUT_MS = 3000;

class host_cmd_channel {
public:
    host_cmd_channel();
    ~host_cmd_channel();

    host_cmd_result_t connect(const std::string& host, int port, int timeout_ms);

    // Writes code to <tmpdir>/dap_relay_<tag>.py and sends the host's exec
    // wrapper for that file. Calls from different threads are serialized.
    bool submit(const std::string& code, const char* tag);

    bool is_connected() const;
    void close();
    std::string last_error() const;

private:
    mutable std::mutex lock;
    int fd;
    std::string err;
};
