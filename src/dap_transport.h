#pragma once

#include "frame_codec.h"

#include <functional>
#include <mutex>
#include <string>

// Debugger-facing channel: Content-Length frames over a pair of fds
// (stdin/stdout when run by the editor).

typedef std::function<void(const std::string&)> dap_message_fn;

class dap_transport {
public:
    dap_transport(int input_fd, int output_fd);

    // Reads until end of stream or error, calling on_message per body.
    frame_read_result_t run(dap_message_fn on_message);

    // Safe from any thread.
    bool send(const std::string& text);

    const std::string& error() const { return decoder.error(); }

private:
    int in_fd;
    int out_fd;
    frame_decoder decoder;
    std::mutex write_lock;
};
