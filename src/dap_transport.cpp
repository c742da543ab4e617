#include "dap_transport.h"
#include "relay_log.h"
#include "socket_io.h"

#include <cerrno>
#include <cstring>

dap_transport::dap_transport(int input_fd, int output_fd)
    : in_fd(input_fd), out_fd(output_fd) {
}

frame_read_result_t dap_transport::run(dap_message_fn on_message) {
    std::string body;
    for (;;) {
        frame_read_result_t r = decoder.read_message(in_fd, body);
        if (r != FRAME_READ_MESSAGE) return r;
        if (on_message) on_message(body);
    }
}

bool dap_transport::send(const std::string& text) {
    std::string framed = frame_encode(text);
    std::lock_guard<std::mutex> lk(write_lock);
    if (!sock_write_all(out_fd, framed.data(), framed.size())) {
        relay_log("debugger: write failed: %s", strerror(errno));
        return false;
    }
    return true;
}
