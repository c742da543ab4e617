#include "engine_session.h"
#include "frame_codec.h"
#include "relay_log.h"
#include "socket_io.h"

#include <cerrno>
#include <cstring>

// Sentinel (octal \001 prefix distinguishes it from any JSON message)
static const std::string SENT_STOP = "\001STOP";

static bool is_sentinel(const std::string& s) {
    return !s.empty() && s[0] == '\001';
}

const char* engine_state_str(engine_state_t s) {
    switch (s) {
        case ENGINE_DISCONNECTED: return "disconnected";
        case ENGINE_CONNECTED:    return "connected";
        case ENGINE_RELAYING:     return "relaying";
        case ENGINE_CLOSED:       return "closed";
    }
    return "?";
}

engine_session::engine_session()
    : cur_state(ENGINE_DISCONNECTED), stopping(false), fd(-1) {
}

engine_session::~engine_session() {
    stop();
}

bool engine_session::connect(const std::string& host, int port, int timeout_ms) {
    std::string err;
    relay_log("engine: connecting to %s:%d", host.c_str(), port);
    int sock = sock_connect(host, port, timeout_ms, err);
    if (sock < 0) {
        relay_log("engine: %s", err.c_str());
        return false;
    }
    if (!adopt(sock)) {
        sock_close(sock);
        return false;
    }
    relay_log("engine: connected to %s:%d", host.c_str(), port);
    return true;
}

bool engine_session::adopt(int connected_fd) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex);
    if (cur_state.load() != ENGINE_DISCONNECTED || stopping.load()) {
        relay_log("engine: cannot adopt a socket while %s", engine_state_str(cur_state.load()));
        return false;
    }
    fd = connected_fd;
    cur_state.store(ENGINE_CONNECTED);
    return true;
}

bool engine_session::start(engine_message_fn callback) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex);
    if (cur_state.load() != ENGINE_CONNECTED || stopping.load()) {
        relay_log("engine: cannot start relaying while %s", engine_state_str(cur_state.load()));
        return false;
    }
    on_message = callback;
    cur_state.store(ENGINE_RELAYING);
    send_thread = std::thread(&engine_session::send_loop, this);
    recv_thread = std::thread(&engine_session::recv_loop, this);
    relay_log("engine: relaying");
    return true;
}

void engine_session::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex);
    stopping.store(true);
    {
        std::lock_guard<std::mutex> qlk(queue_mutex);
        queue.push_back(SENT_STOP);
    }
    queue_cv.notify_one();

    // Unblocks the receive loop; any write still in flight fails.
    sock_shutdown(fd);
    if (recv_thread.joinable()) recv_thread.join();
    if (send_thread.joinable()) send_thread.join();
    sock_close(fd);

    if (cur_state.load() != ENGINE_DISCONNECTED) cur_state.store(ENGINE_CLOSED);
}

void engine_session::enqueue(const std::string& message) {
    {
        std::lock_guard<std::mutex> lk(queue_mutex);
        queue.push_back(message);
    }
    queue_cv.notify_one();
}

void engine_session::mark_answered(int64_t seq) {
    std::lock_guard<std::mutex> lk(answered_mutex);
    answered.insert(seq);
}

bool engine_session::is_answered(int64_t seq) const {
    std::lock_guard<std::mutex> lk(answered_mutex);
    return answered.count(seq) != 0;
}

// ---- Loops ----

void engine_session::recv_loop() {
    frame_decoder decoder;
    std::string body;

    for (;;) {
        frame_read_result_t r = decoder.read_message(fd, body);
        if (r == FRAME_READ_EOF) {
            if (!stopping.load()) relay_log("engine: debug engine closed the connection");
            break;
        }
        if (r == FRAME_READ_ERROR) {
            if (!stopping.load()) relay_log("engine: failure reading debug engine output: %s", decoder.error().c_str());
            break;
        }
        relay_log_debug("engine -> relay: %s", body.c_str());
        if (on_message) on_message(body);
    }

    sock_shutdown(fd);
    cur_state.store(ENGINE_CLOSED);
}

void engine_session::send_loop() {
    for (;;) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lk(queue_mutex);
            queue_cv.wait(lk, [this] { return !queue.empty(); });
            msg.swap(queue.front());
            queue.pop_front();
        }
        if (is_sentinel(msg)) return;

        std::string framed = frame_encode(msg);
        if (!sock_write_all(fd, framed.data(), framed.size())) {
            if (!stopping.load()) relay_log("engine: debug socket closed, outbound traffic stops here (%s)", strerror(errno));
            return;
        }
        relay_log_debug("relay -> engine: %s", msg.c_str());
    }
}

// ---- Testing API ----

#ifdef RELAY_TESTING

std::deque<std::string> engine_session::queued_messages() {
    std::lock_guard<std::mutex> lk(queue_mutex);
    std::deque<std::string> out;
    for (const auto& m : queue) {
        if (!is_sentinel(m)) out.push_back(m);
    }
    return out;
}

size_t engine_session::answered_count() const {
    std::lock_guard<std::mutex> lk(answered_mutex);
    return answered.size();
}

#endif // RELAY_TESTING
