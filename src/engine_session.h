#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

// Socket to the debug engine injected into the host application.
//
//   DISCONNECTED --connect/adopt--> CONNECTED --start--> RELAYING --> CLOSED
//
// While RELAYING, a receive loop decodes frames and hands each body to the
// message callback, and a send loop drains the outbound queue in FIFO order.
// The socket is read only by the receive loop and written only by the send
// loop. Either loop failing ends that loop alone.

typedef enum {
    ENGINE_DISCONNECTED,
    ENGINE_CONNECTED,
    ENGINE_RELAYING,
    ENGINE_CLOSED
} engine_state_t;

typedef std::function<void(const std::string&)> engine_message_fn;

const char* engine_state_str(engine_state_t s);

class engine_session {
public:
    engine_session();
    ~engine_session();

    // timeout_ms bounds one attempt; < 0 blocks until the OS gives up.
    bool connect(const std::string& host, int port, int timeout_ms);
    bool adopt(int connected_fd);                  // takes ownership
    bool start(engine_message_fn on_message);
    void stop();

    // Safe from any thread, in any state. Messages queued before start()
    // are sent once the send loop runs.
    void enqueue(const std::string& message);

    engine_state_t state() const { return cur_state.load(); }

    // Pending-answer set: request seqs the relay answered itself.
    void mark_answered(int64_t seq);
    bool is_answered(int64_t seq) const;

#ifdef RELAY_TESTING
    std::deque<std::string> queued_messages();
    size_t answered_count() const;
#endif

private:
    void recv_loop();
    void send_loop();

    std::atomic<engine_state_t> cur_state;
    std::atomic<bool> stopping;
    int fd;
    engine_message_fn on_message;

    std::thread recv_thread;
    std::thread send_thread;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> queue;

    mutable std::mutex answered_mutex;
    std::set<int64_t> answered;

    std::mutex lifecycle_mutex;
};
