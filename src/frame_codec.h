#pragma once

#include <cstddef>
#include <deque>
#include <string>

// Content-Length framing used on both the debugger and the debug engine
// channels:
//   "Content-Length: <n>\r\n" [other headers] "\r\n" <n body bytes>
// <n> counts encoded bytes, not characters.

extern const char FRAME_CONTENT_HEADER[];   // "Content-Length: "

static const size_t FRAME_MAX_HEADER_LINE = 8192;

typedef enum {
    FRAME_READ_MESSAGE,
    FRAME_READ_EOF,
    FRAME_READ_ERROR
} frame_read_result_t;

std::string frame_encode(const std::string& body);

class frame_decoder {
public:
    frame_decoder();

    // Consumes a chunk of any size. Returns false once the stream is
    // malformed; error() says why and the decoder stays failed until reset().
    bool feed(const char* data, size_t len);

    // Pops the oldest complete body.
    bool next(std::string& body);

    // Blocks on fd until a body is available, the peer closes, or a read or
    // decode error occurs.
    frame_read_result_t read_message(int fd, std::string& body);

    void reset();
    bool failed() const { return state == FRAME_FAILED; }
    const std::string& error() const { return err; }

private:
    enum state_t {
        FRAME_HEADER,
        FRAME_BODY,
        FRAME_FAILED
    };

    void header_line_done();
    void fail(const std::string& why);

    state_t state;
    std::string line;
    long long content_length;
    std::string body_buf;
    std::deque<std::string> ready;
    std::string err;
};
